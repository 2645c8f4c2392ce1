#include "message.hpp"

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

namespace chatwire {

std::ostream &operator<<(std::ostream &os, const role_t &v) {
  os << magic_enum::enum_name(v);
  return os;
}

void to_json(nlohmann::json &j, const message_t &v) {
  j = nlohmann::json::object();
  j["role"] = magic_enum::enum_name(v.role);
  if (v.content.has_value())
    j["content"] = v.content.value();
  else
    j["content"] = nullptr;
  if (v.tool_calls.has_value())
    j["tool_calls"] = v.tool_calls.value();
  if (v.tool_call_id.has_value())
    j["tool_call_id"] = v.tool_call_id.value();
}

void decode(const json_reader_t &r, message_t &v) {
  r.expect_object();
  v.role = r.field<role_t>("role");
  v.content = r.optional_field<content_t>("content");
  v.tool_calls = r.optional_field<std::vector<tool_call_t>>("tool_calls");
  v.tool_call_id = r.optional_field<std::string>("tool_call_id");
}

std::ostream &operator<<(std::ostream &os, const message_t &v) {
  nlohmann::json j = v;
  os << dump_json(j);
  return os;
}

std::ostream &operator<<(std::ostream &os, const messages_t &v) {
  nlohmann::json j = v;
  os << dump_json(j);
  return os;
}

void to_json(nlohmann::json &j, const message_for_response_t &v) {
  j = nlohmann::json::object();
  j["role"] = magic_enum::enum_name(v.role);
  if (v.content.has_value())
    j["content"] = v.content.value();
  if (v.name.has_value())
    j["name"] = v.name.value();
  if (v.function_call.has_value())
    j["function_call"] = v.function_call.value();
  if (v.tool_calls.has_value())
    j["tool_calls"] = v.tool_calls.value();
}

void decode(const json_reader_t &r, message_for_response_t &v) {
  r.expect_object();
  v.role = r.field<role_t>("role");
  v.content = r.optional_field<std::string>("content");
  v.name = r.optional_field<std::string>("name");
  v.function_call =
      r.optional_field<tool_call_function_t>("function_call");
  v.tool_calls = r.optional_field<std::vector<tool_call_t>>("tool_calls");
}

} // namespace chatwire
