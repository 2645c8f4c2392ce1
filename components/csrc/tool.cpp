#include "tool.hpp"

#include <magic_enum/magic_enum.hpp>

namespace chatwire {

std::ostream &operator<<(std::ostream &os, const tool_kind_t &v) {
  os << magic_enum::enum_name(v);
  return os;
}

/* Tool declarations */

void to_json(nlohmann::json &j, const function_t &v) {
  j = nlohmann::json{{"name", v.name}, {"parameters", v.parameters}};
  if (v.description.has_value())
    j["description"] = v.description.value();
}

void decode(const json_reader_t &r, function_t &v) {
  r.expect_object();
  v.name = r.field<std::string>("name");
  v.description = r.optional_field<std::string>("description");
  v.parameters = r.field<nlohmann::json>("parameters");
}

void to_json(nlohmann::json &j, const tool_t &v) {
  j = nlohmann::json{{"type", magic_enum::enum_name(v.kind)},
                     {"function", v.function}};
}

void decode(const json_reader_t &r, tool_t &v) {
  r.expect_object();
  v.kind = r.field<tool_kind_t>("type");
  v.function = r.field<function_t>("function");
}

/* Tool calls */

void to_json(nlohmann::json &j, const tool_call_function_t &v) {
  j = nlohmann::json::object();
  if (v.name.has_value())
    j["name"] = v.name.value();
  if (v.arguments.has_value())
    j["arguments"] = v.arguments.value();
}

void decode(const json_reader_t &r, tool_call_function_t &v) {
  r.expect_object();
  v.name = r.optional_field<std::string>("name");
  v.arguments = r.optional_field<std::string>("arguments");
}

void to_json(nlohmann::json &j, const tool_call_t &v) {
  j = nlohmann::json{{"id", v.id}, {"type", v.type}, {"function", v.function}};
}

void decode(const json_reader_t &r, tool_call_t &v) {
  r.expect_object();
  v.id = r.field<std::string>("id");
  v.type = r.field<std::string>("type");
  v.function = r.field<tool_call_function_t>("function");
}

/* Tool choice */

void to_json(nlohmann::json &j, const tool_choice_t &v) {
  if (v.value.valueless_by_exception())
    raise_codec_error(codec_error_kind_t::type_mismatch, "$",
                      "none|auto|any|selected tool", "valueless variant");
  std::visit(
      [&j](const auto &choice) {
        using choice_t = std::decay_t<decltype(choice)>;
        if constexpr (std::is_same_v<choice_t, tool_choice_t::none_t>) {
          j = "none";
        } else if constexpr (std::is_same_v<choice_t, tool_choice_t::auto_t>) {
          j = "auto";
        } else if constexpr (std::is_same_v<choice_t, tool_choice_t::any_t>) {
          j = "any";
        } else {
          j = nlohmann::json{
              {"type", magic_enum::enum_name(choice.tool.kind)},
              {"function", choice.tool.function}};
        }
      },
      v.value);
}

void decode(const json_reader_t &r, tool_choice_t &v) {
  const auto &j = r.value();
  if (j.is_string()) {
    auto tag = j.get<std::string>();
    if (tag == "none")
      v = tool_choice_t::make_none();
    else if (tag == "auto")
      v = tool_choice_t::make_auto();
    else if (tag == "any")
      v = tool_choice_t::make_any();
    else
      r.fail(codec_error_kind_t::unknown_variant, "one of none|auto|any",
             detail::quote(tag));
  } else if (j.is_object()) {
    tool_t tool;
    tool.kind = r.field<tool_kind_t>("type");
    tool.function = r.field<function_t>("function");
    v = tool_choice_t::make_selected(std::move(tool));
  } else {
    r.fail(codec_error_kind_t::unexpected_shape,
           "string or object with type and function");
  }
}

std::ostream &operator<<(std::ostream &os, const tool_choice_t &v) {
  nlohmann::json j = v;
  os << dump_json(j);
  return os;
}

} // namespace chatwire
