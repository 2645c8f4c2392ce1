#include "chat_completion.hpp"

#include <format>

#include <magic_enum/magic_enum.hpp>

#include "exception.hpp"
#include "logging.hpp"

namespace chatwire {

/* Backend extension metadata */

void to_json(nlohmann::json &j, const lora_request_t &v) {
  j = nlohmann::json{{"lora_id", v.lora_id},
                     {"lora_int_id", v.lora_int_id},
                     {"lora_local_path", v.lora_local_path}};
}

void decode(const json_reader_t &r, lora_request_t &v) {
  r.expect_object();
  v.lora_id = r.field<std::string>("lora_id");
  v.lora_int_id = r.field<int32_t>("lora_int_id");
  v.lora_local_path = r.field<std::string>("lora_local_path");
}

void to_json(nlohmann::json &j, const extension_metadata_t &v) {
  j = nlohmann::json{{"id", v.id},
                     {"ignore_eos", v.ignore_eos},
                     {"skip_chat_template", v.skip_chat_template}};
  if (v.lora_request.has_value())
    j["lora_request"] = v.lora_request.value();
  if (v.use_beam_search.has_value())
    j["use_beam_search"] = v.use_beam_search.value();
  if (v.best_of.has_value())
    j["best_of"] = v.best_of.value();
  if (v.tools_only.has_value())
    j["tools_only"] = v.tools_only.value();
  if (v.tools_enabled.has_value())
    j["tools_enabled"] = v.tools_enabled.value();
  if (v.conversation_json_schema.has_value())
    j["conversation_json_schema"] = v.conversation_json_schema.value();
  if (v.tools_json_schema.has_value())
    j["tools_json_schema"] = v.tools_json_schema.value();
  if (v.num_cached_prefix_messages.has_value())
    j["num_cached_prefix_messages"] = v.num_cached_prefix_messages.value();
  if (v.logprobs.has_value())
    j["logprobs"] = v.logprobs.value();
}

void decode(const json_reader_t &r, extension_metadata_t &v) {
  r.expect_object();
  v.id = r.field<std::string>("id");
  v.lora_request = r.optional_field<lora_request_t>("lora_request");
  v.use_beam_search = r.optional_field<bool>("use_beam_search");
  v.best_of = r.optional_field<int32_t>("best_of");
  v.tools_only = r.optional_field<bool>("tools_only");
  v.tools_enabled = r.optional_field<bool>("tools_enabled");
  v.conversation_json_schema =
      r.optional_field<std::string>("conversation_json_schema");
  v.tools_json_schema = r.optional_field<std::string>("tools_json_schema");
  v.num_cached_prefix_messages =
      r.optional_field<std::size_t>("num_cached_prefix_messages");
  v.logprobs = r.optional_field<std::size_t>("logprobs");
  v.ignore_eos = r.field_or<bool>("ignore_eos", false);
  v.skip_chat_template = r.field_or<bool>("skip_chat_template", false);
}

/* Request */

chat_completion_request_t &
chat_completion_request_t::set_temperature(double value) {
  temperature = value;
  return *this;
}

chat_completion_request_t &chat_completion_request_t::set_top_p(double value) {
  top_p = value;
  return *this;
}

chat_completion_request_t &chat_completion_request_t::set_n(int64_t value) {
  n = value;
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_response_format(nlohmann::json value) {
  response_format = std::move(value);
  return *this;
}

chat_completion_request_t &chat_completion_request_t::set_stream(bool value) {
  stream = value;
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_stop(std::vector<std::string> value) {
  stop = std::move(value);
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_max_tokens(int64_t value) {
  max_tokens = value;
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_presence_penalty(double value) {
  presence_penalty = value;
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_frequency_penalty(double value) {
  frequency_penalty = value;
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_logit_bias(std::map<std::string, int32_t> value) {
  logit_bias = std::move(value);
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_user(std::string value) {
  user = std::move(value);
  return *this;
}

chat_completion_request_t &chat_completion_request_t::set_seed(int64_t value) {
  seed = value;
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_tools(std::vector<tool_t> value) {
  tools = std::move(value);
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_tool_choice(tool_choice_t value) {
  tool_choice = std::move(value);
  return *this;
}

chat_completion_request_t &
chat_completion_request_t::set_metadata(extension_metadata_t value) {
  metadata = std::move(value);
  return *this;
}

void to_json(nlohmann::json &j, const chat_completion_request_t &v) {
  j = nlohmann::json::object();
  j["model"] = v.model;
  j["messages"] = nlohmann::json::array();
  for (const auto &message : v.messages)
    j["messages"].push_back(message);

  if (v.temperature.has_value())
    j["temperature"] =
        finite_number(v.temperature.value(), "$.temperature");
  if (v.top_p.has_value())
    j["top_p"] = finite_number(v.top_p.value(), "$.top_p");
  if (v.n.has_value())
    j["n"] = v.n.value();
  if (v.response_format.has_value())
    j["response_format"] = v.response_format.value();
  if (v.stream.has_value())
    j["stream"] = v.stream.value();
  if (v.stop.has_value())
    j["stop"] = v.stop.value();
  if (v.max_tokens.has_value())
    j["max_tokens"] = v.max_tokens.value();
  if (v.presence_penalty.has_value())
    j["presence_penalty"] =
        finite_number(v.presence_penalty.value(), "$.presence_penalty");
  if (v.frequency_penalty.has_value())
    j["frequency_penalty"] =
        finite_number(v.frequency_penalty.value(), "$.frequency_penalty");
  if (v.logit_bias.has_value())
    j["logit_bias"] = v.logit_bias.value();
  if (v.user.has_value())
    j["user"] = v.user.value();
  if (v.seed.has_value())
    j["seed"] = v.seed.value();
  if (v.tools.has_value())
    j["tools"] = v.tools.value();
  if (v.tool_choice.has_value())
    j["tool_choice"] = v.tool_choice.value();

  if (v.prettify_tools.has_value())
    j["prettify_tools"] = v.prettify_tools.value();
  if (v.structure_output_decoding_mode.has_value())
    j["structure_output_decoding_mode"] =
        v.structure_output_decoding_mode.value();
  if (v.use_raw_output.has_value())
    j["use_raw_output"] = v.use_raw_output.value();
  if (v.include_thinking.has_value())
    j["include_thinking"] = v.include_thinking.value();
  if (v.metadata.has_value())
    j["empower_metadata"] = v.metadata.value();
}

void decode(const json_reader_t &r, chat_completion_request_t &v) {
  r.expect_object();
  v.model = r.field<std::string>("model");
  v.messages = r.field<messages_t>("messages");

  v.temperature = r.optional_field<double>("temperature");
  v.top_p = r.optional_field<double>("top_p");
  v.n = r.optional_field<int64_t>("n");
  v.response_format = r.optional_field<nlohmann::json>("response_format");
  v.stream = r.optional_field<bool>("stream");
  v.stop = r.optional_field<std::vector<std::string>>("stop");
  v.max_tokens = r.optional_field<int64_t>("max_tokens");
  v.presence_penalty = r.optional_field<double>("presence_penalty");
  v.frequency_penalty = r.optional_field<double>("frequency_penalty");
  v.logit_bias =
      r.optional_field<std::map<std::string, int32_t>>("logit_bias");
  v.user = r.optional_field<std::string>("user");
  v.seed = r.optional_field<int64_t>("seed");
  v.tools = r.optional_field<std::vector<tool_t>>("tools");
  v.tool_choice = r.optional_field<tool_choice_t>("tool_choice");

  v.prettify_tools = r.optional_field<bool>("prettify_tools");
  v.structure_output_decoding_mode =
      r.optional_field<std::string>("structure_output_decoding_mode");
  v.use_raw_output = r.optional_field<bool>("use_raw_output");
  v.include_thinking = r.optional_field<bool>("include_thinking");
  v.metadata = r.optional_field<extension_metadata_t>("empower_metadata");
}

std::ostream &operator<<(std::ostream &os, const chat_completion_request_t &v) {
  os << dump(v);
  return os;
}

/* Response */

std::ostream &operator<<(std::ostream &os, const finish_reason_t &v) {
  os << magic_enum::enum_name(v);
  return os;
}

void to_json(nlohmann::json &j, const finish_details_t &v) {
  j = nlohmann::json{{"type", magic_enum::enum_name(v.type)},
                     {"stop", v.stop}};
}

void decode(const json_reader_t &r, finish_details_t &v) {
  r.expect_object();
  v.type = r.field<finish_reason_t>("type");
  v.stop = r.field<std::string>("stop");
}

void to_json(nlohmann::json &j, const usage_t &v) {
  j = nlohmann::json{{"prompt_tokens", v.prompt_tokens},
                     {"completion_tokens", v.completion_tokens},
                     {"total_tokens", v.total_tokens}};
}

void decode(const json_reader_t &r, usage_t &v) {
  r.expect_object();
  v.prompt_tokens = r.field<int64_t>("prompt_tokens");
  v.completion_tokens = r.field<int64_t>("completion_tokens");
  v.total_tokens = r.field<int64_t>("total_tokens");
}

void to_json(nlohmann::json &j, const choice_t &v) {
  j = nlohmann::json{{"index", v.index}, {"message", v.message}};
  if (v.finish_reason.has_value())
    j["finish_reason"] = magic_enum::enum_name(v.finish_reason.value());
  if (v.finish_details.has_value())
    j["finish_details"] = v.finish_details.value();
}

void decode(const json_reader_t &r, choice_t &v) {
  r.expect_object();
  v.index = r.field<int64_t>("index");
  v.message = r.field<message_for_response_t>("message");
  v.finish_reason = r.optional_field<finish_reason_t>("finish_reason");
  v.finish_details = r.optional_field<finish_details_t>("finish_details");
}

void to_json(nlohmann::json &j, const chat_completion_response_t &v) {
  j = nlohmann::json{{"id", v.id},
                     {"model", v.model},
                     {"choices", v.choices},
                     {"usage", v.usage}};
  if (v.system_fingerprint.has_value())
    j["system_fingerprint"] = v.system_fingerprint.value();
}

void decode(const json_reader_t &r, chat_completion_response_t &v) {
  r.expect_object();
  v.id = r.field<std::string>("id");
  v.model = r.field<std::string>("model");
  v.choices = r.field<std::vector<choice_t>>("choices");
  v.usage = r.field<usage_t>("usage");
  v.system_fingerprint = r.optional_field<std::string>("system_fingerprint");
}

std::ostream &operator<<(std::ostream &os,
                         const chat_completion_response_t &v) {
  nlohmann::json j = v;
  os << dump_json(j);
  return os;
}

/* Transport boundary */

namespace {

nlohmann::json parse_document(std::string_view kind, std::string_view body) {
  debug("[{}] Parsing {} bytes", kind, body.size());
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw runtime_error(std::format("[{}] Invalid JSON: {}", kind, e.what()));
  }
}

} // namespace

std::string dump(const chat_completion_request_t &request, int indent) {
  nlohmann::json j = request;
  return dump_json(j, indent);
}

chat_completion_request_t parse_chat_completion_request(std::string_view body) {
  auto j = parse_document("request", body);
  return json_reader_t(j).get<chat_completion_request_t>();
}

chat_completion_response_t
parse_chat_completion_response(std::string_view body) {
  auto j = parse_document("response", body);
  auto rv = json_reader_t(j).get<chat_completion_response_t>();
  debug("[response] {} with {} choice(s)", rv.id, rv.choices.size());
  return rv;
}

} // namespace chatwire
