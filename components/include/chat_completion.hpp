#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec.hpp"
#include "message.hpp"
#include "tool.hpp"

namespace chatwire {

/* Backend extension metadata */

/**
 * Selects a LoRA adapter on the backend. This is a plain record; turning it
 * into an adapter object is the backend's business.
 */
struct lora_request_t {
  std::string lora_id;
  int32_t lora_int_id = 0;
  std::string lora_local_path;

  bool operator==(const lora_request_t &other) const = default;
};

void to_json(nlohmann::json &j, const lora_request_t &v);
void decode(const json_reader_t &r, lora_request_t &v);

/**
 * Pass-through block for backend-specific switches. Only the JSON kinds of
 * the fields are checked while decoding.
 */
struct extension_metadata_t {
  std::string id;
  std::optional<lora_request_t> lora_request = std::nullopt;

  std::optional<bool> use_beam_search = std::nullopt;
  std::optional<int32_t> best_of = std::nullopt;

  std::optional<bool> tools_only = std::nullopt;
  std::optional<bool> tools_enabled = std::nullopt;

  std::optional<std::string> conversation_json_schema = std::nullopt;
  std::optional<std::string> tools_json_schema = std::nullopt;
  std::optional<std::size_t> num_cached_prefix_messages = std::nullopt;

  // Debug flags
  std::optional<std::size_t> logprobs = std::nullopt;
  bool ignore_eos = false;
  bool skip_chat_template = false;

  bool operator==(const extension_metadata_t &other) const = default;
};

void to_json(nlohmann::json &j, const extension_metadata_t &v);
void decode(const json_reader_t &r, extension_metadata_t &v);

/* Request */

/**
 * A chat-completion request.
 *
 * `model` and `messages` are always written, even when `messages` is empty.
 * Every other field is written only when set; there is no `null` on the
 * wire. Setters assign one field and return the request for chaining. They
 * do not validate, so e.g. a selected tool choice without `tools` is allowed.
 */
struct chat_completion_request_t {
  chat_completion_request_t() {}

  chat_completion_request_t(const std::string &model, messages_t messages)
      : model(model), messages(std::move(messages)) {}

  chat_completion_request_t &set_temperature(double value);
  chat_completion_request_t &set_top_p(double value);
  chat_completion_request_t &set_n(int64_t value);
  chat_completion_request_t &set_response_format(nlohmann::json value);
  chat_completion_request_t &set_stream(bool value);
  chat_completion_request_t &set_stop(std::vector<std::string> value);
  chat_completion_request_t &set_max_tokens(int64_t value);
  chat_completion_request_t &set_presence_penalty(double value);
  chat_completion_request_t &set_frequency_penalty(double value);
  chat_completion_request_t &
  set_logit_bias(std::map<std::string, int32_t> value);
  chat_completion_request_t &set_user(std::string value);
  chat_completion_request_t &set_seed(int64_t value);
  chat_completion_request_t &set_tools(std::vector<tool_t> value);
  chat_completion_request_t &set_tool_choice(tool_choice_t value);
  chat_completion_request_t &set_metadata(extension_metadata_t value);

  bool operator==(const chat_completion_request_t &other) const = default;

  std::string model;
  messages_t messages;
  std::optional<double> temperature = std::nullopt;
  std::optional<double> top_p = std::nullopt;
  std::optional<int64_t> n = std::nullopt;
  std::optional<nlohmann::json> response_format = std::nullopt;
  std::optional<bool> stream = std::nullopt;
  std::optional<std::vector<std::string>> stop = std::nullopt;
  std::optional<int64_t> max_tokens = std::nullopt;
  std::optional<double> presence_penalty = std::nullopt;
  std::optional<double> frequency_penalty = std::nullopt;
  std::optional<std::map<std::string, int32_t>> logit_bias = std::nullopt;
  std::optional<std::string> user = std::nullopt;
  std::optional<int64_t> seed = std::nullopt;
  std::optional<std::vector<tool_t>> tools = std::nullopt;
  std::optional<tool_choice_t> tool_choice = std::nullopt;

  std::optional<bool> prettify_tools = std::nullopt;
  std::optional<std::string> structure_output_decoding_mode = std::nullopt;
  std::optional<bool> use_raw_output = std::nullopt;
  std::optional<bool> include_thinking = std::nullopt;

  /** Serialized under the `empower_metadata` key. */
  std::optional<extension_metadata_t> metadata = std::nullopt;
};

void to_json(nlohmann::json &j, const chat_completion_request_t &v);
void decode(const json_reader_t &r, chat_completion_request_t &v);

std::ostream &operator<<(std::ostream &os, const chat_completion_request_t &v);

/* Response */

enum class finish_reason_t { stop, length, content_filter, tool_calls, null };

std::ostream &operator<<(std::ostream &os, const finish_reason_t &v);

struct finish_details_t {
  finish_reason_t type = finish_reason_t::stop;
  std::string stop;

  bool operator==(const finish_details_t &other) const = default;
};

void to_json(nlohmann::json &j, const finish_details_t &v);
void decode(const json_reader_t &r, finish_details_t &v);

struct usage_t {
  int64_t prompt_tokens = 0;
  int64_t completion_tokens = 0;
  int64_t total_tokens = 0;

  bool operator==(const usage_t &other) const = default;
};

void to_json(nlohmann::json &j, const usage_t &v);
void decode(const json_reader_t &r, usage_t &v);

/**
 * `finish_reason` distinguishes an absent/`null` value (std::nullopt) from
 * the literal tag `"null"` (finish_reason_t::null).
 */
struct choice_t {
  int64_t index = 0;
  message_for_response_t message;
  std::optional<finish_reason_t> finish_reason = std::nullopt;
  std::optional<finish_details_t> finish_details = std::nullopt;

  bool operator==(const choice_t &other) const = default;
};

void to_json(nlohmann::json &j, const choice_t &v);
void decode(const json_reader_t &r, choice_t &v);

struct chat_completion_response_t {
  std::string id;
  std::string model;
  std::vector<choice_t> choices;
  usage_t usage;
  std::optional<std::string> system_fingerprint = std::nullopt;

  bool operator==(const chat_completion_response_t &other) const = default;
};

void to_json(nlohmann::json &j, const chat_completion_response_t &v);
void decode(const json_reader_t &r, chat_completion_response_t &v);

std::ostream &operator<<(std::ostream &os,
                         const chat_completion_response_t &v);

/* Transport boundary */

/**
 * Renders the request as JSON text. A negative `indent` gives the compact
 * form.
 */
std::string dump(const chat_completion_request_t &request, int indent = -1);

/**
 * Throws `runtime_error` if `body` is not JSON, and `codec_error` if it is JSON
 * of the wrong shape.
 */
chat_completion_request_t parse_chat_completion_request(std::string_view body);

chat_completion_response_t
parse_chat_completion_response(std::string_view body);

} // namespace chatwire
