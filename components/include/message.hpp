/**
 * Messages follow the OpenAI chat-completion convention. The `content` of a
 * request message is either a plain string or an array of typed blocks, so
 * both of these are valid:
 *
 * ```json
 * messages = [
 *   {"role": "system", "content": "You are a helpful assistant."},
 *   {
 *     "role": "user",
 *     "content": [
 *       {"type": "image_url", "image_url": {"url": "https://.../cat.jpg"}},
 *       {"type": "text", "text": "What are these?"}
 *     ]
 *   },
 *   {
 *     "role": "assistant",
 *     "content": null,
 *     "tool_calls": [
 *       {
 *         "id": "call_0",
 *         "type": "function",
 *         "function": {"name": "get_weather", "arguments": "{\"city\":\"Seoul\"}"}
 *       }
 *     ]
 *   },
 *   {"role": "tool", "content": "{\"temperature\": 21}", "tool_call_id": "call_0"}
 * ]
 * ```
 *
 * A request message always carries the `content` key; an unset content is
 * written as `null`, which is what assistant messages holding only tool calls
 * look like on the wire. Response messages carry plain-string content only.
 **/
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec.hpp"
#include "content.hpp"
#include "tool.hpp"

namespace chatwire {

enum class role_t { user, system, assistant, function, tool };

std::ostream &operator<<(std::ostream &os, const role_t &v);

struct message_t {
  message_t() {}

  message_t(role_t role) : role(role) {}

  message_t(role_t role, const std::string &content_text)
      : role(role), content(content_t::plain_text(content_text)) {}

  message_t(role_t role, content_t content)
      : role(role), content(std::move(content)) {}

  bool operator==(const message_t &other) const = default;

  role_t role = role_t::user;
  std::optional<content_t> content = std::nullopt;
  std::optional<std::vector<tool_call_t>> tool_calls = std::nullopt;
  std::optional<std::string> tool_call_id = std::nullopt;
};

using messages_t = std::vector<message_t>;

void to_json(nlohmann::json &j, const message_t &v);
void decode(const json_reader_t &r, message_t &v);

std::ostream &operator<<(std::ostream &os, const message_t &v);

std::ostream &operator<<(std::ostream &os, const messages_t &v);

struct message_for_response_t {
  bool operator==(const message_for_response_t &other) const = default;

  role_t role = role_t::assistant;
  std::optional<std::string> content = std::nullopt;
  std::optional<std::string> name = std::nullopt;
  std::optional<tool_call_function_t> function_call = std::nullopt;
  std::optional<std::vector<tool_call_t>> tool_calls = std::nullopt;
};

void to_json(nlohmann::json &j, const message_for_response_t &v);
void decode(const json_reader_t &r, message_for_response_t &v);

} // namespace chatwire
