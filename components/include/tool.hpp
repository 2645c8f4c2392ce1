#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "codec.hpp"
#include "parameter_schema.hpp"

namespace chatwire {

/* Tool declarations */

enum class tool_kind_t { function };

std::ostream &operator<<(std::ostream &os, const tool_kind_t &v);

/**
 * `parameters` is kept as an opaque JSON value. Assign a
 * `function_parameters_t` to it when a typed schema is wanted.
 */
struct function_t {
  std::string name;
  std::optional<std::string> description = std::nullopt;
  nlohmann::json parameters = nlohmann::json::object();

  bool operator==(const function_t &other) const = default;
};

struct tool_t {
  tool_kind_t kind = tool_kind_t::function;
  function_t function;

  bool operator==(const tool_t &other) const = default;
};

void to_json(nlohmann::json &j, const function_t &v);
void decode(const json_reader_t &r, function_t &v);

void to_json(nlohmann::json &j, const tool_t &v);
void decode(const json_reader_t &r, tool_t &v);

/* Tool calls emitted by the assistant */

struct tool_call_function_t {
  std::optional<std::string> name = std::nullopt;
  /** Raw JSON text, exactly as produced by the model. */
  std::optional<std::string> arguments = std::nullopt;

  bool operator==(const tool_call_function_t &other) const = default;
};

struct tool_call_t {
  std::string id;
  std::string type = "function";
  tool_call_function_t function;

  bool operator==(const tool_call_t &other) const = default;
};

void to_json(nlohmann::json &j, const tool_call_function_t &v);
void decode(const json_reader_t &r, tool_call_function_t &v);

void to_json(nlohmann::json &j, const tool_call_t &v);
void decode(const json_reader_t &r, tool_call_t &v);

/* Tool choice */

/**
 * Controls whether and how the backend is forced to call a tool.
 *
 * Wire form:
 * ```json
 * "none" | "auto" | "any" | {"type": "function", "function": {...}}
 * ```
 * The selected form carries the tool's own `type` and `function` at the top
 * level; there is no `tool` key on the wire.
 */
struct tool_choice_t {
  struct none_t {
    bool operator==(const none_t &other) const = default;
  };
  struct auto_t {
    bool operator==(const auto_t &other) const = default;
  };
  struct any_t {
    bool operator==(const any_t &other) const = default;
  };
  struct selected_t {
    tool_t tool;

    bool operator==(const selected_t &other) const = default;
  };

  static tool_choice_t make_none() { return tool_choice_t{none_t{}}; }
  static tool_choice_t make_auto() { return tool_choice_t{auto_t{}}; }
  static tool_choice_t make_any() { return tool_choice_t{any_t{}}; }
  static tool_choice_t make_selected(tool_t tool) {
    return tool_choice_t{selected_t{std::move(tool)}};
  }

  bool is_selected() const {
    return std::holds_alternative<selected_t>(value);
  }

  /** Throws `std::bad_variant_access` unless `is_selected()`. */
  const tool_t &selected_tool() const {
    return std::get<selected_t>(value).tool;
  }

  bool operator==(const tool_choice_t &other) const = default;

  std::variant<none_t, auto_t, any_t, selected_t> value;
};

void to_json(nlohmann::json &j, const tool_choice_t &v);
void decode(const json_reader_t &r, tool_choice_t &v);

std::ostream &operator<<(std::ostream &os, const tool_choice_t &v);

} // namespace chatwire
