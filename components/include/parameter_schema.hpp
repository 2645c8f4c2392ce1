#pragma once

#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec.hpp"

namespace chatwire {

enum class schema_type_t { object, number, string, array, null, boolean };

std::ostream &operator<<(std::ostream &os, const schema_type_t &v);

/**
 * Nested schemas deeper than this are rejected while decoding.
 */
constexpr int max_schema_depth = 64;

/**
 * One node of a JSON-Schema-like description of tool parameters.
 *
 * Children are owned through `std::unique_ptr`, so a node can never refer to
 * one of its ancestors. Copying a node copies the whole subtree, and equality
 * compares subtrees rather than pointers.
 *
 * `items` is meaningful for `array` nodes and `properties`/`required` for
 * `object` nodes. That is not enforced here; whatever is set is preserved
 * through encode and decode.
 */
struct parameter_schema_t {
  using properties_t =
      std::map<std::string, std::unique_ptr<parameter_schema_t>>;

  parameter_schema_t() {}

  parameter_schema_t(schema_type_t schema_type) : schema_type(schema_type) {}

  parameter_schema_t(schema_type_t schema_type, const std::string &description)
      : schema_type(schema_type), description(description) {}

  parameter_schema_t(const parameter_schema_t &other);

  parameter_schema_t(parameter_schema_t &&other) = default;

  parameter_schema_t &operator=(const parameter_schema_t &other);

  parameter_schema_t &operator=(parameter_schema_t &&other) = default;

  /** Inserts or replaces a property, creating `properties` if unset. */
  parameter_schema_t &add_property(const std::string &name,
                                   parameter_schema_t schema);

  /** Appends to `required`, creating it if unset. */
  parameter_schema_t &add_required(const std::string &name);

  parameter_schema_t &set_items(parameter_schema_t schema);

  bool operator==(const parameter_schema_t &other) const;

  schema_type_t schema_type = schema_type_t::object;
  std::optional<std::string> description = std::nullopt;
  std::optional<std::vector<std::string>> enum_values = std::nullopt;
  std::optional<properties_t> properties = std::nullopt;
  std::optional<std::vector<std::string>> required = std::nullopt;
  std::unique_ptr<parameter_schema_t> items;
};

/**
 * The typed top-level `parameters` block of a function declaration.
 *
 * It encodes to the same JSON a caller could put into
 * `function_t::parameters` directly.
 */
struct function_parameters_t {
  function_parameters_t() {}

  function_parameters_t(const function_parameters_t &other);

  function_parameters_t(function_parameters_t &&other) = default;

  function_parameters_t &operator=(const function_parameters_t &other);

  function_parameters_t &operator=(function_parameters_t &&other) = default;

  function_parameters_t &add_property(const std::string &name,
                                      parameter_schema_t schema,
                                      bool is_required = false);

  bool operator==(const function_parameters_t &other) const;

  schema_type_t schema_type = schema_type_t::object;
  std::optional<parameter_schema_t::properties_t> properties = std::nullopt;
  std::optional<std::vector<std::string>> required = std::nullopt;
};

void to_json(nlohmann::json &j, const parameter_schema_t &v);
void decode(const json_reader_t &r, parameter_schema_t &v);

void to_json(nlohmann::json &j, const function_parameters_t &v);
void decode(const json_reader_t &r, function_parameters_t &v);

std::ostream &operator<<(std::ostream &os, const parameter_schema_t &v);

} // namespace chatwire
