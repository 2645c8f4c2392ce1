#include "parameter_schema.hpp"

#include <format>

#include <magic_enum/magic_enum.hpp>

namespace chatwire {

namespace {

std::optional<parameter_schema_t::properties_t>
clone_properties(const std::optional<parameter_schema_t::properties_t> &src) {
  if (!src.has_value())
    return std::nullopt;
  parameter_schema_t::properties_t rv;
  for (const auto &[name, child] : src.value())
    rv.emplace(name, child ? std::make_unique<parameter_schema_t>(*child)
                           : nullptr);
  return rv;
}

bool properties_equal(
    const std::optional<parameter_schema_t::properties_t> &lhs,
    const std::optional<parameter_schema_t::properties_t> &rhs) {
  if (lhs.has_value() != rhs.has_value())
    return false;
  if (!lhs.has_value())
    return true;
  if (lhs->size() != rhs->size())
    return false;
  for (auto l = lhs->begin(), r = rhs->begin(); l != lhs->end(); ++l, ++r) {
    if (l->first != r->first)
      return false;
    if (!l->second || !r->second) {
      if (l->second != r->second)
        return false;
      continue;
    }
    if (!(*l->second == *r->second))
      return false;
  }
  return true;
}

nlohmann::json encode_schema(const parameter_schema_t &v,
                             const std::string &path);

nlohmann::json
encode_properties(const parameter_schema_t::properties_t &properties,
                  const std::string &path) {
  // std::map iterates in ascending key order, which is the wire order.
  auto rv = nlohmann::json::object();
  for (const auto &[name, child] : properties) {
    if (!child)
      raise_codec_error(codec_error_kind_t::type_mismatch, path + "." + name,
                        "schema", "null");
    rv[name] = encode_schema(*child, path + "." + name);
  }
  return rv;
}

nlohmann::json encode_schema(const parameter_schema_t &v,
                             const std::string &path) {
  auto j = nlohmann::json::object();
  j["type"] = magic_enum::enum_name(v.schema_type);
  if (v.description.has_value())
    j["description"] = v.description.value();
  if (v.enum_values.has_value())
    j["enum_values"] = v.enum_values.value();
  if (v.properties.has_value())
    j["properties"] =
        encode_properties(v.properties.value(), path + ".properties");
  if (v.required.has_value())
    j["required"] = v.required.value();
  if (v.items)
    j["items"] = encode_schema(*v.items, path + ".items");
  return j;
}

parameter_schema_t decode_schema(const json_reader_t &r, int depth);

parameter_schema_t::properties_t decode_properties(const json_reader_t &r,
                                                   int depth) {
  r.expect_object();
  parameter_schema_t::properties_t rv;
  for (auto it = r.value().begin(); it != r.value().end(); ++it)
    rv.emplace(it.key(), std::make_unique<parameter_schema_t>(
                             decode_schema(r.at(it.key()), depth + 1)));
  return rv;
}

parameter_schema_t decode_schema(const json_reader_t &r, int depth) {
  if (depth > max_schema_depth)
    r.fail(codec_error_kind_t::depth_exceeded,
           std::format("at most {} nested schemas", max_schema_depth),
           std::format("{} levels", depth));
  r.expect_object();

  parameter_schema_t v;
  v.schema_type = r.field<schema_type_t>("type");
  v.description = r.optional_field<std::string>("description");
  v.enum_values = r.optional_field<std::vector<std::string>>("enum_values");
  if (r.has("properties"))
    v.properties = decode_properties(r.at("properties"), depth);
  v.required = r.optional_field<std::vector<std::string>>("required");
  if (r.has("items"))
    v.items = std::make_unique<parameter_schema_t>(
        decode_schema(r.at("items"), depth + 1));
  return v;
}

} // namespace

std::ostream &operator<<(std::ostream &os, const schema_type_t &v) {
  os << magic_enum::enum_name(v);
  return os;
}

parameter_schema_t::parameter_schema_t(const parameter_schema_t &other)
    : schema_type(other.schema_type), description(other.description),
      enum_values(other.enum_values),
      properties(clone_properties(other.properties)),
      required(other.required),
      items(other.items ? std::make_unique<parameter_schema_t>(*other.items)
                        : nullptr) {}

parameter_schema_t &
parameter_schema_t::operator=(const parameter_schema_t &other) {
  if (this != &other) {
    parameter_schema_t copy(other);
    *this = std::move(copy);
  }
  return *this;
}

parameter_schema_t &
parameter_schema_t::add_property(const std::string &name,
                                 parameter_schema_t schema) {
  if (!properties.has_value())
    properties = properties_t{};
  properties->insert_or_assign(
      name, std::make_unique<parameter_schema_t>(std::move(schema)));
  return *this;
}

parameter_schema_t &parameter_schema_t::add_required(const std::string &name) {
  if (!required.has_value())
    required = std::vector<std::string>{};
  required->push_back(name);
  return *this;
}

parameter_schema_t &parameter_schema_t::set_items(parameter_schema_t schema) {
  items = std::make_unique<parameter_schema_t>(std::move(schema));
  return *this;
}

bool parameter_schema_t::operator==(const parameter_schema_t &other) const {
  if (schema_type != other.schema_type || description != other.description ||
      enum_values != other.enum_values || required != other.required)
    return false;
  if (!properties_equal(properties, other.properties))
    return false;
  if (!items || !other.items)
    return items == other.items;
  return *items == *other.items;
}

function_parameters_t::function_parameters_t(const function_parameters_t &other)
    : schema_type(other.schema_type),
      properties(clone_properties(other.properties)),
      required(other.required) {}

function_parameters_t &
function_parameters_t::operator=(const function_parameters_t &other) {
  if (this != &other) {
    function_parameters_t copy(other);
    *this = std::move(copy);
  }
  return *this;
}

function_parameters_t &
function_parameters_t::add_property(const std::string &name,
                                    parameter_schema_t schema,
                                    bool is_required) {
  if (!properties.has_value())
    properties = parameter_schema_t::properties_t{};
  properties->insert_or_assign(
      name, std::make_unique<parameter_schema_t>(std::move(schema)));
  if (is_required) {
    if (!required.has_value())
      required = std::vector<std::string>{};
    required->push_back(name);
  }
  return *this;
}

bool function_parameters_t::operator==(
    const function_parameters_t &other) const {
  return schema_type == other.schema_type && required == other.required &&
         properties_equal(properties, other.properties);
}

void to_json(nlohmann::json &j, const parameter_schema_t &v) {
  j = encode_schema(v, "$");
}

void decode(const json_reader_t &r, parameter_schema_t &v) {
  v = decode_schema(r, 1);
}

void to_json(nlohmann::json &j, const function_parameters_t &v) {
  j = nlohmann::json::object();
  j["type"] = magic_enum::enum_name(v.schema_type);
  if (v.properties.has_value())
    j["properties"] = encode_properties(v.properties.value(), "$.properties");
  if (v.required.has_value())
    j["required"] = v.required.value();
}

void decode(const json_reader_t &r, function_parameters_t &v) {
  r.expect_object();
  v.schema_type = r.field<schema_type_t>("type");
  if (r.has("properties"))
    v.properties = decode_properties(r.at("properties"), 1);
  else
    v.properties = std::nullopt;
  v.required = r.optional_field<std::vector<std::string>>("required");
}

std::ostream &operator<<(std::ostream &os, const parameter_schema_t &v) {
  nlohmann::json j = v;
  os << dump_json(j);
  return os;
}

} // namespace chatwire
