#include "codec.hpp"

#include <cmath>
#include <format>

#include "logging.hpp"

namespace chatwire {

std::ostream &operator<<(std::ostream &os, const codec_error_kind_t &v) {
  os << magic_enum::enum_name(v);
  return os;
}

codec_error::codec_error(codec_error_kind_t kind, const std::string &path,
                         const std::string &expected,
                         const std::string &actual)
    : exception(std::format("{} at {}: expected {}, got {}",
                            magic_enum::enum_name(kind), path, expected,
                            actual)),
      kind_(kind), path_(path), expected_(expected), actual_(actual) {}

namespace detail {

std::string join_names(const std::vector<std::string> &names) {
  std::string rv;
  for (const auto &name : names) {
    if (!rv.empty())
      rv += "|";
    rv += name;
  }
  return rv;
}

std::string quote(const std::string &s) {
  constexpr std::size_t max_quoted_bytes = 64;
  if (s.size() <= max_quoted_bytes)
    return nlohmann::json(s).dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace);
  return nlohmann::json(s.substr(0, max_quoted_bytes))
             .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
         "...";
}

} // namespace detail

void raise_codec_error(codec_error_kind_t kind, const std::string &path,
                       const std::string &expected, const std::string &actual) {
  debug("[codec] {} at {}: expected {}, got {}", magic_enum::enum_name(kind),
        path, expected, actual);
  throw codec_error(kind, path, expected, actual);
}

double finite_number(double value, const std::string &path) {
  if (!std::isfinite(value))
    raise_codec_error(codec_error_kind_t::type_mismatch, path, "finite number",
                      std::format("{}", value));
  return value;
}

std::string dump_json(const nlohmann::json &j, int indent) {
  try {
    return j.dump(indent);
  } catch (const nlohmann::json::type_error &e) {
    raise_codec_error(codec_error_kind_t::type_mismatch, "$", "valid UTF-8",
                      e.what());
  }
}

std::string json_reader_t::describe() const {
  if (j_->is_string())
    return "string " + detail::quote(j_->get<std::string>());
  if (j_->is_array())
    return std::format("array of {}", j_->size());
  if (j_->is_object())
    return "object";
  if (j_->is_null())
    return "null";
  return std::format("{} {}", j_->type_name(), j_->dump());
}

bool json_reader_t::has(const std::string &key) const {
  if (!j_->is_object())
    return false;
  auto it = j_->find(key);
  return it != j_->end() && !it->is_null();
}

json_reader_t json_reader_t::at(const std::string &key) const {
  expect_object();
  auto it = j_->find(key);
  if (it == j_->end())
    raise_codec_error(codec_error_kind_t::missing_field, path_ + "." + key,
                      std::format("field '{}'", key), "nothing");
  return json_reader_t(*it, path_ + "." + key);
}

json_reader_t json_reader_t::at(std::size_t index) const {
  expect_array();
  if (index >= j_->size())
    raise_codec_error(codec_error_kind_t::missing_field,
                      std::format("{}[{}]", path_, index),
                      std::format("element {}", index),
                      std::format("array of {}", j_->size()));
  return json_reader_t((*j_)[index], std::format("{}[{}]", path_, index));
}

void json_reader_t::expect_object() const {
  if (!j_->is_object())
    fail(codec_error_kind_t::type_mismatch, "object");
}

void json_reader_t::expect_array() const {
  if (!j_->is_array())
    fail(codec_error_kind_t::type_mismatch, "array");
}

void json_reader_t::fail(codec_error_kind_t kind,
                         const std::string &expected) const {
  fail(kind, expected, describe());
}

void json_reader_t::fail(codec_error_kind_t kind, const std::string &expected,
                         const std::string &actual) const {
  raise_codec_error(kind, path_, expected, actual);
}

} // namespace chatwire
