#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include "exception.hpp"

namespace chatwire {

enum class codec_error_kind_t {
  unexpected_shape,
  unknown_variant,
  missing_field,
  type_mismatch,
  depth_exceeded
};

std::ostream &operator<<(std::ostream &os, const codec_error_kind_t &v);

/**
 * Raised when a JSON document does not match the wire contract, or when an
 * in-memory value has no valid wire representation.
 *
 * `path` locates the offending node with a JSONPath-like expression rooted at
 * `$`, e.g. `$.messages[2].content[0].type`. On encode, `$` is the value being
 * encoded.
 */
class codec_error : public exception {
public:
  codec_error(codec_error_kind_t kind, const std::string &path,
              const std::string &expected, const std::string &actual);

  codec_error_kind_t kind() const { return kind_; }
  const std::string &path() const { return path_; }
  const std::string &expected() const { return expected_; }
  const std::string &actual() const { return actual_; }

private:
  codec_error_kind_t kind_;
  std::string path_;
  std::string expected_;
  std::string actual_;
};

namespace detail {

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_string_map : std::false_type {};
template <typename V, typename C, typename A>
struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};

std::string join_names(const std::vector<std::string> &names);

/** JSON-escaped, double-quoted copy of `s`, cut after 64 bytes. */
std::string quote(const std::string &s);

} // namespace detail

/** Logs a codec failure at debug level, then throws it. */
[[noreturn]] void raise_codec_error(codec_error_kind_t kind,
                                    const std::string &path,
                                    const std::string &expected,
                                    const std::string &actual);

/** JSON has no NaN or infinity, so those fail with `type_mismatch`. */
double finite_number(double value, const std::string &path);

/**
 * `j.dump(indent)`, except that a string holding invalid UTF-8 raises a
 * `codec_error` instead of nlohmann's `type_error`.
 */
std::string dump_json(const nlohmann::json &j, int indent = -1);

/**
 * A read-only view over a node of a JSON document that remembers where the
 * node lives, so that every decode failure can name the offending field.
 *
 * Scalars, enums (by their lowercase name), vectors and string-keyed maps are
 * decoded directly. Any other type is decoded by an ADL-visible
 * `decode(const json_reader_t &, T &)` overload.
 */
class json_reader_t {
public:
  explicit json_reader_t(const nlohmann::json &j, std::string path = "$")
      : j_(&j), path_(std::move(path)) {}

  const nlohmann::json &value() const { return *j_; }

  const std::string &path() const { return path_; }

  /** Short description of the node for error messages. */
  std::string describe() const;

  /** True if this is an object holding a non-null value under `key`. */
  bool has(const std::string &key) const;

  json_reader_t at(const std::string &key) const;

  json_reader_t at(std::size_t index) const;

  void expect_object() const;

  void expect_array() const;

  [[noreturn]] void fail(codec_error_kind_t kind,
                         const std::string &expected) const;

  [[noreturn]] void fail(codec_error_kind_t kind, const std::string &expected,
                         const std::string &actual) const;

  template <typename T> T get() const;

  template <typename T> T field(const std::string &key) const {
    return at(key).get<T>();
  }

  /** Absent and null both decode to `std::nullopt`. */
  template <typename T>
  std::optional<T> optional_field(const std::string &key) const {
    if (!has(key))
      return std::nullopt;
    return at(key).get<T>();
  }

  template <typename T>
  T field_or(const std::string &key, const T &fallback) const {
    if (!has(key))
      return fallback;
    return at(key).get<T>();
  }

private:
  const nlohmann::json *j_;
  std::string path_;
};

template <typename T> T json_reader_t::get() const {
  if constexpr (std::is_same_v<T, nlohmann::json>) {
    return *j_;
  } else if constexpr (std::is_same_v<T, std::string>) {
    if (!j_->is_string())
      fail(codec_error_kind_t::type_mismatch, "string");
    return j_->get<std::string>();
  } else if constexpr (std::is_same_v<T, bool>) {
    if (!j_->is_boolean())
      fail(codec_error_kind_t::type_mismatch, "boolean");
    return j_->get<bool>();
  } else if constexpr (std::is_integral_v<T>) {
    auto out_of_range = [this]() {
      fail(codec_error_kind_t::type_mismatch,
           std::format("integer in [{}, {}]", std::numeric_limits<T>::min(),
                       std::numeric_limits<T>::max()));
    };
    if (!j_->is_number_integer())
      fail(codec_error_kind_t::type_mismatch,
           std::is_unsigned_v<T> ? "non-negative integer" : "integer");
    if (j_->is_number_unsigned()) {
      auto u = j_->get<std::uint64_t>();
      if (!std::in_range<T>(u))
        out_of_range();
      return static_cast<T>(u);
    }
    auto i = j_->get<std::int64_t>();
    if (std::is_unsigned_v<T> && i < 0)
      fail(codec_error_kind_t::type_mismatch, "non-negative integer");
    if (!std::in_range<T>(i))
      out_of_range();
    return static_cast<T>(i);
  } else if constexpr (std::is_floating_point_v<T>) {
    if (!j_->is_number())
      fail(codec_error_kind_t::type_mismatch, "number");
    return j_->get<T>();
  } else if constexpr (std::is_enum_v<T>) {
    if (!j_->is_string())
      fail(codec_error_kind_t::type_mismatch, "string");
    auto tag = j_->get<std::string>();
    auto v = magic_enum::enum_cast<T>(tag);
    if (!v.has_value()) {
      std::vector<std::string> names;
      for (auto name : magic_enum::enum_names<T>())
        names.emplace_back(name);
      fail(codec_error_kind_t::unknown_variant,
           "one of " + detail::join_names(names), detail::quote(tag));
    }
    return v.value();
  } else if constexpr (detail::is_vector<T>::value) {
    expect_array();
    T out;
    out.reserve(j_->size());
    for (std::size_t i = 0; i < j_->size(); i++)
      out.push_back(at(i).template get<typename T::value_type>());
    return out;
  } else if constexpr (detail::is_string_map<T>::value) {
    expect_object();
    T out;
    for (auto it = j_->begin(); it != j_->end(); ++it)
      out.emplace(it.key(),
                  at(it.key()).template get<typename T::mapped_type>());
    return out;
  } else {
    T out;
    decode(*this, out);
    return out;
  }
}

/**
 * Bridges every type with a `decode` overload into nlohmann's conversion
 * machinery, so `j.get<message_t>()` reports errors the same way.
 */
template <typename T>
  requires requires(const json_reader_t &r, T &v) { decode(r, v); }
void from_json(const nlohmann::json &j, T &v) {
  decode(json_reader_t(j), v);
}

} // namespace chatwire
