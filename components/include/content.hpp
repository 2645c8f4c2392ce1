#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec.hpp"

namespace chatwire {

/* Content blocks */

enum class content_block_type_t { text, image_url };

std::ostream &operator<<(std::ostream &os, const content_block_type_t &v);

struct text_block_t {
  std::string text;

  bool operator==(const text_block_t &other) const = default;
};

struct image_url_t {
  std::string url;

  bool operator==(const image_url_t &other) const = default;
};

struct image_url_block_t {
  image_url_t image_url;

  bool operator==(const image_url_block_t &other) const = default;
};

/**
 * One element of a structured message body, tagged on the wire by `type`:
 * ```json
 * {"type": "text", "text": "What is in this image?"}
 * {"type": "image_url", "image_url": {"url": "https://..."}}
 * ```
 */
struct content_block_t {
  static content_block_t text(const std::string &text) {
    return content_block_t{text_block_t{text}};
  }

  static content_block_t image_url(const std::string &url) {
    return content_block_t{image_url_block_t{image_url_t{url}}};
  }

  content_block_type_t type() const;

  bool operator==(const content_block_t &other) const = default;

  std::variant<text_block_t, image_url_block_t> value;
};

void to_json(nlohmann::json &j, const content_block_t &v);
void decode(const json_reader_t &r, content_block_t &v);

/* Content */

/**
 * Message content: either plain text or a sequence of content blocks.
 *
 * Plain text travels as a JSON string and structured content as a JSON array.
 * An empty block sequence is still an array (`[]`).
 */
struct content_t {
  static content_t plain_text(const std::string &text) {
    return content_t{text};
  }

  static content_t structured(std::vector<content_block_t> blocks) {
    return content_t{std::move(blocks)};
  }

  bool is_plain_text() const {
    return std::holds_alternative<std::string>(value);
  }

  bool is_structured() const {
    return std::holds_alternative<std::vector<content_block_t>>(value);
  }

  const std::string &as_plain_text() const { return std::get<0>(value); }

  const std::vector<content_block_t> &as_structured() const {
    return std::get<1>(value);
  }

  bool operator==(const content_t &other) const = default;

  std::variant<std::string, std::vector<content_block_t>> value;
};

void to_json(nlohmann::json &j, const content_t &v);
void decode(const json_reader_t &r, content_t &v);

std::ostream &operator<<(std::ostream &os, const content_t &v);

} // namespace chatwire
