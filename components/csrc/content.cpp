#include "content.hpp"

#include <magic_enum/magic_enum.hpp>

namespace chatwire {

std::ostream &operator<<(std::ostream &os, const content_block_type_t &v) {
  os << magic_enum::enum_name(v);
  return os;
}

content_block_type_t content_block_t::type() const {
  if (std::holds_alternative<image_url_block_t>(value))
    return content_block_type_t::image_url;
  return content_block_type_t::text;
}

void to_json(nlohmann::json &j, const content_block_t &v) {
  if (v.value.valueless_by_exception())
    raise_codec_error(codec_error_kind_t::type_mismatch, "$",
                      "text or image_url block", "valueless variant");
  j = nlohmann::json::object();
  j["type"] = magic_enum::enum_name(v.type());
  if (auto text = std::get_if<text_block_t>(&v.value)) {
    j["text"] = text->text;
  } else {
    const auto &image = std::get<image_url_block_t>(v.value);
    j["image_url"] = nlohmann::json{{"url", image.image_url.url}};
  }
}

void decode(const json_reader_t &r, content_block_t &v) {
  if (!r.value().is_object())
    r.fail(codec_error_kind_t::unexpected_shape, "content block object");

  switch (r.field<content_block_type_t>("type")) {
  case content_block_type_t::text:
    v.value = text_block_t{r.field<std::string>("text")};
    break;
  case content_block_type_t::image_url:
    v.value = image_url_block_t{
        image_url_t{r.at("image_url").field<std::string>("url")}};
    break;
  }
}

void to_json(nlohmann::json &j, const content_t &v) {
  if (v.value.valueless_by_exception())
    raise_codec_error(codec_error_kind_t::type_mismatch, "$",
                      "string or array", "valueless variant");
  if (v.is_plain_text()) {
    j = v.as_plain_text();
  } else {
    j = nlohmann::json::array();
    for (const auto &block : v.as_structured())
      j.push_back(block);
  }
}

void decode(const json_reader_t &r, content_t &v) {
  const auto &j = r.value();
  if (j.is_string())
    v.value = j.get<std::string>();
  else if (j.is_array())
    v.value = r.get<std::vector<content_block_t>>();
  else
    r.fail(codec_error_kind_t::unexpected_shape, "string or array");
}

std::ostream &operator<<(std::ostream &os, const content_t &v) {
  nlohmann::json j = v;
  os << dump_json(j);
  return os;
}

} // namespace chatwire
