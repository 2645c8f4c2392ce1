#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "codec.hpp"
#include "parameter_schema.hpp"
#include "tool.hpp"

using namespace chatwire;

namespace {

std::optional<codec_error> decode_failure(const nlohmann::json &j) {
  try {
    json_reader_t(j).get<parameter_schema_t>();
  } catch (const codec_error &e) {
    return e;
  }
  return std::nullopt;
}

nlohmann::json nested_items(int levels) {
  nlohmann::json j = {{"type", "string"}};
  for (int i = 1; i < levels; i++)
    j = nlohmann::json{{"type", "array"}, {"items", j}};
  return j;
}

} // namespace

TEST(TestParameterSchema, MissingType) {
  auto err = decode_failure(
      nlohmann::json::parse(R"({"description": "no type here"})"));
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->kind(), codec_error_kind_t::missing_field);
  ASSERT_EQ(err->path(), "$.type");
}

TEST(TestParameterSchema, UnknownType) {
  for (const auto &tag : {"bogus", "Object", "STRING", "integer"}) {
    auto err = decode_failure(nlohmann::json{{"type", tag}});
    ASSERT_TRUE(err.has_value()) << tag;
    ASSERT_EQ(err->kind(), codec_error_kind_t::unknown_variant) << tag;
  }
}

TEST(TestParameterSchema, TypeMustBeString) {
  auto err = decode_failure(nlohmann::json::parse(R"({"type": 3})"));
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->kind(), codec_error_kind_t::type_mismatch);
}

TEST(TestParameterSchema, NestedErrorPath) {
  auto err = decode_failure(nlohmann::json::parse(
      R"({"type": "object",
          "properties": {"tags": {"type": "array", "items": {"type": "list"}}}})"));
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->kind(), codec_error_kind_t::unknown_variant);
  ASSERT_EQ(err->path(), "$.properties.tags.items.type");
}

TEST(TestParameterSchema, AbsentFieldsStayUnset) {
  auto schema = nlohmann::json::parse(R"({"type": "object"})")
                    .get<parameter_schema_t>();
  ASSERT_EQ(schema.schema_type, schema_type_t::object);
  ASSERT_FALSE(schema.description.has_value());
  ASSERT_FALSE(schema.enum_values.has_value());
  ASSERT_FALSE(schema.properties.has_value());
  ASSERT_FALSE(schema.required.has_value());
  ASSERT_FALSE(schema.items);

  nlohmann::json j = schema;
  ASSERT_EQ(j.dump(), R"({"type":"object"})");
}

TEST(TestParameterSchema, EmptyCollectionsArePreserved) {
  auto schema = nlohmann::json::parse(
                    R"({"type": "object", "properties": {}, "required": []})")
                    .get<parameter_schema_t>();
  ASSERT_TRUE(schema.properties.has_value());
  ASSERT_TRUE(schema.properties->empty());
  ASSERT_TRUE(schema.required.has_value());

  nlohmann::json j = schema;
  ASSERT_EQ(j.dump(), R"({"properties":{},"required":[],"type":"object"})");
}

TEST(TestParameterSchema, ReencodeIsByteIdentical) {
  const std::string doc =
      R"({"properties":{"location":{"description":"City name","type":"string"},)"
      R"("tags":{"items":{"enum_values":["a","b"],"type":"string"},"type":"array"},)"
      R"("unit":{"enum_values":["celsius","fahrenheit"],"type":"string"}},)"
      R"("required":["location"],"type":"object"})";
  auto schema = nlohmann::json::parse(doc).get<parameter_schema_t>();
  ASSERT_EQ(schema.properties->size(), 3u);
  ASSERT_EQ(schema.properties->at("tags")->items->schema_type,
            schema_type_t::string);

  nlohmann::json j = schema;
  ASSERT_EQ(j.dump(), doc);
}

TEST(TestParameterSchema, InsertionOrderDoesNotMatter) {
  parameter_schema_t a(schema_type_t::object);
  a.add_property("zeta", parameter_schema_t(schema_type_t::number))
      .add_property("alpha", parameter_schema_t(schema_type_t::boolean))
      .add_property("mid", parameter_schema_t(schema_type_t::null));

  parameter_schema_t b(schema_type_t::object);
  b.add_property("mid", parameter_schema_t(schema_type_t::null))
      .add_property("alpha", parameter_schema_t(schema_type_t::boolean))
      .add_property("zeta", parameter_schema_t(schema_type_t::number));

  ASSERT_EQ(a, b);
  nlohmann::json ja = a;
  nlohmann::json jb = b;
  ASSERT_EQ(ja.dump(), jb.dump());
  ASSERT_EQ(ja.dump(), R"({"properties":{"alpha":{"type":"boolean"},)"
                       R"("mid":{"type":"null"},"zeta":{"type":"number"}},)"
                       R"("type":"object"})");
}

TEST(TestParameterSchema, CopyIsDeep) {
  parameter_schema_t original(schema_type_t::object);
  original.add_property(
      "list", parameter_schema_t(schema_type_t::array)
                  .set_items(parameter_schema_t(schema_type_t::string,
                                                "an element")));

  parameter_schema_t copy = original;
  ASSERT_EQ(copy, original);
  ASSERT_NE(copy.properties->at("list").get(),
            original.properties->at("list").get());

  copy.properties->at("list")->items->description = "changed";
  ASSERT_NE(copy, original);
  ASSERT_EQ(original.properties->at("list")->items->description,
            "an element");
}

TEST(TestParameterSchema, NullChildCannotBeEncoded) {
  parameter_schema_t schema(schema_type_t::object);
  schema.properties = parameter_schema_t::properties_t{};
  schema.properties->emplace("broken", nullptr);
  nlohmann::json j;
  try {
    j = schema;
    FAIL() << "encoding succeeded";
  } catch (const codec_error &e) {
    ASSERT_EQ(e.kind(), codec_error_kind_t::type_mismatch);
    ASSERT_EQ(e.path(), "$.properties.broken");
  }

  parameter_schema_t outer(schema_type_t::array);
  outer.set_items(std::move(schema));
  try {
    j = outer;
    FAIL() << "encoding succeeded";
  } catch (const codec_error &e) {
    ASSERT_EQ(e.path(), "$.items.properties.broken");
  }
}

TEST(TestParameterSchema, DepthLimit) {
  auto deepest_allowed = nested_items(max_schema_depth);
  auto schema = deepest_allowed.get<parameter_schema_t>();
  nlohmann::json reencoded = schema;
  ASSERT_EQ(reencoded, deepest_allowed);

  auto err = decode_failure(nested_items(max_schema_depth + 1));
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->kind(), codec_error_kind_t::depth_exceeded);
}

TEST(TestParameterSchema, DepthLimitThroughProperties) {
  nlohmann::json j = {{"type", "string"}};
  for (int i = 0; i < max_schema_depth; i++)
    j = nlohmann::json{{"type", "object"}, {"properties", {{"child", j}}}};
  auto err = decode_failure(j);
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->kind(), codec_error_kind_t::depth_exceeded);
}

TEST(TestFunctionParameters, EncodesIntoFunctionDeclaration) {
  function_parameters_t params;
  params.add_property("city", parameter_schema_t(schema_type_t::string), true)
      .add_property("days", parameter_schema_t(schema_type_t::number));

  function_t function;
  function.name = "forecast";
  function.parameters = params;

  nlohmann::json j = function;
  ASSERT_EQ(j.dump(),
            R"({"name":"forecast","parameters":{"properties":{)"
            R"("city":{"type":"string"},"days":{"type":"number"}},)"
            R"("required":["city"],"type":"object"}})");

  auto decoded = function.parameters.get<function_parameters_t>();
  ASSERT_EQ(decoded, params);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
