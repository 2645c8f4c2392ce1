#include <optional>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "codec.hpp"
#include "tool.hpp"

using namespace chatwire;

namespace {

tool_t weather_tool() {
  tool_t tool;
  tool.function.name = "get_weather";
  tool.function.description = "Look up the current weather";
  tool.function.parameters = nlohmann::json::parse(
      R"({"type": "object",
          "properties": {"city": {"type": "string"}},
          "required": ["city"]})");
  return tool;
}

std::optional<codec_error> decode_failure(const nlohmann::json &j) {
  try {
    json_reader_t(j, "$.tool_choice").get<tool_choice_t>();
  } catch (const codec_error &e) {
    return e;
  }
  return std::nullopt;
}

} // namespace

TEST(TestToolChoice, EncodeBareStrings) {
  nlohmann::json none = tool_choice_t::make_none();
  nlohmann::json automatic = tool_choice_t::make_auto();
  nlohmann::json any = tool_choice_t::make_any();
  ASSERT_TRUE(none.is_string());
  ASSERT_EQ(none.dump(), R"("none")");
  ASSERT_EQ(automatic.dump(), R"("auto")");
  ASSERT_EQ(any.dump(), R"("any")");
}

TEST(TestToolChoice, EncodeSelectedFlattensTool) {
  auto tool = weather_tool();
  nlohmann::json j = tool_choice_t::make_selected(tool);

  ASSERT_TRUE(j.is_object());
  std::vector<std::string> keys;
  for (auto it = j.begin(); it != j.end(); ++it)
    keys.push_back(it.key());
  ASSERT_THAT(keys, ::testing::ElementsAre("function", "type"));
  ASSERT_FALSE(j.contains("tool"));
  ASSERT_EQ(j["type"], "function");
  ASSERT_EQ(j["function"], nlohmann::json(tool.function));
}

TEST(TestToolChoice, EncodeSelectedMatchesToolEncoding) {
  auto tool = weather_tool();
  nlohmann::json choice = tool_choice_t::make_selected(tool);
  nlohmann::json declaration = tool;
  ASSERT_EQ(choice.dump(), declaration.dump());
}

TEST(TestToolChoice, DecodeBareStrings) {
  ASSERT_EQ(nlohmann::json("none").get<tool_choice_t>(),
            tool_choice_t::make_none());
  ASSERT_EQ(nlohmann::json("auto").get<tool_choice_t>(),
            tool_choice_t::make_auto());
  ASSERT_EQ(nlohmann::json("any").get<tool_choice_t>(),
            tool_choice_t::make_any());
}

TEST(TestToolChoice, DecodeIsCaseSensitive) {
  for (const auto &tag : {"None", "AUTO", "required", ""}) {
    auto err = decode_failure(nlohmann::json(tag));
    ASSERT_TRUE(err.has_value()) << tag;
    ASSERT_EQ(err->kind(), codec_error_kind_t::unknown_variant) << tag;
    ASSERT_EQ(err->path(), "$.tool_choice");
  }
}

TEST(TestToolChoice, DecodeSelected) {
  auto tool = weather_tool();
  nlohmann::json j = tool_choice_t::make_selected(tool);
  auto choice = j.get<tool_choice_t>();
  ASSERT_TRUE(choice.is_selected());
  ASSERT_EQ(choice.selected_tool(), tool);
}

TEST(TestToolChoice, DecodeSelectedRequiresTypeAndFunction) {
  auto no_function =
      decode_failure(nlohmann::json::parse(R"({"type": "function"})"));
  ASSERT_TRUE(no_function.has_value());
  ASSERT_EQ(no_function->kind(), codec_error_kind_t::missing_field);
  ASSERT_EQ(no_function->path(), "$.tool_choice.function");

  auto no_type = decode_failure(nlohmann::json::parse(
      R"({"function": {"name": "f", "parameters": {}}})"));
  ASSERT_TRUE(no_type.has_value());
  ASSERT_EQ(no_type->kind(), codec_error_kind_t::missing_field);
  ASSERT_EQ(no_type->path(), "$.tool_choice.type");

  auto nested_tool = decode_failure(nlohmann::json::parse(
      R"({"tool": {"type": "function", "function": {"name": "f", "parameters": {}}}})"));
  ASSERT_TRUE(nested_tool.has_value());
  ASSERT_EQ(nested_tool->kind(), codec_error_kind_t::missing_field);
}

TEST(TestToolChoice, DecodeRejectsOtherShapes) {
  for (const auto &doc : {"1", "true", "null", R"(["auto"])"}) {
    auto err = decode_failure(nlohmann::json::parse(doc));
    ASSERT_TRUE(err.has_value()) << doc;
    ASSERT_EQ(err->kind(), codec_error_kind_t::unexpected_shape) << doc;
  }
}

TEST(TestToolChoice, DecodeUnknownToolKind) {
  auto err = decode_failure(nlohmann::json::parse(
      R"({"type": "retrieval", "function": {"name": "f", "parameters": {}}})"));
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(err->kind(), codec_error_kind_t::unknown_variant);
  ASSERT_EQ(err->path(), "$.tool_choice.type");
  ASSERT_THAT(err->what(), ::testing::HasSubstr("one of function"));
}

TEST(TestToolChoice, RoundTrip) {
  for (const auto &choice :
       {tool_choice_t::make_none(), tool_choice_t::make_auto(),
        tool_choice_t::make_any(),
        tool_choice_t::make_selected(weather_tool())}) {
    nlohmann::json j = choice;
    ASSERT_EQ(j.get<tool_choice_t>(), choice) << j.dump();
  }
}

TEST(TestTool, FunctionWithoutDescriptionOmitsKey) {
  function_t function;
  function.name = "ping";
  nlohmann::json j = function;
  ASSERT_EQ(j.dump(), R"({"name":"ping","parameters":{}})");
  ASSERT_EQ(j.get<function_t>(), function);
}

TEST(TestTool, FunctionRequiresParameters) {
  auto j = nlohmann::json::parse(R"({"name": "ping"})");
  try {
    j.get<function_t>();
    FAIL() << "decoding succeeded";
  } catch (const codec_error &e) {
    ASSERT_EQ(e.kind(), codec_error_kind_t::missing_field);
    ASSERT_EQ(e.path(), "$.parameters");
  }
}

TEST(TestTool, ToolCall) {
  auto j = nlohmann::json::parse(
      R"({"id": "call_0", "type": "function",
          "function": {"name": "get_weather", "arguments": "{\"city\":\"Seoul\"}"}})");
  auto call = j.get<tool_call_t>();
  ASSERT_EQ(call.id, "call_0");
  ASSERT_EQ(call.function.name, "get_weather");
  ASSERT_EQ(call.function.arguments, R"({"city":"Seoul"})");

  nlohmann::json encoded = call;
  ASSERT_EQ(encoded, j);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
