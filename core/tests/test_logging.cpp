#include <gtest/gtest.h>

#include "logging.hpp"

using namespace chatwire;

TEST(TestLogging, ParseLevel) {
  ASSERT_EQ(parse_log_level("debug"), log_level_t::debug);
  ASSERT_EQ(parse_log_level("warn"), log_level_t::warn);
  ASSERT_EQ(parse_log_level("off"), log_level_t::off);
  ASSERT_FALSE(parse_log_level("verbose").has_value());
  ASSERT_FALSE(parse_log_level("DEBUG").has_value());
}

TEST(TestLogging, LevelThreshold) {
  auto saved = get_log_level();

  set_log_level(log_level_t::error);
  ASSERT_FALSE(log_enabled(log_level_t::debug));
  ASSERT_FALSE(log_enabled(log_level_t::warn));
  ASSERT_TRUE(log_enabled(log_level_t::error));

  set_log_level(log_level_t::debug);
  ASSERT_TRUE(log_enabled(log_level_t::debug));
  ASSERT_TRUE(log_enabled(log_level_t::info));

  set_log_level(log_level_t::off);
  ASSERT_FALSE(log_enabled(log_level_t::error));

  set_log_level(saved);
}

TEST(TestLogging, Output) {
  auto saved = get_log_level();
  set_log_level(log_level_t::info);

  testing::internal::CaptureStderr();
  info("[{}] {} messages", "test", 3);
  debug("hidden {}", 1);
  auto out = testing::internal::GetCapturedStderr();
  ASSERT_EQ(out, "[chatwire][info] [test] 3 messages\n");

  set_log_level(saved);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
