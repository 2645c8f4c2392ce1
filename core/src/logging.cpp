#include "logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include <magic_enum/magic_enum.hpp>

namespace chatwire {

namespace {

log_level_t initial_log_level() {
  const char *env = std::getenv("CHATWIRE_LOG_LEVEL");
  if (env == nullptr)
    return log_level_t::warn;
  return parse_log_level(env).value_or(log_level_t::warn);
}

std::atomic<log_level_t> &log_level_storage() {
  static std::atomic<log_level_t> level{initial_log_level()};
  return level;
}

std::mutex log_mutex;

} // namespace

log_level_t get_log_level() {
  return log_level_storage().load(std::memory_order_relaxed);
}

void set_log_level(log_level_t level) {
  log_level_storage().store(level, std::memory_order_relaxed);
}

std::optional<log_level_t> parse_log_level(std::string_view name) {
  auto level = magic_enum::enum_cast<log_level_t>(name);
  if (!level.has_value())
    return std::nullopt;
  return level.value();
}

void write_log(log_level_t level, std::string_view message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << "[chatwire][" << magic_enum::enum_name(level) << "] " << message
            << std::endl;
}

} // namespace chatwire
