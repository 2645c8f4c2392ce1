#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chatwire {

enum class log_level_t { debug, info, warn, error, off };

/**
 * Reads `CHATWIRE_LOG_LEVEL` the first time it is called. Unknown values fall
 * back to `warn`.
 */
log_level_t get_log_level();

void set_log_level(log_level_t level);

std::optional<log_level_t> parse_log_level(std::string_view name);

void write_log(log_level_t level, std::string_view message);

inline bool log_enabled(log_level_t level) {
  return level != log_level_t::off && level >= get_log_level();
}

template <typename... args_t>
void debug(std::format_string<args_t...> fmt, args_t &&...args) {
  if (log_enabled(log_level_t::debug))
    write_log(log_level_t::debug,
              std::format(fmt, std::forward<args_t>(args)...));
}

template <typename... args_t>
void info(std::format_string<args_t...> fmt, args_t &&...args) {
  if (log_enabled(log_level_t::info))
    write_log(log_level_t::info,
              std::format(fmt, std::forward<args_t>(args)...));
}

template <typename... args_t>
void warn(std::format_string<args_t...> fmt, args_t &&...args) {
  if (log_enabled(log_level_t::warn))
    write_log(log_level_t::warn,
              std::format(fmt, std::forward<args_t>(args)...));
}

template <typename... args_t>
void error(std::format_string<args_t...> fmt, args_t &&...args) {
  if (log_enabled(log_level_t::error))
    write_log(log_level_t::error,
              std::format(fmt, std::forward<args_t>(args)...));
}

} // namespace chatwire
