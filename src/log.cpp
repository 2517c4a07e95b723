#include "cochan/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace cochan {

namespace {

log_level level_from_env() noexcept {
  const char *value = std::getenv("COCHAN_LOG");
  if (value == nullptr)
    return log_level::warn;
  if (std::strcmp(value, "error") == 0)
    return log_level::error;
  if (std::strcmp(value, "info") == 0)
    return log_level::info;
  if (std::strcmp(value, "debug") == 0)
    return log_level::debug;
  return log_level::warn;
}

std::atomic<log_level> &current_level() noexcept {
  static std::atomic<log_level> level{level_from_env()};
  return level;
}

const char *level_name(log_level level) noexcept {
  switch (level) {
  case log_level::error:
    return "error";
  case log_level::warn:
    return "warn";
  case log_level::info:
    return "info";
  case log_level::debug:
    return "debug";
  }
  return "?";
}

} // namespace

void set_log_level(log_level level) noexcept {
  current_level().store(level, std::memory_order_relaxed);
}

log_level get_log_level() noexcept {
  return current_level().load(std::memory_order_relaxed);
}

namespace {

std::string vformat_line(log_level level, const char *fmt, va_list args) {
  char prefix[32];
  int prefix_len =
      std::snprintf(prefix, sizeof(prefix), "[cochan] %s: ", level_name(level));

  va_list sizing;
  va_copy(sizing, args);
  int body_len = std::vsnprintf(nullptr, 0, fmt, sizing);
  va_end(sizing);
  if (body_len < 0) {
    return std::string(prefix, prefix_len) + fmt;
  }

  // No fixed cap: deadlock reports list every blocked task.
  std::string line(prefix, prefix_len);
  line.resize(prefix_len + body_len + 1);
  std::vsnprintf(line.data() + prefix_len, body_len + 1, fmt, args);
  line.resize(prefix_len + body_len);
  return line;
}

} // namespace

std::string format_log_line(log_level level, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  std::string line = vformat_line(level, fmt, args);
  va_end(args);
  return line;
}

void log(log_level level, const char *fmt, ...) {
  if (!log_enabled(level))
    return;

  // Format first so concurrent lines do not interleave.
  va_list args;
  va_start(args, fmt);
  std::string line = vformat_line(level, fmt, args);
  va_end(args);
  std::fprintf(stderr, "%s\n", line.c_str());
}

} // namespace cochan
