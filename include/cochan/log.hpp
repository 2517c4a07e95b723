#ifndef COCHAN_LOG_HPP
#define COCHAN_LOG_HPP

#include <string>

namespace cochan {

enum class log_level : int { error = 0, warn, info, debug };

// Initial level comes from COCHAN_LOG (error|warn|info|debug), default warn.
void set_log_level(log_level level) noexcept;
log_level get_log_level() noexcept;

inline bool log_enabled(log_level level) noexcept {
  return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

// The "[cochan] <level>: ..." line log() writes, without the newline.
std::string format_log_line(log_level level, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

// Writes one "[cochan] <level>: ..." line to stderr.
void log(log_level level, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

} // namespace cochan

#endif // COCHAN_LOG_HPP
