// Single-line diagnostics on stderr.
//
// Usage mirrors printf, with formats checked at compile time by
// absl::StrFormat:
//   ERROR("Failed to spawn %s: %s", program, status.ToString());

#ifndef LOGGING_H_
#define LOGGING_H_

#include <string>

#include "absl/strings/str_format.h"

namespace webui_init {

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
};

// Lines below this level are dropped. Defaults to WARN.
void set_log_level(LogLevel level);
LogLevel log_level();

void write_log_line(LogLevel level, const std::string& line);

template <typename... Args>
void log_message(LogLevel level, const absl::FormatSpec<Args...>& format,
                 const Args&... args) {
  if (level < log_level()) return;
  write_log_line(level, absl::StrFormat(format, args...));
}

}  // namespace webui_init

#define DEBUG(...) \
  ::webui_init::log_message(::webui_init::LogLevel::DEBUG, __VA_ARGS__)
#define INFO(...) \
  ::webui_init::log_message(::webui_init::LogLevel::INFO, __VA_ARGS__)
#define WARN(...) \
  ::webui_init::log_message(::webui_init::LogLevel::WARN, __VA_ARGS__)
#define ERROR(...) \
  ::webui_init::log_message(::webui_init::LogLevel::ERROR, __VA_ARGS__)

#endif
