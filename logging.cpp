#include "logging.h"

#include <stdio.h>

namespace webui_init {
namespace {

LogLevel min_level = LogLevel::WARN;

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}

}  // namespace

void set_log_level(LogLevel level) { min_level = level; }

LogLevel log_level() { return min_level; }

void write_log_line(LogLevel level, const std::string& line) {
  absl::FPrintF(stderr, "webui-init %s: %s\n", level_name(level), line);
}

}  // namespace webui_init
