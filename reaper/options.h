#ifndef REAPER_OPTIONS_H_
#define REAPER_OPTIONS_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "command/command.h"
#include "logging.h"

namespace webui_init {

inline constexpr absl::Duration kDefaultGracePeriod = absl::Seconds(5);

// Policy of the init itself, from its command line.
struct InitOptions {
  // How long the child gets to exit after a forwarded termination signal
  // before it's sent SIGKILL.
  absl::Duration grace_period = kDefaultGracePeriod;
  LogLevel log_level = LogLevel::WARN;
  // Program and leading arguments of the child. Never empty.
  std::vector<std::string> launcher = default_launcher();
  bool show_help = false;
};

// Parses: [-v|-vv] [-g <seconds>] [-h] [--] [launcher...]
// Returns INVALID_ARGUMENT for unknown options or a bad -g value.
absl::StatusOr<InitOptions> parse_args(int argc, const char* const* argv);

std::string usage(const char* program);

}  // namespace webui_init

#endif
