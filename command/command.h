#ifndef COMMAND_COMMAND_H_
#define COMMAND_COMMAND_H_

#include <string>
#include <vector>

#include "config/config.h"

namespace webui_init {

// A program and its arguments, passed to the child as discrete tokens.
struct Command {
  std::string program;
  std::vector<std::string> args;

  // Returns program followed by args.
  std::vector<std::string> argv() const;

  bool operator==(const Command&) const = default;
};

// The program and leading arguments that start the web UI.
std::vector<std::string> default_launcher();

// Renders 'config' as the app's command line flags, in the fixed order:
// address, port, headless mode, usage stats.
std::vector<std::string> config_flags(const Config& config);

// Builds the child's command: 'launcher' followed by config_flags(config).
// 'launcher' must not be empty.
Command build_command(const Config& config,
                      const std::vector<std::string>& launcher =
                          default_launcher());

}  // namespace webui_init

#endif
