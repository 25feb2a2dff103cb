#include "command/command.h"

#include <utility>

#include "absl/strings/str_cat.h"

namespace webui_init {
namespace {

const char* bool_flag(bool value) { return value ? "true" : "false"; }

}  // namespace

std::vector<std::string> Command::argv() const {
  std::vector<std::string> out;
  out.reserve(args.size() + 1);
  out.push_back(program);
  out.insert(out.end(), args.begin(), args.end());
  return out;
}

std::vector<std::string> default_launcher() {
  return {"uv", "run", "streamlit", "run", "main.py"};
}

std::vector<std::string> config_flags(const Config& config) {
  return {
      absl::StrCat("--server.address=", config.host),
      absl::StrCat("--server.port=", config.port),
      absl::StrCat("--server.headless=", bool_flag(config.headless)),
      absl::StrCat("--browser.gatherUsageStats=",
                   bool_flag(config.gather_usage_stats)),
  };
}

Command build_command(const Config& config,
                      const std::vector<std::string>& launcher) {
  Command command;
  command.program = launcher.front();
  command.args.assign(launcher.begin() + 1, launcher.end());
  for (std::string& flag : config_flags(config)) {
    command.args.push_back(std::move(flag));
  }
  return command;
}

}  // namespace webui_init
