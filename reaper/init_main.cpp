// Container entrypoint for the web UI.
// clang-format off
// Example usage:
// $ PORT=9999 webui-init
// $ webui-init -v -g 10 -- uv run streamlit run main.py
// clang-format on

#include <stdio.h>

#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "command/command.h"
#include "config/config.h"
#include "exit_codes.h"
#include "logging.h"
#include "process/env_vars.h"
#include "reaper/init.h"
#include "reaper/options.h"

using webui_init::Config;
using webui_init::EnvVars;
using webui_init::Init;
using webui_init::InitOptions;

int main(int argc, char** argv) {
  absl::StatusOr<InitOptions> options = webui_init::parse_args(argc, argv);
  if (!options.ok()) {
    absl::FPrintF(stderr, "%s\n%s", options.status().message(),
                  webui_init::usage(argv[0]));
    return webui_init::kExitUsage;
  }
  if (options->show_help) {
    absl::FPrintF(stdout, "%s", webui_init::usage(argv[0]));
    return 0;
  }
  webui_init::set_log_level(options->log_level);

  EnvVars env = EnvVars::environ();
  absl::StatusOr<Config> config =
      webui_init::resolve_config(webui_init::env_lookup(env));
  if (!config.ok()) {
    ERROR("%s", config.status().message());
    return webui_init::kExitConfigError;
  }

  Init init(webui_init::build_command(*config, options->launcher),
            options->grace_period);
  return init.run();
}
