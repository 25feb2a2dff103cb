#include "reaper/options.h"

#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

namespace webui_init {

absl::StatusOr<InitOptions> parse_args(int argc, const char* const* argv) {
  InitOptions options;

  int i = 1;
  for (; i < argc; ++i) {
    absl::string_view arg = argv[i];
    if (arg.size() < 2 || arg[0] != '-') break;

    if (arg == "--") {
      ++i;
      break;
    } else if (arg == "-h") {
      options.show_help = true;
    } else if (arg == "-v") {
      options.log_level = LogLevel::INFO;
    } else if (arg == "-vv") {
      options.log_level = LogLevel::DEBUG;
    } else if (arg == "-g") {
      if (i + 1 >= argc) {
        return absl::InvalidArgumentError("-g requires a value in seconds");
      }
      int64_t seconds;
      if (!absl::SimpleAtoi(argv[++i], &seconds) || seconds < 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid grace period for -g: \"", argv[i], "\""));
      }
      options.grace_period = absl::Seconds(seconds);
    } else {
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown option: ", arg));
    }
  }

  if (i < argc) {
    options.launcher.assign(argv + i, argv + argc);
  }
  return options;
}

std::string usage(const char* program) {
  return absl::StrFormat(
      "Usage: %s [-v|-vv] [-g <seconds>] [--] [launcher...]\n"
      "\n"
      "Runs the web UI as a supervised child and reaps orphaned processes.\n"
      "\n"
      "  -v, -vv       Log at INFO or DEBUG level.\n"
      "  -g <seconds>  Grace period between a forwarded SIGTERM/SIGINT and\n"
      "                SIGKILL. Default: %d.\n"
      "  -h            Show this help.\n"
      "  launcher      Program and arguments that start the app. Default:\n"
      "                uv run streamlit run main.py\n"
      "\n"
      "The app is configured with HOST, PORT, STREAMLIT_SERVER_HEADLESS and\n"
      "STREAMLIT_BROWSER_GATHER_USAGE_STATS.\n",
      program, absl::ToInt64Seconds(kDefaultGracePeriod));
}

}  // namespace webui_init
