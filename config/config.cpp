#include "config/config.h"

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "status_macros.h"

namespace webui_init {
namespace {

bool is_unset(const std::optional<std::string>& raw) {
  return !raw.has_value() || raw->empty();
}

absl::Status invalid_value(std::string_view var, std::string_view value,
                           std::string_view expected) {
  return absl::InvalidArgumentError(absl::StrFormat(
      "Invalid value for %s: \"%s\" (expected %s)", var, value, expected));
}

}  // namespace

EnvLookup env_lookup(const EnvVars& env) {
  return [&env](std::string_view name) { return env.get(name); };
}

EnvLookup map_lookup(const std::map<std::string, std::string>& vars) {
  return [&vars](std::string_view name) -> std::optional<std::string> {
    auto it = vars.find(std::string(name));
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

absl::StatusOr<std::string> resolve_host(
    std::string_view /*var*/, const std::optional<std::string>& raw) {
  if (is_unset(raw)) return std::string(kDefaultHost);
  return *raw;
}

absl::StatusOr<int> resolve_port(std::string_view var,
                                 const std::optional<std::string>& raw) {
  if (is_unset(raw)) return kDefaultPort;

  // SimpleAtoi tolerates surrounding whitespace, which we don't.
  const std::string& value = *raw;
  if (absl::ascii_isspace(static_cast<unsigned char>(value.front())) ||
      absl::ascii_isspace(static_cast<unsigned char>(value.back()))) {
    return invalid_value(var, value, "an integer in [1, 65535]");
  }

  int port;
  if (!absl::SimpleAtoi(value, &port) || port < 1 || port > 65535) {
    return invalid_value(var, value, "an integer in [1, 65535]");
  }
  return port;
}

absl::StatusOr<bool> resolve_bool(std::string_view var,
                                  const std::optional<std::string>& raw,
                                  bool default_value) {
  if (is_unset(raw)) return default_value;

  std::string value = absl::AsciiStrToLower(*raw);
  if (value == "true") return true;
  if (value == "false") return false;
  return invalid_value(var, *raw, "true or false");
}

absl::StatusOr<Config> resolve_config(const EnvLookup& lookup) {
  Config config;
  ASSIGN_OR_RETURN(config.host, resolve_host(kHostVar, lookup(kHostVar)));
  ASSIGN_OR_RETURN(config.port, resolve_port(kPortVar, lookup(kPortVar)));
  ASSIGN_OR_RETURN(config.headless,
                   resolve_bool(kHeadlessVar, lookup(kHeadlessVar),
                                kDefaultHeadless));
  ASSIGN_OR_RETURN(
      config.gather_usage_stats,
      resolve_bool(kGatherUsageStatsVar, lookup(kGatherUsageStatsVar),
                   kDefaultGatherUsageStats));
  return config;
}

}  // namespace webui_init
