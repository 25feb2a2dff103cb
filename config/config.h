// Resolves the served app's configuration from environment variables.

#ifndef CONFIG_CONFIG_H_
#define CONFIG_CONFIG_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "process/env_vars.h"

namespace webui_init {

inline constexpr char kHostVar[] = "HOST";
inline constexpr char kPortVar[] = "PORT";
inline constexpr char kHeadlessVar[] = "STREAMLIT_SERVER_HEADLESS";
inline constexpr char kGatherUsageStatsVar[] =
    "STREAMLIT_BROWSER_GATHER_USAGE_STATS";

inline constexpr char kDefaultHost[] = "0.0.0.0";
inline constexpr int kDefaultPort = 8501;
inline constexpr bool kDefaultHeadless = true;
inline constexpr bool kDefaultGatherUsageStats = false;

struct Config {
  std::string host = kDefaultHost;
  int port = kDefaultPort;
  bool headless = kDefaultHeadless;
  bool gather_usage_stats = kDefaultGatherUsageStats;

  bool operator==(const Config&) const = default;
};

// Looks up a named variable. Returns nullopt if it isn't set.
using EnvLookup =
    std::function<std::optional<std::string>(std::string_view name)>;

// Lookups over an EnvVars block or an in-memory map. The returned functions
// reference 'env' and 'vars', which must outlive them.
EnvLookup env_lookup(const EnvVars& env);
EnvLookup map_lookup(const std::map<std::string, std::string>& vars);

// Field resolvers. Absent or empty 'raw' values give the default. Invalid
// values give INVALID_ARGUMENT naming 'var' and the offending value.
absl::StatusOr<std::string> resolve_host(std::string_view var,
                                         const std::optional<std::string>& raw);
absl::StatusOr<int> resolve_port(std::string_view var,
                                 const std::optional<std::string>& raw);
absl::StatusOr<bool> resolve_bool(std::string_view var,
                                  const std::optional<std::string>& raw,
                                  bool default_value);

// Resolves every field of Config through 'lookup'. Returns the first
// validation failure as INVALID_ARGUMENT.
absl::StatusOr<Config> resolve_config(const EnvLookup& lookup);

}  // namespace webui_init

#endif
