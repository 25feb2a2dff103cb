// Exit codes of webui-init for failures of its own. Once the child is
// running, webui-init exits with the child's code, or 128 + signal number
// if the child was killed by a signal.

#ifndef EXIT_CODES_H_
#define EXIT_CODES_H_

namespace webui_init {

// Invalid command line (sysexits EX_USAGE).
inline constexpr int kExitUsage = 64;
// Signal capture or timer setup failed before the child was spawned
// (sysexits EX_SOFTWARE).
inline constexpr int kExitInternal = 70;
// An environment variable failed validation. No child is started
// (sysexits EX_CONFIG).
inline constexpr int kExitConfigError = 78;
// The child could not be spawned, e.g. its program isn't on PATH.
inline constexpr int kExitSpawnError = 127;

// Offset added to the signal number when the child dies from a signal.
inline constexpr int kExitSignalBase = 128;

}  // namespace webui_init

#endif
