// Spawns and tracks the supervised child process.

#ifndef PROCESS_CHILD_PROCESS_H_
#define PROCESS_CHILD_PROCESS_H_

#include <sys/types.h>

#include <optional>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "command/command.h"
#include "process/env_vars.h"

namespace webui_init {

enum class ChildState {
  // Not yet spawned, or spawn failed.
  STARTING = 0,
  RUNNING = 1,
  // Exited normally; exit_code() holds its code.
  EXITED = 2,
  // Killed by a signal; term_signal() holds it.
  SIGNALED = 3,
};

const char* to_string(ChildState state);

// Maps a waitpid() status to a shell style exit code: the exit code for a
// normal exit, 128 + signal number for a signal death.
int exit_code_from_wait_status(int wait_status);

class ChildProcess {
 public:
  explicit ChildProcess(Command command) : command_(std::move(command)) {}

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Spawns the command, searching PATH for its program. The child leads a
  // new process group and starts with an empty signal mask and default
  // signal dispositions. If no environment is passed in, defaults to the
  // parent process's environment.
  //
  // Returns NOT_FOUND or PERMISSION_DENIED if the program can't be executed,
  // INTERNAL if the spawn attributes can't be set up. On failure the state
  // stays STARTING.
  absl::Status spawn(EnvVars* env = nullptr);

  // Blocks until the child terminates and returns its exit code as
  // exit_code_from_wait_status() maps it. Returns FAILED_PRECONDITION if the
  // child was never spawned.
  absl::StatusOr<int> wait();

  // Sends 'sig' to the child's process group, falling back to the child
  // alone if the group is gone. Returns FAILED_PRECONDITION if the child
  // isn't running, or the kill() error.
  absl::Status signal(int sig);

  // Records a termination status for the child collected elsewhere, i.e.
  // by a waitpid(-1, ...) loop. Ignored unless the child is running.
  void on_terminated(int wait_status);

  ChildState state() const { return state_; }
  bool running() const { return state_ == ChildState::RUNNING; }
  bool terminated() const {
    return state_ == ChildState::EXITED || state_ == ChildState::SIGNALED;
  }

  // -1 until spawned.
  pid_t pid() const { return pid_; }

  // Set once terminated.
  std::optional<int> exit_code() const { return exit_code_; }
  std::optional<int> term_signal() const { return term_signal_; }

  const Command& command() const { return command_; }

 private:
  Command command_;
  ChildState state_ = ChildState::STARTING;
  pid_t pid_ = -1;
  std::optional<int> exit_code_;
  std::optional<int> term_signal_;
};

}  // namespace webui_init

#endif
