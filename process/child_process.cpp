#include "process/child_process.h"

#include <errno.h>
#include <signal.h>
#include <spawn.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "exit_codes.h"
#include "status_macros.h"

namespace webui_init {
namespace {

absl::Status spawn_attr_error(const char* call, int r) {
  return absl::InternalError(absl::StrCat(call, ": ", strerror(r)));
}

// Spawn attributes that undo the signal setup of the init: it blocks the
// signals it relays and the child must not inherit that.
class SpawnAttr {
 public:
  SpawnAttr() = default;
  ~SpawnAttr() {
    if (initialized_) posix_spawnattr_destroy(&attr_);
  }

  SpawnAttr(const SpawnAttr&) = delete;
  SpawnAttr& operator=(const SpawnAttr&) = delete;

  // Returns INTERNAL if any posix_spawnattr_* call fails.
  absl::Status init() {
    int r = posix_spawnattr_init(&attr_);
    if (r != 0) return spawn_attr_error("posix_spawnattr_init", r);
    initialized_ = true;

    sigset_t no_signals;
    sigemptyset(&no_signals);
    r = posix_spawnattr_setsigmask(&attr_, &no_signals);
    if (r != 0) return spawn_attr_error("posix_spawnattr_setsigmask", r);

    // Only signals that are legal to modify can be reset.
    sigset_t most_signals;
    sigemptyset(&most_signals);
    for (int i = 1; i < SIGSYS; ++i) {
      if (i == SIGKILL || i == SIGSTOP) continue;
      sigaddset(&most_signals, i);
    }
    r = posix_spawnattr_setsigdefault(&attr_, &most_signals);
    if (r != 0) return spawn_attr_error("posix_spawnattr_setsigdefault", r);

    // Lead a new process group, so signals can reach the whole tree.
    r = posix_spawnattr_setpgroup(&attr_, 0);
    if (r != 0) return spawn_attr_error("posix_spawnattr_setpgroup", r);

    r = posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETSIGMASK |
                                             POSIX_SPAWN_SETSIGDEF |
                                             POSIX_SPAWN_SETPGROUP);
    if (r != 0) return spawn_attr_error("posix_spawnattr_setflags", r);
    return absl::OkStatus();
  }

  const posix_spawnattr_t* get() const { return &attr_; }

 private:
  posix_spawnattr_t attr_;
  bool initialized_ = false;
};

}  // namespace

const char* to_string(ChildState state) {
  switch (state) {
    case ChildState::STARTING:
      return "STARTING";
    case ChildState::RUNNING:
      return "RUNNING";
    case ChildState::EXITED:
      return "EXITED";
    case ChildState::SIGNALED:
      return "SIGNALED";
  }
  return "UNKNOWN";
}

int exit_code_from_wait_status(int wait_status) {
  if (WIFEXITED(wait_status)) {
    return WEXITSTATUS(wait_status);
  }
  if (WIFSIGNALED(wait_status)) {
    return kExitSignalBase + WTERMSIG(wait_status);
  }
  return 1;
}

absl::Status ChildProcess::spawn(EnvVars* env_vars) {
  if (state_ != ChildState::STARTING) {
    return absl::FailedPreconditionError(
        absl::StrCat("Child already spawned as pid ", pid_));
  }

  std::vector<std::string> args = command_.argv();
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (std::string& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  char** env = env_vars ? env_vars->vars() : environ;

  SpawnAttr attr;
  RETURN_IF_ERROR(attr.init());
  pid_t pid;
  int r = posix_spawnp(&pid, argv[0], /*file_actions=*/nullptr, attr.get(),
                       argv.data(), env);
  if (r != 0) {
    return absl::ErrnoToStatus(
        r, absl::StrCat("Failed to spawn ", command_.program));
  }

  pid_ = pid;
  state_ = ChildState::RUNNING;
  return absl::OkStatus();
}

absl::StatusOr<int> ChildProcess::wait() {
  if (state_ == ChildState::STARTING) {
    return absl::FailedPreconditionError("Child was never spawned");
  }

  while (running()) {
    int wait_status;
    pid_t r = waitpid(pid_, &wait_status, 0);
    if (r == -1) {
      if (errno == EINTR) continue;
      return absl::ErrnoToStatus(
          errno, absl::StrCat("Failed to wait for pid ", pid_));
    }
    on_terminated(wait_status);
  }
  return *exit_code_;
}

absl::Status ChildProcess::signal(int sig) {
  if (!running()) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Can't signal child in state ", to_string(state_)));
  }

  if (kill(-pid_, sig) == 0) return absl::OkStatus();
  // The child may have moved itself to another process group.
  if (errno == ESRCH && kill(pid_, sig) == 0) return absl::OkStatus();
  return absl::ErrnoToStatus(
      errno, absl::StrCat("Failed to send signal ", sig, " to pid ", pid_));
}

void ChildProcess::on_terminated(int wait_status) {
  if (!running()) return;
  // Stopped or continued children are still running.
  if (!WIFEXITED(wait_status) && !WIFSIGNALED(wait_status)) return;

  exit_code_ = exit_code_from_wait_status(wait_status);
  if (WIFSIGNALED(wait_status)) {
    term_signal_ = WTERMSIG(wait_status);
    state_ = ChildState::SIGNALED;
  } else {
    state_ = ChildState::EXITED;
  }
}

}  // namespace webui_init
