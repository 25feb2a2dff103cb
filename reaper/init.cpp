#include "reaper/init.h"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>

#include "absl/time/clock.h"
#include "exit_codes.h"
#include "logging.h"
#include "status_macros.h"

namespace webui_init {
namespace {

const int32_t kNumPolls = 2;

constexpr int kTerminationSignals[] = {SIGTERM, SIGINT};
constexpr int kRelayedSignals[] = {SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2,
                                   SIGWINCH};

// Signals read from the signalfd.
sigset_t handled_signals() {
  sigset_t set;
  sigemptyset(&set);
  for (int sig : kTerminationSignals) sigaddset(&set, sig);
  for (int sig : kRelayedSignals) sigaddset(&set, sig);
  sigaddset(&set, SIGCHLD);
  return set;
}

void make_pollfd(const Fd& fd, pollfd* poll_fd) {
  *poll_fd = pollfd{.fd = *fd, .events = POLLIN};
}

}  // namespace

const char* to_string(InitState state) {
  switch (state) {
    case InitState::STARTING:
      return "STARTING";
    case InitState::RUNNING:
      return "RUNNING";
    case InitState::STOPPING:
      return "STOPPING";
    case InitState::KILLING:
      return "KILLING";
    case InitState::EXITED_WITH_CODE:
      return "EXITED_WITH_CODE";
    case InitState::EXITED_WITH_SIGNAL:
      return "EXITED_WITH_SIGNAL";
  }
  return "UNKNOWN";
}

bool is_termination_signal(int sig) {
  for (int s : kTerminationSignals) {
    if (s == sig) return true;
  }
  return false;
}

bool is_relayed_signal(int sig) {
  for (int s : kRelayedSignals) {
    if (s == sig) return true;
  }
  return false;
}

int Init::run() {
  absl::Status setup_status = setup();
  if (!setup_status.ok()) {
    ERROR("Failed to set up signal handling: %s", setup_status.ToString());
    return kExitInternal;
  }

  become_subreaper();

  absl::Status spawned = child_.spawn();
  if (!spawned.ok()) {
    ERROR("%s", spawned.ToString());
    return kExitSpawnError;
  }
  state_ = InitState::RUNNING;
  INFO("Started %s as pid %d", child_.command().program, child_.pid());

  give_terminal();

  pollfd poll_fds[kNumPolls];
  make_pollfd(signal_fd_, &poll_fds[0]);
  make_pollfd(timer_fd_, &poll_fds[1]);

  while (true) {
    reap();
    if (child_.terminated()) break;

    int r = poll(poll_fds, kNumPolls, -1);
    if (r < 0) {
      if (errno == EINTR) continue;
      // Keep supervising; the child's exit is still picked up by reap().
      ERROR("poll: %s", strerror(errno));
      absl::SleepFor(absl::Milliseconds(100));
      continue;
    }
    if (r == 0) continue;

    if (poll_fds[0].revents) {
      handle_signals();
    }
    if (poll_fds[1].revents) {
      on_grace_expired();
    }
  }

  // Descendants that exited together with the child.
  reap();
  return finish();
}

absl::Status Init::setup() {
  RETURN_IF_ERROR(setup_signals());
  RETURN_IF_ERROR(setup_timer());
  return absl::OkStatus();
}

absl::Status Init::setup_signals() {
  sigset_t mask = handled_signals();
  // Blocked but not read: tcsetpgrp() from a background process group
  // would otherwise stop us.
  sigset_t block = mask;
  sigaddset(&block, SIGTTOU);
  sigaddset(&block, SIGTTIN);
  if (sigprocmask(SIG_BLOCK, &block, nullptr) == -1) {
    return absl::ErrnoToStatus(errno, "sigprocmask");
  }

  signal_fd_ = Fd::take(signalfd(-1, &mask, SFD_CLOEXEC | SFD_NONBLOCK));
  if (!signal_fd_.valid()) {
    return absl::ErrnoToStatus(errno, "signalfd");
  }
  return absl::OkStatus();
}

absl::Status Init::setup_timer() {
  timer_fd_ =
      Fd::take(timerfd_create(CLOCK_MONOTONIC, TFD_CLOEXEC | TFD_NONBLOCK));
  if (!timer_fd_.valid()) {
    return absl::ErrnoToStatus(errno, "timerfd_create");
  }
  return absl::OkStatus();
}

void Init::become_subreaper() {
  // PID 1 gets orphans from the kernel anyway.
  if (getpid() == 1) return;
  if (prctl(PR_SET_CHILD_SUBREAPER, 1)) {
    WARN("Failed to become a child subreaper, orphans won't be reaped: %s",
         strerror(errno));
  }
}

void Init::give_terminal() {
  if (!isatty(STDIN_FILENO)) return;
  pid_t foreground = tcgetpgrp(STDIN_FILENO);
  if (foreground == -1) {
    DEBUG("stdin isn't our controlling terminal: %s", strerror(errno));
    return;
  }
  if (tcsetpgrp(STDIN_FILENO, child_.pid()) == -1) {
    WARN("Failed to hand the terminal to pid %d: %s", child_.pid(),
         strerror(errno));
    return;
  }
  terminal_pgrp_ = foreground;
}

void Init::restore_terminal() {
  if (terminal_pgrp_ == -1) return;
  // SIGTTOU is blocked, so this works from a background group too.
  if (tcsetpgrp(STDIN_FILENO, terminal_pgrp_) == -1) {
    WARN("Failed to give the terminal back to group %d: %s", terminal_pgrp_,
         strerror(errno));
  }
  terminal_pgrp_ = -1;
}

void Init::reap() {
  while (true) {
    int wait_status;
    pid_t pid = waitpid(-1, &wait_status, WNOHANG);
    if (pid == 0) break;
    if (pid == -1) {
      if (errno == EINTR) continue;
      if (errno != ECHILD) {
        WARN("waitpid: %s", strerror(errno));
      }
      break;
    }

    if (pid == child_.pid()) {
      child_.on_terminated(wait_status);
    } else {
      DEBUG("Reaped orphan pid %d with status %d", pid,
            exit_code_from_wait_status(wait_status));
    }
  }
}

void Init::handle_signals() {
  while (true) {
    signalfd_siginfo info;
    ssize_t r = read(*signal_fd_, &info, sizeof(info));
    if (r == -1) {
      if (errno == EINTR) continue;
      if (errno != EAGAIN) {
        WARN("Failed to read signalfd: %s", strerror(errno));
      }
      break;
    }
    if (r != sizeof(info)) {
      WARN("Short read from signalfd: %d bytes", r);
      break;
    }
    on_signal(static_cast<int>(info.ssi_signo));
  }
}

void Init::on_signal(int sig) {
  // Children are reaped at the top of the main loop.
  if (sig == SIGCHLD) return;
  if (!child_.running()) return;

  if (is_relayed_signal(sig)) {
    forward(sig);
    return;
  }
  if (!is_termination_signal(sig)) return;

  if (state_ == InitState::KILLING) {
    INFO("Ignoring %s, child %d was already sent SIGKILL", strsignal(sig),
         child_.pid());
    return;
  }

  forward(sig);
  absl::Status armed = arm_grace_timer();
  if (!armed.ok()) {
    ERROR("Failed to arm grace timer, killing child now: %s",
          armed.ToString());
    state_ = InitState::STOPPING;
    on_grace_expired();
    return;
  }
  state_ = InitState::STOPPING;
}

void Init::forward(int sig) {
  INFO("Forwarding %s to child %d", strsignal(sig), child_.pid());
  absl::Status s = child_.signal(sig);
  if (!s.ok()) {
    WARN("Failed to forward %s: %s", strsignal(sig), s.ToString());
  }
}

void Init::on_grace_expired() {
  uint64_t expirations;
  // Nothing to drain when called without the timer firing.
  if (read(*timer_fd_, &expirations, sizeof(expirations)) == -1 &&
      errno != EAGAIN) {
    WARN("Failed to read timerfd: %s", strerror(errno));
  }

  if (state_ != InitState::STOPPING || !child_.running()) return;

  WARN("Child %d didn't exit within %s, sending SIGKILL", child_.pid(),
       absl::FormatDuration(grace_period_));
  absl::Status s = child_.signal(SIGKILL);
  if (!s.ok()) {
    WARN("Failed to kill child: %s", s.ToString());
  }
  state_ = InitState::KILLING;
}

absl::Status Init::arm_grace_timer() {
  // A zero it_value disarms the timer, so round up to the shortest delay.
  absl::Duration delay = std::max(grace_period_, absl::Nanoseconds(1));
  itimerspec spec = {};
  spec.it_value = absl::ToTimespec(delay);
  if (timerfd_settime(*timer_fd_, 0, &spec, nullptr) == -1) {
    return absl::ErrnoToStatus(errno, "timerfd_settime");
  }
  DEBUG("Grace timer armed for %s", absl::FormatDuration(delay));
  return absl::OkStatus();
}

int Init::finish() {
  restore_terminal();
  int code = *child_.exit_code();
  if (child_.state() == ChildState::SIGNALED) {
    state_ = InitState::EXITED_WITH_SIGNAL;
    INFO("Child %d was killed by %s, exiting with %d", child_.pid(),
         strsignal(*child_.term_signal()), code);
  } else {
    state_ = InitState::EXITED_WITH_CODE;
    INFO("Child %d exited with %d", child_.pid(), code);
  }
  return code;
}

}  // namespace webui_init
