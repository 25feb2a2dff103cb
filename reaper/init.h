// The container init. Runs the web UI as its supervised child, reaps every
// descendant reparented to it, forwards signals to the child's process
// group and exits with the child's status.
//
// All work happens on one thread. Signals are never handled in a signal
// handler: they're blocked and read from a signalfd, which is polled
// together with a timerfd for the grace period.

#ifndef REAPER_INIT_H_
#define REAPER_INIT_H_

#include <signal.h>

#include <utility>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "command/command.h"
#include "process/child_process.h"
#include "process/fd.h"

namespace webui_init {

enum class InitState {
  STARTING = 0,
  // Child is running, no termination signal seen.
  RUNNING = 1,
  // A termination signal was forwarded and the grace timer is armed.
  STOPPING = 2,
  // The grace period ran out and the child was sent SIGKILL.
  KILLING = 3,
  EXITED_WITH_CODE = 4,
  EXITED_WITH_SIGNAL = 5,
};

const char* to_string(InitState state);

// Signals that start the grace period when forwarded.
bool is_termination_signal(int sig);
// Signals forwarded to the child as is.
bool is_relayed_signal(int sig);

class Init {
 public:
  Init(Command command, absl::Duration grace_period)
      : child_(std::move(command)), grace_period_(grace_period) {}

  Init(const Init&) = delete;
  Init& operator=(const Init&) = delete;

  // Blocks the handled signals, spawns the child and runs the main loop
  // until the child terminates. Returns the exit code for this process:
  // the child's exit code, 128 + signal if it was killed, or
  // kExitInternal / kExitSpawnError if startup failed.
  int run();

  InitState state() const { return state_; }

 private:
  // Blocks the handled signals and creates the signalfd and timerfd.
  absl::Status setup();
  absl::Status setup_signals();
  absl::Status setup_timer();
  void become_subreaper();
  // Makes the child's process group the terminal's foreground group when
  // stdin is a terminal, remembering the previous one.
  void give_terminal();
  // Gives the terminal back to the group that had it before give_terminal().
  void restore_terminal();

  // Reaps every terminated descendant without blocking.
  void reap();
  // Drains the signalfd.
  void handle_signals();
  void on_signal(int sig);
  void forward(int sig);
  void on_grace_expired();
  absl::Status arm_grace_timer();

  int finish();

  ChildProcess child_;
  absl::Duration grace_period_;
  InitState state_ = InitState::STARTING;
  Fd signal_fd_;
  Fd timer_fd_;
  // Foreground group of stdin's terminal before the child took it, or -1.
  pid_t terminal_pgrp_ = -1;
};

}  // namespace webui_init

#endif
