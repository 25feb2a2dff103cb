// Tests of the init, both end-to-end through the webui-init binary and
// in-process through Init::run(), with shell scripts standing in for the
// web UI.

#include <fcntl.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <signal.h>
#include <spawn.h>
#include <stdlib.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "exit_codes.h"
#include "process/env_vars.h"
#include "reaper/init.h"

namespace webui_init {
namespace {

namespace fs = std::filesystem;

using ::testing::ElementsAre;
using std::chrono::milliseconds;
using std::chrono::steady_clock;
using std::this_thread::sleep_for;

const char* kInitBinary = WEBUI_INIT_BINARY;

// Launches webui-init with 'args' and 'env', stdin from /dev/null so it
// never takes over a terminal the tests run in.
pid_t launch_init(const std::vector<std::string>& args, EnvVars& env) {
  std::vector<std::string> all = {kInitBinary};
  all.insert(all.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (std::string& arg : all) argv.push_back(arg.data());
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  pid_t pid = -1;
  int r = posix_spawn(&pid, kInitBinary, &actions, nullptr, argv.data(),
                      env.vars());
  posix_spawn_file_actions_destroy(&actions);
  EXPECT_EQ(r, 0) << "Failed to launch " << kInitBinary;
  return pid;
}

// Returns the exit code of 'pid', or -1 if it doesn't exit within
// 'timeout', in which case it's killed.
int wait_exit_code(pid_t pid, milliseconds timeout = milliseconds(5000)) {
  auto start = steady_clock::now();
  while (steady_clock::now() - start < timeout) {
    int status;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      if (WIFEXITED(status)) return WEXITSTATUS(status);
      return 128 + WTERMSIG(status);
    }
    sleep_for(milliseconds(10));
  }
  kill(pid, SIGKILL);
  waitpid(pid, nullptr, 0);
  return -1;
}

bool wait_for_file(const fs::path& path,
                   milliseconds timeout = milliseconds(2000)) {
  auto start = steady_clock::now();
  while (steady_clock::now() - start < timeout) {
    if (fs::exists(path)) return true;
    sleep_for(milliseconds(10));
  }
  return false;
}

std::vector<std::string> read_lines(const fs::path& path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

int last_dir_num = 0;

class InitTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("webui_init_test_" + std::to_string(getpid()) + "_" +
            std::to_string(last_dir_num++));
    fs::remove_all(dir_);
    fs::create_directories(dir_);

    env_ = EnvVars::environ();
    for (const char* var : {"HOST", "PORT", "STREAMLIT_SERVER_HEADLESS",
                            "STREAMLIT_BROWSER_GATHER_USAGE_STATS"}) {
      env_.unset(var);
    }
  }

  void TearDown() override { fs::remove_all(dir_); }

  // Runs webui-init with a `sh -c 'script'` launcher. The app's flags reach
  // the script as "$@".
  pid_t launch_script(const std::string& script,
                      std::vector<std::string> options = {}) {
    options.insert(options.end(), {"--", "sh", "-c", script, "sh"});
    return launch_init(options, env_);
  }

  std::string path(const std::string& name) const {
    return (dir_ / name).string();
  }

  fs::path dir_;
  EnvVars env_;
};

TEST_F(InitTest, DefaultFlagsReachChild) {
  pid_t pid = launch_script("printf '%s\\n' \"$@\" > " + path("args"));
  ASSERT_EQ(wait_exit_code(pid), 0);
  EXPECT_THAT(read_lines(path("args")),
              ElementsAre("--server.address=0.0.0.0", "--server.port=8501",
                          "--server.headless=true",
                          "--browser.gatherUsageStats=false"));
}

TEST_F(InitTest, PortFromEnvironment) {
  env_.set("PORT", "9999");
  pid_t pid = launch_script("printf '%s\\n' \"$@\" > " + path("args"));
  ASSERT_EQ(wait_exit_code(pid), 0);
  EXPECT_THAT(read_lines(path("args")),
              ElementsAre("--server.address=0.0.0.0", "--server.port=9999",
                          "--server.headless=true",
                          "--browser.gatherUsageStats=false"));
}

TEST_F(InitTest, InvalidPortNeverStartsChild) {
  env_.set("PORT", "not-a-number");
  pid_t pid = launch_script("touch " + path("started"));
  EXPECT_EQ(wait_exit_code(pid), kExitConfigError);
  EXPECT_FALSE(fs::exists(path("started")));
}

TEST_F(InitTest, InvalidBooleanNeverStartsChild) {
  env_.set("STREAMLIT_SERVER_HEADLESS", "yes");
  pid_t pid = launch_script("touch " + path("started"));
  EXPECT_EQ(wait_exit_code(pid), kExitConfigError);
  EXPECT_FALSE(fs::exists(path("started")));
}

TEST_F(InitTest, MirrorsExitCode) {
  EXPECT_EQ(wait_exit_code(launch_script("exit 0")), 0);
  EXPECT_EQ(wait_exit_code(launch_script("exit 42")), 42);
}

TEST_F(InitTest, ChildKilledBySignal) {
  EXPECT_EQ(wait_exit_code(launch_script("kill -KILL $$")), 128 + SIGKILL);
}

TEST_F(InitTest, MissingProgram) {
  pid_t pid = launch_init({"--", "/nonexistent/webui-app"}, env_);
  EXPECT_EQ(wait_exit_code(pid), kExitSpawnError);
}

TEST_F(InitTest, UsageErrors) {
  EXPECT_EQ(wait_exit_code(launch_init({"-x"}, env_)), kExitUsage);
  EXPECT_EQ(wait_exit_code(launch_init({"-g", "soon"}, env_)), kExitUsage);
  EXPECT_EQ(wait_exit_code(launch_init({"-h"}, env_)), 0);
}

TEST_F(InitTest, ForwardsSigterm) {
  pid_t pid = launch_script("trap 'exit 7' TERM; touch " + path("ready") +
                            "; while :; do sleep 0.05; done");
  ASSERT_TRUE(wait_for_file(path("ready")));

  kill(pid, SIGTERM);
  EXPECT_EQ(wait_exit_code(pid, milliseconds(3000)), 7);
}

TEST_F(InitTest, ForwardsSigint) {
  pid_t pid = launch_script("trap 'exit 8' INT; touch " + path("ready") +
                            "; while :; do sleep 0.05; done");
  ASSERT_TRUE(wait_for_file(path("ready")));

  kill(pid, SIGINT);
  EXPECT_EQ(wait_exit_code(pid, milliseconds(3000)), 8);
}

TEST_F(InitTest, ChildDiesFromForwardedSignal) {
  pid_t pid = launch_script("touch " + path("ready") + "; exec sleep 10");
  ASSERT_TRUE(wait_for_file(path("ready")));
  sleep_for(milliseconds(50));

  kill(pid, SIGTERM);
  EXPECT_EQ(wait_exit_code(pid, milliseconds(3000)), 128 + SIGTERM);
}

TEST_F(InitTest, RelaysSighup) {
  pid_t pid = launch_script("trap 'exit 9' HUP; touch " + path("ready") +
                            "; while :; do sleep 0.05; done");
  ASSERT_TRUE(wait_for_file(path("ready")));

  kill(pid, SIGHUP);
  EXPECT_EQ(wait_exit_code(pid, milliseconds(3000)), 9);
}

TEST_F(InitTest, KillsChildAfterGracePeriod) {
  pid_t pid = launch_script("trap '' TERM; touch " + path("ready") +
                                "; while :; do sleep 0.05; done",
                            {"-g", "1"});
  ASSERT_TRUE(wait_for_file(path("ready")));

  auto start = steady_clock::now();
  kill(pid, SIGTERM);
  EXPECT_EQ(wait_exit_code(pid, milliseconds(5000)), 128 + SIGKILL);
  EXPECT_GE(steady_clock::now() - start, milliseconds(900));
}

TEST_F(InitTest, SecondSignalRearmsGracePeriod) {
  pid_t pid = launch_script("trap '' TERM; touch " + path("ready") +
                                "; while :; do sleep 0.05; done",
                            {"-g", "1"});
  ASSERT_TRUE(wait_for_file(path("ready")));

  auto start = steady_clock::now();
  kill(pid, SIGTERM);
  sleep_for(milliseconds(700));
  kill(pid, SIGTERM);
  EXPECT_EQ(wait_exit_code(pid, milliseconds(5000)), 128 + SIGKILL);
  EXPECT_GE(steady_clock::now() - start, milliseconds(1600));
}

TEST_F(InitTest, SignalAfterKillIsDropped) {
  pid_t pid = launch_script("trap '' TERM; touch " + path("ready") +
                                "; while :; do sleep 0.05; done",
                            {"-g", "0"});
  ASSERT_TRUE(wait_for_file(path("ready")));

  auto start = steady_clock::now();
  kill(pid, SIGTERM);
  sleep_for(milliseconds(20));
  kill(pid, SIGTERM);
  kill(pid, SIGTERM);
  EXPECT_EQ(wait_exit_code(pid, milliseconds(3000)), 128 + SIGKILL);
  EXPECT_LT(steady_clock::now() - start, milliseconds(1000));
}

TEST_F(InitTest, ReapsOrphans) {
  // Each subshell exits right away, leaving its sleep to be reparented to
  // webui-init. The script fails if any of them is left as a zombie.
  std::string pids = path("pids");
  pid_t pid = launch_script(
      "for i in 1 2 3 4 5; do ( sleep 0.1 & echo $! >> " + pids +
      " ); done; sleep 0.8; for p in $(cat " + pids +
      "); do test -e /proc/$p && exit 1; done; exit 0");
  EXPECT_EQ(wait_exit_code(pid), 0);
  EXPECT_EQ(read_lines(pids).size(), 5u);
}

TEST_F(InitTest, StateNames) {
  EXPECT_STREQ(to_string(InitState::STOPPING), "STOPPING");
  EXPECT_TRUE(is_termination_signal(SIGTERM));
  EXPECT_TRUE(is_termination_signal(SIGINT));
  EXPECT_FALSE(is_termination_signal(SIGHUP));
  EXPECT_TRUE(is_relayed_signal(SIGHUP));
  EXPECT_FALSE(is_relayed_signal(SIGCHLD));
}

// Runs Init inside the test process. Init blocks signals and becomes a
// subreaper, both of which are undone after each test.
class InitInProcessTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(sigprocmask(SIG_SETMASK, nullptr, &old_mask_), 0);
  }

  void TearDown() override {
    sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
    prctl(PR_SET_CHILD_SUBREAPER, 0);
  }

  sigset_t old_mask_;
};

Command sh(const std::string& script) {
  return Command{.program = "sh", .args = {"-c", script}};
}

TEST_F(InitInProcessTest, ExitedWithCode) {
  Init init(sh("exit 3"), absl::Seconds(1));
  EXPECT_EQ(init.state(), InitState::STARTING);
  EXPECT_EQ(init.run(), 3);
  EXPECT_EQ(init.state(), InitState::EXITED_WITH_CODE);
}

TEST_F(InitInProcessTest, ExitedWithSignal) {
  Init init(sh("kill -KILL $$"), absl::Seconds(1));
  EXPECT_EQ(init.run(), 128 + SIGKILL);
  EXPECT_EQ(init.state(), InitState::EXITED_WITH_SIGNAL);
}

TEST_F(InitInProcessTest, SpawnFailureStaysStarting) {
  Init init(Command{.program = "/nonexistent/webui-app"}, absl::Seconds(1));
  EXPECT_EQ(init.run(), kExitSpawnError);
  EXPECT_EQ(init.state(), InitState::STARTING);
}

TEST_F(InitInProcessTest, SignalBeforeSpawnIsForwarded) {
  // Leave a SIGTERM pending before Init runs. Without it the child would
  // exit 0 after two seconds.
  sigset_t term;
  sigemptyset(&term);
  sigaddset(&term, SIGTERM);
  ASSERT_EQ(sigprocmask(SIG_BLOCK, &term, nullptr), 0);
  ASSERT_EQ(kill(getpid(), SIGTERM), 0);

  auto start = steady_clock::now();
  Init init(sh("sleep 2; exit 0"), absl::Seconds(5));
  EXPECT_EQ(init.run(), 128 + SIGTERM);
  EXPECT_EQ(init.state(), InitState::EXITED_WITH_SIGNAL);
  EXPECT_LT(steady_clock::now() - start, milliseconds(1500));

  sigset_t pending;
  sigpending(&pending);
  EXPECT_FALSE(sigismember(&pending, SIGTERM));
}

TEST_F(InitInProcessTest, HandsTerminalToChildAndBack) {
  int master = posix_openpt(O_RDWR | O_NOCTTY);
  ASSERT_GE(master, 0);
  ASSERT_EQ(grantpt(master), 0);
  ASSERT_EQ(unlockpt(master), 0);
  std::string slave = ptsname(master);

  pid_t pid = fork();
  ASSERT_NE(pid, -1);
  if (pid == 0) {
    // A new session whose controlling terminal is the pty, on stdin.
    if (setsid() == -1) _exit(10);
    int fd = open(slave.c_str(), O_RDWR);
    if (fd == -1 || dup2(fd, STDIN_FILENO) == -1) _exit(11);

    // Exits 0 once the script's group is the terminal's foreground group.
    Init init(sh("i=0; while [ $i -lt 100 ]; do "
                 "read -r pid comm state ppid pgrp session tty tpgid rest "
                 "< /proc/$$/stat; [ \"$pgrp\" = \"$tpgid\" ] && exit 0; "
                 "i=$((i + 1)); sleep 0.01; done; exit 1"),
              absl::Seconds(1));
    if (init.run() != 0) _exit(12);
    _exit(tcgetpgrp(STDIN_FILENO) == getpgrp() ? 0 : 13);
  }

  int status;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  close(master);
  ASSERT_TRUE(WIFEXITED(status));
  // 12: the child never got the terminal. 13: it wasn't given back.
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

}  // namespace
}  // namespace webui_init
