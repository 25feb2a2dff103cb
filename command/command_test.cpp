#include "command/command.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace webui_init {
namespace {

using ::testing::ElementsAre;

TEST(CommandTest, DefaultConfig) {
  Command command = build_command(Config());
  EXPECT_EQ(command.program, "uv");
  EXPECT_THAT(command.args,
              ElementsAre("run", "streamlit", "run", "main.py",
                          "--server.address=0.0.0.0", "--server.port=8501",
                          "--server.headless=true",
                          "--browser.gatherUsageStats=false"));
}

TEST(CommandTest, FlagsFollowConfig) {
  Config config;
  config.host = "127.0.0.1";
  config.port = 9999;
  config.headless = false;
  config.gather_usage_stats = true;
  EXPECT_THAT(config_flags(config),
              ElementsAre("--server.address=127.0.0.1", "--server.port=9999",
                          "--server.headless=false",
                          "--browser.gatherUsageStats=true"));
}

TEST(CommandTest, CustomLauncher) {
  Command command = build_command(Config(), {"/bin/echo"});
  EXPECT_EQ(command.program, "/bin/echo");
  EXPECT_THAT(command.argv(),
              ElementsAre("/bin/echo", "--server.address=0.0.0.0",
                          "--server.port=8501", "--server.headless=true",
                          "--browser.gatherUsageStats=false"));
}

TEST(CommandTest, ShellMetacharactersStayOneArgument) {
  Config config;
  config.host = "$(touch /tmp/x); echo 'a b'";
  Command command = build_command(config, {"app"});
  ASSERT_EQ(command.args.size(), 4u);
  EXPECT_EQ(command.args[0], "--server.address=$(touch /tmp/x); echo 'a b'");
}

TEST(CommandTest, SameConfigSameCommand) {
  Config config;
  config.port = 1234;
  Config copy = config;
  EXPECT_EQ(build_command(config), build_command(copy));
  EXPECT_EQ(build_command(config).argv(), build_command(copy).argv());
}

}  // namespace
}  // namespace webui_init
