#include "qadt/process/command_runner.hpp"

#include "qadt/process/supervisor.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using qadt::core::Deadline;
using qadt::process::CommandRunner;

TEST(CommandRunner, CapturesBothStreams) {
    CommandRunner runner;
    auto result = runner.run("/bin/sh", {"-c", "echo hello; echo warning 1>&2"});

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "warning\n");
    EXPECT_EQ(result.diagnostic(), "warning");
}

TEST(CommandRunner, NonZeroExit) {
    CommandRunner runner;
    auto result = runner.run("/bin/sh", {"-c", "echo broken; exit 4"});

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, 4);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.diagnostic(), "broken");
}

TEST(CommandRunner, LargeOutputOnBothPipesDoesNotStall) {
    CommandRunner runner;
    auto result = runner.run("/bin/sh",
                             {"-c", "i=0; while [ $i -lt 5000 ]; do echo out$i; echo err$i 1>&2; i=$((i+1)); done"},
                             10s);
    ASSERT_TRUE(result.success());
    EXPECT_NE(result.stdout_text.find("out4999"), std::string::npos);
    EXPECT_NE(result.stderr_text.find("err4999"), std::string::npos);
}

TEST(CommandRunner, TimeoutKillsCommand) {
    CommandRunner runner;
    const auto started = std::chrono::steady_clock::now();
    auto result = runner.run("/bin/sh", {"-c", "sleep 30"}, 200ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success());
    EXPECT_LT(elapsed, 3s);
}

TEST(CommandRunner, DeadlineShortensTimeout) {
    CommandRunner runner(nullptr, 10s);
    const auto started = std::chrono::steady_clock::now();
    auto result = runner.run("/bin/sh", {"-c", "sleep 30"}, Deadline::after(200ms));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(elapsed, 3s);
}

TEST(CommandRunner, ExpiredDeadlineSkipsSpawn) {
    CommandRunner runner;
    auto result = runner.run("/bin/sh", {"-c", "echo never"}, Deadline::after(0ms));
    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(result.stdout_text.empty());
}

TEST(CommandRunner, MissingProgram) {
    CommandRunner runner;
    auto result = runner.run("qadt-no-such-tool", {});
    EXPECT_TRUE(result.spawn_failed);
    EXPECT_FALSE(result.success());
}

TEST(CommandRunner, ChildrenAreTrackedWhileRunning) {
    qadt::process::ProcessSupervisor supervisor;
    CommandRunner runner(&supervisor);

    auto result = runner.run("/bin/sh", {"-c", "exit 0"});
    EXPECT_TRUE(result.success());
    EXPECT_EQ(supervisor.tracked_count(), 0u);
}

TEST(FindExecutable, ResolvesOnPath) {
    auto sh = qadt::process::find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->filename(), "sh");

    EXPECT_TRUE(qadt::process::find_executable("/bin/sh").has_value());
    EXPECT_FALSE(qadt::process::find_executable("qadt-no-such-tool").has_value());
}
