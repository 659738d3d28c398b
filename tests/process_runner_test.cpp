#include <gtest/gtest.h>

#include <chrono>
#include <signal.h>
#include <filesystem>
#include <string>

#include "process/process_runner.hpp"
#include "runner/errors.hpp"
#include "test_support.hpp"

namespace ojrunner::process {
namespace {

const std::string kShell = "/bin/sh";

TEST(ProcessRunnerTest, FeedsInputAndAppendsNewline) {
    ProcessRunner runner;
    const auto result = runner.Run("cat", {}, "abc", "/");
    EXPECT_EQ(result.output, "abc\n");
    EXPECT_EQ(result.error, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, KeepsExistingTrailingNewline) {
    ProcessRunner runner;
    const auto result = runner.Run("cat", {}, "1 2\n3\n", "/");
    EXPECT_EQ(result.output, "1 2\n3\n");
}

TEST(ProcessRunnerTest, EmptyInputClosesStdinImmediately) {
    ProcessRunner runner;
    const auto result = runner.Run("cat", {}, "", "/");
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessRunnerTest, SeparatesStreamsAndReportsExitCode) {
    ProcessRunner runner;
    const auto result = runner.Run(kShell, {"-c", "echo out; echo err >&2; exit 3"}, "", "/");
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
    EXPECT_EQ(result.exit_code, 3);
}

TEST(ProcessRunnerTest, PassesArgumentsLiterally) {
    ProcessRunner runner;
    const auto result = runner.Run(
        kShell, {"-c", "printf '%s|' \"$@\"", "sh", "a b", "$HOME", "x;y"}, "", "/");
    EXPECT_EQ(result.output, "a b|$HOME|x;y|");
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    testing::TempDir dir;
    ProcessRunner runner;
    const auto result = runner.Run(kShell, {"-c", "pwd -P"}, "", dir.Path().string());
    EXPECT_EQ(result.output, std::filesystem::canonical(dir.Path()).string() + "\n");
}

TEST(ProcessRunnerTest, DrainsLargeOutputOnBothStreams) {
    ProcessRunner runner;
    const auto result = runner.Run(
        kShell,
        {"-c", "head -c 300000 /dev/zero | tr '\\000' a; head -c 300000 /dev/zero | tr '\\000' b >&2"},
        "",
        "/");
    EXPECT_EQ(result.output.size(), 300000u);
    EXPECT_EQ(result.error.size(), 300000u);
    EXPECT_EQ(result.output.find_first_not_of('a'), std::string::npos);
    EXPECT_EQ(result.error.find_first_not_of('b'), std::string::npos);
}

TEST(ProcessRunnerTest, ChildIgnoringLargeInputDoesNotBreakTheRun) {
    ProcessRunner runner;
    const std::string input(1 << 20, 'x');
    const auto result = runner.Run("true", {}, input, "/");
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessRunnerTest, SignalledProcessHasNoExitCode) {
    ProcessRunner runner;
    const auto result = runner.Run(kShell, {"-c", "kill -9 $$"}, "", "/");
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, TimeoutKillsTheProcess) {
    ProcessRunner runner(std::chrono::milliseconds(200));
    const auto started = std::chrono::steady_clock::now();
    const auto result = runner.Run(kShell, {"-c", "echo partial; exec sleep 10"}, "", "/");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_EQ(result.output, "partial\n");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, TimeoutAppliesAfterStreamsAreClosed) {
    ProcessRunner runner(std::chrono::milliseconds(200));
    const auto started = std::chrono::steady_clock::now();
    const auto result = runner.Run(kShell, {"-c", "exec >&- 2>&- <&-; sleep 3"}, "", "/");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(ProcessRunnerTest, RunLeavesSigpipeIgnored) {
    ProcessRunner runner;
    runner.Run(kShell, {"-c", "exit 0"}, "", "/");

    struct sigaction current {};
    ASSERT_EQ(sigaction(SIGPIPE, nullptr, &current), 0);
    EXPECT_EQ(current.sa_handler, SIG_IGN);
}

TEST(ProcessRunnerTest, FastProcessFinishesWithinTimeout) {
    ProcessRunner runner(std::chrono::milliseconds(5000));
    const auto result = runner.Run("cat", {}, "fast", "/");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.output, "fast\n");
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessRunnerTest, UnknownCommandIsALaunchError) {
    ProcessRunner runner;
    EXPECT_THROW(runner.Run("ojrunner-no-such-tool", {}, "", "/"), runner::LaunchError);
}

TEST(ProcessRunnerTest, MissingAbsolutePathIsALaunchError) {
    testing::TempDir dir;
    ProcessRunner runner;
    EXPECT_THROW(runner.Run((dir.Path() / "missing").string(), {}, "", "/"), runner::LaunchError);
}

TEST(ProcessRunnerTest, NonExecutableFileIsALaunchError) {
    testing::TempDir dir;
    const auto path = testing::WriteFile(dir.Path() / "plain.txt", "not a program\n");
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    ProcessRunner runner;
    EXPECT_THROW(runner.Run(path.string(), {}, "", "/"), runner::LaunchError);
}

}  // namespace
}  // namespace ojrunner::process
