#include <gtest/gtest.h>

#include <signal.h>

#include <chrono>
#include <string>
#include <vector>

#include "codetrace/driver/process_runner.hpp"
#include "codetrace/test_support/test_helpers.hpp"

using namespace std::chrono_literals;
using codetrace::test_support::TempDir;

namespace
{

codetrace::ProcessResult sh(const std::string & script, std::chrono::milliseconds timeout = 10s)
{
  return codetrace::run_process({"/bin/sh", "-c", script}, timeout);
}

}  // namespace

TEST(ProcessRunnerTest, CapturesStdoutAndStderrSeparately)
{
  const auto result = sh("printf 'out'; printf 'err' >&2");
  EXPECT_TRUE(result.exited_cleanly());
  EXPECT_EQ(result.stdout_text, "out");
  EXPECT_EQ(result.stderr_text, "err");
}

TEST(ProcessRunnerTest, KeepsNulBytes)
{
  const auto result = sh("printf 'a\\000b\\n'");
  EXPECT_EQ(result.stdout_text, std::string("a\0b\n", 4));
}

TEST(ProcessRunnerTest, ReportsExitCode)
{
  const auto result = sh("exit 3");
  EXPECT_FALSE(result.exited_cleanly());
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.signal, 0);
  EXPECT_FALSE(result.timed_out);
  EXPECT_FALSE(result.launch_failed);
}

TEST(ProcessRunnerTest, ReportsTerminatingSignal)
{
  const auto result = sh("kill -SEGV $$");
  EXPECT_EQ(result.signal, SIGSEGV);
  EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
  EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, StdinIsEmpty)
{
  const auto result = sh("cat; echo done");
  EXPECT_TRUE(result.exited_cleanly());
  EXPECT_EQ(result.stdout_text, "done\n");
}

TEST(ProcessRunnerTest, KillsProgramsThatOverrunTheDeadline)
{
  const auto start = std::chrono::steady_clock::now();
  const auto result = sh("echo partial; sleep 5", 200ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.signal, SIGKILL);
  EXPECT_TRUE(result.stdout_text.empty());
  EXPECT_LT(elapsed, 4s);
}

TEST(ProcessRunnerTest, MissingProgramIsALaunchFailure)
{
  const auto result =
    codetrace::run_process({"/nonexistent/codetrace-test-binary"}, std::chrono::milliseconds(1000));
  EXPECT_TRUE(result.launch_failed);
  EXPECT_EQ(result.exit_code, codetrace::k_launch_failure_exit_code);
  EXPECT_NE(result.error.find("/nonexistent/codetrace-test-binary"), std::string::npos);
}

TEST(ProcessRunnerTest, EmptyCommandIsALaunchFailure)
{
  const auto result = codetrace::run_process({}, std::chrono::milliseconds(1000));
  EXPECT_TRUE(result.launch_failed);
  EXPECT_EQ(result.error, "empty command");
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory)
{
  TempDir dir;
  dir.write("marker.txt", "here");
  const auto result =
    codetrace::run_process({"/bin/sh", "-c", "cat marker.txt"}, 10s, dir.path().string());
  EXPECT_TRUE(result.exited_cleanly());
  EXPECT_EQ(result.stdout_text, "here");
}

TEST(ProcessRunnerTest, LargeOutputDoesNotDeadlock)
{
  const auto result =
    sh("i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done");
  EXPECT_TRUE(result.exited_cleanly());
  EXPECT_GT(result.stdout_text.size(), 65536U);
  EXPECT_GT(result.stderr_text.size(), 65536U);
}

// ============================================================================
// Command templates
// ============================================================================

TEST(ProcessRunnerTest, ExpandsPlaceholders)
{
  const auto argv = codetrace::expand_command(
    {"gcc", "{source}", "-o", "{executable}", "-DNAME={source}.x"},
    {{"source", "/tmp/a.c"}, {"executable", "/tmp/a.out"}});
  EXPECT_EQ(
    argv, (std::vector<std::string>{"gcc", "/tmp/a.c", "-o", "/tmp/a.out", "-DNAME=/tmp/a.c.x"}));
}

TEST(ProcessRunnerTest, UnknownPlaceholdersAreLeftAlone)
{
  const auto argv =
    codetrace::expand_command({"{unknown}", "{", "a{b", "{source}}"}, {{"source", "s"}});
  EXPECT_EQ(argv, (std::vector<std::string>{"{unknown}", "{", "a{b", "s}"}));
}

TEST(ProcessRunnerTest, FormatsCommandForLogs)
{
  EXPECT_EQ(codetrace::format_command({"python3", "prog.py"}), "python3 prog.py");
  EXPECT_EQ(codetrace::format_command({}), "");
}
