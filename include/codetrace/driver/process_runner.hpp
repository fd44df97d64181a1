// codetrace/driver/process_runner.hpp - Child process execution with a deadline
#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace codetrace
{

/// Exit code reported when the program could not be started
inline constexpr int k_launch_failure_exit_code = 127;

/**
 * Outcome of one child process.
 */
struct ProcessResult
{
  /// Exit status; k_launch_failure_exit_code if the program could not start
  int exit_code = 0;

  /// Terminating signal, 0 if the process exited normally
  int signal = 0;

  std::string stdout_text;
  std::string stderr_text;

  /// The deadline passed and the process was killed; output is discarded
  bool timed_out = false;

  /// fork/exec failed; `error` holds the reason
  bool launch_failed = false;
  std::string error;

  [[nodiscard]] bool exited_cleanly() const noexcept
  {
    return !timed_out && !launch_failed && signal == 0 && exit_code == 0;
  }
};

/**
 * Run a program and capture its output.
 *
 * The program is looked up on PATH, reads from /dev/null and runs in its
 * own process group. When `timeout` elapses the whole group is killed with
 * SIGKILL.
 *
 * @param argv Program and arguments; must not be empty
 * @param timeout Wall-clock limit
 * @param working_dir Directory to run in; empty keeps the current one
 */
[[nodiscard]] ProcessResult run_process(
  const std::vector<std::string> & argv, std::chrono::milliseconds timeout,
  const std::string & working_dir = {});

/**
 * Replace `{name}` placeholders in every argument.
 *
 * Unknown placeholders are left untouched.
 */
[[nodiscard]] std::vector<std::string> expand_command(
  const std::vector<std::string> & command, const std::map<std::string, std::string> & values);

/// Arguments joined by spaces, for log messages
[[nodiscard]] std::string format_command(const std::vector<std::string> & argv);

}  // namespace codetrace
