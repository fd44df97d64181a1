// codetrace/driver/process_runner.cpp - fork/exec with captured output and a deadline
#include "codetrace/driver/process_runner.hpp"

#include <fcntl.h>
#include <fmt/core.h>
#include <poll.h>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace codetrace
{

namespace
{

using Clock = std::chrono::steady_clock;

/// Pipe file descriptors closed on scope exit
class Pipe
{
public:
  Pipe() = default;
  Pipe(const Pipe &) = delete;
  Pipe & operator=(const Pipe &) = delete;
  ~Pipe()
  {
    close_read();
    close_write();
  }

  [[nodiscard]] bool open() { return ::pipe2(fds_.data(), O_CLOEXEC) == 0; }

  [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
  [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

  void close_read() noexcept { close_fd(fds_[0]); }
  void close_write() noexcept { close_fd(fds_[1]); }

private:
  static void close_fd(int & fd) noexcept
  {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  std::array<int, 2> fds_{-1, -1};
};

ProcessResult launch_failure(std::string error)
{
  ProcessResult result;
  result.exit_code = k_launch_failure_exit_code;
  result.launch_failed = true;
  result.error = std::move(error);
  return result;
}

/// Child side: wire up descriptors and exec; reports errno through `status`
[[noreturn]] void exec_child(
  const std::vector<std::string> & argv, const std::string & working_dir, Pipe & out, Pipe & err,
  Pipe & status)
{
  ::setpgid(0, 0);

  const int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    ::dup2(null_fd, STDIN_FILENO);
    ::close(null_fd);
  }
  ::dup2(out.write_end(), STDOUT_FILENO);
  ::dup2(err.write_end(), STDERR_FILENO);

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto & arg : argv) {
    cargv.push_back(const_cast<char *>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  if (working_dir.empty() || ::chdir(working_dir.c_str()) == 0) {
    ::execvp(cargv[0], cargv.data());
  }

  const int code = errno;
  ssize_t written = ::write(status.write_end(), &code, sizeof(code));
  (void)written;
  _exit(k_launch_failure_exit_code);
}

/// Wait for exec to succeed (EOF on the CLOEXEC pipe) or report its errno
int read_exec_errno(Pipe & status)
{
  int code = 0;
  ssize_t n = 0;
  do {
    n = ::read(status.read_end(), &code, sizeof(code));
  } while (n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(sizeof(code)) ? code : 0;
}

void kill_group(pid_t pid)
{
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
}

int remaining_ms(Clock::time_point deadline)
{
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // namespace

ProcessResult run_process(
  const std::vector<std::string> & argv, std::chrono::milliseconds timeout,
  const std::string & working_dir)
{
  if (argv.empty() || argv.front().empty()) {
    return launch_failure("empty command");
  }

  Pipe out;
  Pipe err;
  Pipe status;
  if (!out.open() || !err.open() || !status.open()) {
    return launch_failure(fmt::format("cannot create pipe: {}", std::strerror(errno)));
  }

  spdlog::debug("running: {}", format_command(argv));

  const pid_t pid = ::fork();
  if (pid < 0) {
    return launch_failure(fmt::format("fork failed: {}", std::strerror(errno)));
  }
  if (pid == 0) {
    exec_child(argv, working_dir, out, err, status);
  }

  out.close_write();
  err.close_write();
  status.close_write();

  if (const int code = read_exec_errno(status); code != 0) {
    int wstatus = 0;
    ::waitpid(pid, &wstatus, 0);
    return launch_failure(
      fmt::format("cannot execute '{}': {}", argv.front(), std::strerror(code)));
  }

  ProcessResult result;
  const Clock::time_point deadline = Clock::now() + timeout;

  // Drain both pipes until EOF or the deadline
  std::array<pollfd, 2> fds{{{out.read_end(), POLLIN, 0}, {err.read_end(), POLLIN, 0}}};
  std::array<std::string *, 2> sinks{&result.stdout_text, &result.stderr_text};
  size_t open_streams = fds.size();
  std::array<char, 4096> buffer{};

  while (open_streams > 0 && !result.timed_out) {
    const int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      result.timed_out = true;
      break;
    }
    const int ready = ::poll(fds.data(), fds.size(), wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      spdlog::warn("poll failed: {}", std::strerror(errno));
      result.timed_out = true;
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (n > 0) {
        sinks[i]->append(buffer.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  // The streams may close before the process exits
  int wstatus = 0;
  while (!result.timed_out) {
    const pid_t r = ::waitpid(pid, &wstatus, WNOHANG);
    if (r == pid) {
      break;
    }
    if (r < 0 && errno != EINTR) {
      spdlog::warn("waitpid failed: {}", std::strerror(errno));
      break;
    }
    if (remaining_ms(deadline) == 0) {
      result.timed_out = true;
      break;
    }
    ::usleep(2000);
  }

  if (result.timed_out) {
    spdlog::warn("'{}' exceeded {} ms; killing", argv.front(), timeout.count());
    kill_group(pid);
    ::waitpid(pid, &wstatus, 0);
    result.stdout_text.clear();
    result.stderr_text.clear();
    result.exit_code = -1;
    result.signal = SIGKILL;
    return result;
  }

  if (WIFEXITED(wstatus)) {
    result.exit_code = WEXITSTATUS(wstatus);
  } else if (WIFSIGNALED(wstatus)) {
    result.signal = WTERMSIG(wstatus);
    result.exit_code = 128 + result.signal;
  }
  spdlog::debug("'{}' finished: exit {}, signal {}", argv.front(), result.exit_code, result.signal);
  return result;
}

std::vector<std::string> expand_command(
  const std::vector<std::string> & command, const std::map<std::string, std::string> & values)
{
  std::vector<std::string> expanded;
  expanded.reserve(command.size());
  for (const auto & arg : command) {
    std::string out;
    size_t pos = 0;
    while (pos < arg.size()) {
      const size_t open = arg.find('{', pos);
      const size_t close = open == std::string::npos ? open : arg.find('}', open);
      if (close == std::string::npos) {
        out.append(arg, pos, std::string::npos);
        break;
      }
      out.append(arg, pos, open - pos);
      const auto it = values.find(arg.substr(open + 1, close - open - 1));
      if (it != values.end()) {
        out += it->second;
      } else {
        out.append(arg, open, close - open + 1);
      }
      pos = close + 1;
    }
    expanded.push_back(std::move(out));
  }
  return expanded;
}

std::string format_command(const std::vector<std::string> & argv)
{
  std::string out;
  for (const auto & arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += arg;
  }
  return out;
}

}  // namespace codetrace
