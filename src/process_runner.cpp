/**
 * @file process_runner.cpp
 * @brief fork/exec based command execution
 *
 * @details The parent drains the output pipe with poll() until EOF or the
 *          deadline, then reaps the child. On timeout the child's process
 *          group receives SIGKILL before it is reaped, so no engine process
 *          outlives the call.
 */

#include "hls_variants/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace hls_variants {

namespace {

using Clock = std::chrono::steady_clock;

/// Message written by the child when exec fails (async-signal-safe path)
constexpr char EXEC_FAILED_MSG[] = "exec failed: command not found or not executable\n";

/// Exit status of a child whose exec failed, as in POSIX shells
constexpr int EXEC_FAILED_STATUS = 127;

/// Child side: wire up fds and exec. Never returns.
[[noreturn]] void exec_child(int out_fd, char *const *args) {
  setpgid(0, 0);

  int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    dup2(null_fd, STDIN_FILENO);
    ::close(null_fd);
  }
  dup2(out_fd, STDOUT_FILENO);
  dup2(out_fd, STDERR_FILENO);
  ::close(out_fd);

  execvp(args[0], args);

  ssize_t ignored = ::write(STDERR_FILENO, EXEC_FAILED_MSG,
                            sizeof(EXEC_FAILED_MSG) - 1);
  (void)ignored;
  _exit(EXEC_FAILED_STATUS);
}

long long remaining_ms(Clock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                               Clock::now())
      .count();
}

void decode_status(int status, ProcessResult &result) {
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
}

/// Hand complete lines in @p pending to the handler; keep the rest
void dispatch_lines(std::string &pending, const LineHandler &on_line,
                    std::string &diagnostics) {
  size_t start = 0;
  size_t nl;
  while ((nl = pending.find('\n', start)) != std::string::npos) {
    std::string line = pending.substr(start, nl - start);
    if (!on_line(line)) {
      diagnostics += line;
      diagnostics += '\n';
    }
    start = nl + 1;
  }
  pending.erase(0, start);
}

} // anonymous namespace

ProcessResult run_process(const std::vector<std::string> &argv,
                          int timeout_sec, const LineHandler &on_line) {
  ProcessResult result;
  if (argv.empty()) {
    result.diagnostics = "empty command";
    return result;
  }

  /// Build the exec argument vector before forking
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    result.diagnostics = fmt::format("pipe failed: {}", std::strerror(errno));
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    result.diagnostics = fmt::format("fork failed: {}", std::strerror(errno));
    ::close(fds[0]);
    ::close(fds[1]);
    return result;
  }
  if (pid == 0) {
    ::close(fds[0]);
    exec_child(fds[1], args.data());
  }

  /// Parent: mirror setpgid so kill(-pid) works even if the child has not
  /// run yet. EACCES after the child exec'd is harmless.
  setpgid(pid, pid);
  ::close(fds[1]);
  result.spawned = true;

  const bool bounded = timeout_sec > 0;
  const auto deadline = Clock::now() + std::chrono::seconds(timeout_sec);

  // **---- Drain output until EOF or deadline ----**

  char buf[4096];
  std::string pending;
  bool open = true;
  while (open) {
    int wait_ms = -1;
    if (bounded) {
      long long left = remaining_ms(deadline);
      if (left <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(left, 1000));
    }

    pollfd pfd{fds[0], POLLIN, 0};
    int rc = poll(&pfd, 1, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (rc == 0)
      continue;

    ssize_t n = ::read(fds[0], buf, sizeof(buf));
    if (n > 0) {
      if (on_line) {
        pending.append(buf, static_cast<size_t>(n));
        dispatch_lines(pending, on_line, result.diagnostics);
      } else {
        result.diagnostics.append(buf, static_cast<size_t>(n));
      }
    } else if (n == 0) {
      open = false;
    } else if (errno != EINTR && errno != EAGAIN) {
      open = false;
    }
  }
  ::close(fds[0]);

  /// Unterminated last line
  if (!pending.empty() && !on_line(pending)) {
    result.diagnostics += pending;
  }

  // **---- Reap ----**

  int status = 0;
  bool reaped = false;

  /// Output closed but the process may still linger: keep honoring the
  /// deadline while waiting for it.
  if (bounded && !result.timed_out) {
    while (true) {
      pid_t r = waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        reaped = true;
        break;
      }
      if (r < 0 && errno != EINTR)
        break;
      if (remaining_ms(deadline) <= 0) {
        result.timed_out = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  if (result.timed_out) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    result.diagnostics +=
        fmt::format("\nprocess exceeded {}s and was killed", timeout_sec);
  }

  if (!reaped) {
    pid_t r;
    do {
      r = waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    reaped = (r == pid);
  }

  if (reaped) {
    decode_status(status, result);
  }
  return result;
}

std::string format_command(const std::vector<std::string> &argv) {
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      line += ' ';
    if (argv[i].find(' ') != std::string::npos)
      line += fmt::format("\"{}\"", argv[i]);
    else
      line += argv[i];
  }
  return line;
}

std::string describe_failure(const ProcessResult &result) {
  if (!result.spawned)
    return "could not start process";
  if (result.timed_out)
    return "timed out";
  if (result.term_signal != 0)
    return fmt::format("killed by signal {}", result.term_signal);
  return fmt::format("exit code {}", result.exit_code);
}

} // namespace hls_variants
