// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dnsrotor
{
namespace system
{

/// \brief Result of command execution with detailed information.
struct ExecutionResult
{
  int exitCode = -1;
  std::string output;
  std::string errorOutput;
  bool timedOut = false;
  bool execFailed = false; ///< fork/pipe/exec could not start the program
  std::chrono::milliseconds duration{0};

  bool succeeded() const { return !timedOut && !execFailed && exitCode == 0; }
};

/// \brief Options for command execution.
struct ExecutionOptions
{
  std::chrono::milliseconds timeout{0}; // 0 = no timeout
};

/// \brief Runs external programs without a shell and manages process liveness checks.
class ShellRunner
{
public:
  /// Exit status the child reports when execvp() itself fails.
  static constexpr int ExecFailureStatus = 127;

  /// \brief Runs argv[0] with the given arguments, capturing stdout and stderr.
  ///
  /// The program is looked up on PATH. When the timeout expires the child is
  /// killed with SIGKILL and reaped before returning. Never throws.
  static ExecutionResult execute(const std::vector<std::string> &argv,
                                 const ExecutionOptions &options = {})
  {
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result;

    if (argv.empty())
    {
      result.execFailed = true;
      result.errorOutput = "ShellRunner error: empty command";
      return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (!makePipe(outPipe) || !makePipe(errPipe))
    {
      result.execFailed = true;
      result.errorOutput = std::string("ShellRunner error: pipe failed: ") + std::strerror(errno);
      closeAll(outPipe, errPipe);
      return result;
    }

    // Built before fork: the child must not allocate.
    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
      result.execFailed = true;
      result.errorOutput = std::string("ShellRunner error: fork failed: ") + std::strerror(errno);
      closeAll(outPipe, errPipe);
      return result;
    }

    if (pid == 0)
    {
      childExec(args, outPipe[1], errPipe[1]);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);

    result.timedOut = !drain(outPipe[0], errPipe[0], result, start, options.timeout);
    ::close(outPipe[0]);
    ::close(errPipe[0]);

    if (result.timedOut)
    {
      ::kill(pid, SIGKILL);
    }

    int status = 0;
    if (waitpidWithEINTR(pid, &status, 0) == pid)
    {
      if (WIFEXITED(status))
      {
        result.exitCode = WEXITSTATUS(status);
      }
      else if (WIFSIGNALED(status))
      {
        result.exitCode = 128 + WTERMSIG(status);
      }
    }

    if (!result.timedOut && result.exitCode == ExecFailureStatus && result.output.empty())
    {
      result.execFailed = true;
      if (result.errorOutput.empty())
      {
        result.errorOutput = "ShellRunner error: cannot execute " + argv.front();
      }
    }

    result.duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    return result;
  }

  /// \brief Checks whether a process exists, using a zero signal.
  ///
  /// Works for any pid, not only children. EPERM means the process exists but
  /// belongs to another user, which counts as running.
  static bool isProcessRunning(pid_t pid)
  {
    if (pid <= 0)
    {
      return false;
    }
    if (::kill(pid, 0) == 0)
    {
      return true;
    }
    return errno == EPERM;
  }

  static pid_t waitpidWithEINTR(pid_t pid, int *status, int options)
  {
    while (true)
    {
      pid_t result = ::waitpid(pid, status, options);
      if (result == -1 && errno == EINTR)
      {
        continue;
      }
      return result;
    }
  }

private:
  static bool makePipe(int (&fds)[2])
  {
    if (::pipe(fds) != 0)
    {
      return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
  }

  static void closeAll(int (&a)[2], int (&b)[2])
  {
    for (int fd : {a[0], a[1], b[0], b[1]})
    {
      if (fd >= 0)
      {
        ::close(fd);
      }
    }
  }

  /// Reads both pipes until EOF. Returns false when the deadline passed first.
  static bool drain(int outFd, int errFd, ExecutionResult &result,
                    std::chrono::steady_clock::time_point start,
                    std::chrono::milliseconds timeout)
  {
    std::array<char, 4096> buffer;
    pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    int openCount = 2;

    while (openCount > 0)
    {
      int waitMs = -1;
      if (timeout.count() > 0)
      {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
        if (elapsed >= timeout)
        {
          return false;
        }
        waitMs = static_cast<int>((timeout - elapsed).count());
      }

      int rc = ::poll(fds, 2, waitMs);
      if (rc < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        // Treated like a timeout so the child is killed and reaped.
        return false;
      }
      if (rc == 0)
      {
        continue; // deadline re-checked at loop top
      }

      for (int i = 0; i < 2; ++i)
      {
        if (fds[i].fd < 0 || fds[i].revents == 0)
        {
          continue;
        }
        ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
        if (n > 0)
        {
          std::string &sink = i == 0 ? result.output : result.errorOutput;
          sink.append(buffer.data(), static_cast<std::size_t>(n));
        }
        else if (n == 0 || errno != EINTR)
        {
          fds[i].fd = -1;
          --openCount;
        }
      }
    }
    return true;
  }

  /// \brief Child side after fork: wire pipes to stdout/stderr and exec.
  [[noreturn]] static void childExec(std::vector<char *> &args, int outFd, int errFd)
  {
    // The parent may block SIGINT/SIGTERM for its signal thread; the command must not inherit that.
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    if (::dup2(outFd, STDOUT_FILENO) < 0 || ::dup2(errFd, STDERR_FILENO) < 0)
    {
      _exit(ExecFailureStatus);
    }
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0)
    {
      ::dup2(devNull, STDIN_FILENO);
      ::close(devNull);
    }

    ::execvp(args[0], args.data());

    const char msg[] = "exec failed\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(ExecFailureStatus);
  }
};

} // namespace system
} // namespace dnsrotor
