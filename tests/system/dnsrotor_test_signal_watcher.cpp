// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <filesystem>
#include <sys/wait.h>

using dnsrotor::system::InstanceLock;
using dnsrotor::system::ShellRunner;
using dnsrotor::system::SignalWatcher;

namespace
{
/// Runs \p body in a forked child and returns its wait status. Signal masks
/// only ever change in the child, never in the test process.
template <typename Body> int inChild(Body body)
{
  pid_t child = ::fork();
  if (child == 0)
  {
    _exit(body());
  }
  int status = 0;
  ShellRunner::waitpidWithEINTR(child, &status, 0);
  return status;
}
} // namespace

TEST_CASE("Shutdown signal reaches the handler once", "[signal]")
{
  dnsrotor::test::initializeTestLogging();

  int status = inChild(
    []
    {
      SignalWatcher::blockShutdownSignals();
      std::atomic<int> received{0};
      std::atomic<int> calls{0};
      dnsrotor::core::CancellationToken token;
      bool cancelled = false;
      {
        SignalWatcher watcher(
          [&](int signo)
          {
            received = signo;
            ++calls;
            token.cancel();
          });
        ::kill(::getpid(), SIGINT);
        cancelled = token.waitFor(std::chrono::seconds(5));
      }
      return cancelled && received == SIGINT && calls == 1 ? 0 : 1;
    });

  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 0);
}

TEST_CASE("Stopping the watcher does not call the handler", "[signal]")
{
  dnsrotor::test::initializeTestLogging();

  int status = inChild(
    []
    {
      SignalWatcher::blockShutdownSignals();
      std::atomic<bool> called{false};
      {
        SignalWatcher watcher([&](int) { called = true; });
      }
      return called ? 1 : 0;
    });

  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 0);
}

TEST_CASE("SIGTERM during a one-shot command releases the lock", "[signal][lock]")
{
  dnsrotor::test::initializeTestLogging();
  dnsrotor::test::TempDirManager dir;
  std::string lockPath = dir.filePath("dnsrotor.pid");

  pid_t child = ::fork();
  if (child == 0)
  {
    SignalWatcher::blockShutdownSignals();
    InstanceLock lock(lockPath);
    if (!lock.acquire())
    {
      _exit(2);
    }
    SignalWatcher watcher([&lock](int signo) { dnsrotor::system::exitOnSignal(lock, signo); });

    // Stands in for an apply that hangs on a slow privileged command.
    dnsrotor::system::ExecutionOptions options;
    options.timeout = std::chrono::seconds(20);
    ShellRunner::execute({"sleep", "10"}, options);
    _exit(3);
  }

  InstanceLock observer(lockPath);
  REQUIRE(dnsrotor::test::waitFor([&] { return observer.readPid() == child; }));
  REQUIRE(::kill(child, SIGTERM) == 0);

  int status = 0;
  REQUIRE(ShellRunner::waitpidWithEINTR(child, &status, 0) == child);
  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 128 + SIGTERM);
  REQUIRE_FALSE(std::filesystem::exists(lockPath));
}

TEST_CASE("Commands do not inherit the blocked shutdown signals", "[signal][shell]")
{
  dnsrotor::test::initializeTestLogging();

  int status = inChild(
    []
    {
      SignalWatcher::blockShutdownSignals();
      dnsrotor::system::ExecutionOptions options;
      options.timeout = std::chrono::seconds(10);
      auto result = ShellRunner::execute({"sh", "-c", "kill -TERM $$; sleep 5"}, options);
      return !result.timedOut && result.exitCode == 128 + SIGTERM ? 0 : 1;
    });

  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 0);
}
