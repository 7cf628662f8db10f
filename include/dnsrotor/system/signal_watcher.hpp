// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <pthread.h>
#include <signal.h>

#include "dnsrotor/core/logger.hpp"
#include "dnsrotor/system/instance_lock.hpp"

namespace dnsrotor
{
namespace system
{

/// \brief Delivers SIGINT and SIGTERM to a handler on a dedicated thread.
///
/// blockShutdownSignals() must run in the main thread before any other thread
/// is created, so every thread inherits the mask and only the watcher's
/// sigwait() ever sees the signals. The handler runs at most once. Destroying
/// the watcher stops and joins the thread without calling the handler.
class SignalWatcher
{
public:
  using Handler = std::function<void(int)>;

  static sigset_t shutdownSignals()
  {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    return signals;
  }

  /// \throws std::runtime_error if the mask cannot be changed
  static void blockShutdownSignals()
  {
    sigset_t signals = shutdownSignals();
    int rc = ::pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    if (rc != 0)
    {
      throw std::runtime_error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
  }

  explicit SignalWatcher(Handler handler) : _handler(std::move(handler))
  {
    _thread = std::thread([this] { watch(); });
  }

  ~SignalWatcher() { stop(); }

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  /// \brief Wakes the watcher if it is still waiting and joins it.
  void stop()
  {
    if (!_thread.joinable())
    {
      return;
    }
    _stopping = true;
    // Thread-directed, so only this watcher's sigwait() consumes it.
    ::pthread_kill(_thread.native_handle(), SIGTERM);
    _thread.join();
  }

private:
  void watch()
  {
    sigset_t signals = shutdownSignals();
    int received = 0;
    int rc = ::sigwait(&signals, &received);
    if (rc != 0)
    {
      DNSROTOR_LOG_ERROR("sigwait failed: " << std::strerror(rc));
      return;
    }
    if (_stopping)
    {
      return;
    }

    DNSROTOR_LOG_INFO("Received signal " << received << ", shutting down gracefully");
    try
    {
      _handler(received);
    }
    catch (const std::exception &e)
    {
      DNSROTOR_LOG_ERROR("Signal handler failed: " << e.what());
    }
  }

  Handler _handler;
  std::atomic<bool> _stopping{false};
  std::thread _thread;
};

/// \brief Releases \p lock, flushes the log and terminates with status 128 + \p signo.
///
/// For one-shot commands, which have no loop to cancel. Commands already
/// started through ShellRunner are left to finish on their own.
[[noreturn]] inline void exitOnSignal(InstanceLock &lock, int signo)
{
  lock.release();
  DNSROTOR_LOG_WARN("Interrupted by signal " << signo << ", lock released");
  core::Logger::shutdown();
  std::_Exit(128 + signo);
}

} // namespace system
} // namespace dnsrotor
