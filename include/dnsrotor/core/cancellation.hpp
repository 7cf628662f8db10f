// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dnsrotor
{
namespace core
{

/// \brief One-shot stop request shared between the signal thread and the loop.
class CancellationToken
{
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _cancelled = true;
    }
    _cv.notify_all();
  }

  bool isCancelled() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _cancelled;
  }

  /// \brief Sleeps up to \p timeout. Returns true if cancelled before or during the wait.
  template <typename Rep, typename Period>
  bool waitFor(const std::chrono::duration<Rep, Period> &timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_for(lock, timeout, [this] { return _cancelled; });
  }

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  bool _cancelled = false;
};

} // namespace core
} // namespace dnsrotor
