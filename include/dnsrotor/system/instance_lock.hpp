// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include "dnsrotor/core/logger.hpp"
#include "dnsrotor/system/shell_runner.hpp"

namespace dnsrotor
{
namespace system
{

/// \brief Single-instance guard backed by a PID file.
///
/// The file holds the decimal pid of the holder. A file naming a process that
/// no longer exists, or holding anything but a number, is treated as orphaned
/// and reclaimed.
class InstanceLock
{
public:
  explicit InstanceLock(std::string path, pid_t pid = ::getpid())
    : _path(std::move(path)), _pid(pid)
  {
  }

  ~InstanceLock()
  {
    try
    {
      if (_held)
      {
        release();
      }
    }
    catch (const std::exception &e)
    {
      DNSROTOR_LOG_ERROR("Failed to release lock file " << _path << ": " << e.what());
    }
  }

  InstanceLock(const InstanceLock &) = delete;
  InstanceLock &operator=(const InstanceLock &) = delete;

  /// \brief Takes the lock. Returns false if a live process holds it or on I/O failure.
  bool acquire()
  {
    std::error_code ec;
    if (std::filesystem::exists(_path, ec))
    {
      std::optional<pid_t> holder = readPid();
      if (holder && *holder != _pid && ShellRunner::isProcessRunning(*holder))
      {
        DNSROTOR_LOG_ERROR("Another instance is already running (PID " << *holder << ")");
        return false;
      }

      if (holder)
      {
        DNSROTOR_LOG_WARN("Removing stale lock file " << _path << " (PID " << *holder << ")");
      }
      else
      {
        DNSROTOR_LOG_WARN("Removing corrupt lock file " << _path);
      }
      if (::unlink(_path.c_str()) != 0 && errno != ENOENT)
      {
        DNSROTOR_LOG_ERROR("Cannot remove lock file " << _path << ": " << std::strerror(errno));
        return false;
      }
    }

    std::filesystem::path parent = std::filesystem::path(_path).parent_path();
    if (!parent.empty())
    {
      std::filesystem::create_directories(parent, ec);
    }

    int fd = ::open(_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0)
    {
      DNSROTOR_LOG_ERROR("Cannot create lock file " << _path << ": " << std::strerror(errno));
      return false;
    }

    std::string content = std::to_string(_pid) + "\n";
    ssize_t written = ::write(fd, content.data(), content.size());
    bool ok = written == static_cast<ssize_t>(content.size());
    if (::close(fd) != 0)
    {
      ok = false;
    }
    if (!ok)
    {
      DNSROTOR_LOG_ERROR("Cannot write lock file " << _path);
      ::unlink(_path.c_str());
      return false;
    }

    _held = true;
    DNSROTOR_LOG_DEBUG("Acquired lock file " << _path << " (PID " << _pid << ")");
    return true;
  }

  /// \brief Removes the file if it still names this process. Safe to call repeatedly.
  void release()
  {
    _held = false;

    std::error_code ec;
    if (!std::filesystem::exists(_path, ec))
    {
      return;
    }

    std::optional<pid_t> holder = readPid();
    if (!holder || *holder != _pid)
    {
      DNSROTOR_LOG_WARN("Lock file " << _path << " is not ours, leaving it in place");
      return;
    }

    if (::unlink(_path.c_str()) != 0 && errno != ENOENT)
    {
      DNSROTOR_LOG_ERROR("Cannot remove lock file " << _path << ": " << std::strerror(errno));
      return;
    }
    DNSROTOR_LOG_DEBUG("Released lock file " << _path);
  }

  bool held() const { return _held; }

  const std::string &path() const { return _path; }

  pid_t pid() const { return _pid; }

  /// \brief Reads the pid stored in the file, or nullopt if missing or not a number.
  std::optional<pid_t> readPid() const
  {
    std::ifstream in(_path);
    if (!in)
    {
      return std::nullopt;
    }
    std::string line;
    std::getline(in, line);
    auto first = line.find_first_not_of(" \t\r");
    auto last = line.find_last_not_of(" \t\r");
    if (first == std::string::npos)
    {
      return std::nullopt;
    }
    line = line.substr(first, last - first + 1);
    if (line.find_first_not_of("0123456789") != std::string::npos || line.size() > 10)
    {
      return std::nullopt;
    }
    long value = std::stol(line);
    if (value <= 0 || value > 0x7fffffffL)
    {
      return std::nullopt;
    }
    return static_cast<pid_t>(value);
  }

private:
  std::string _path;
  pid_t _pid;
  bool _held = false;
};

} // namespace system
} // namespace dnsrotor
