// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <pwd.h>
#include <unistd.h>

#include "dnsrotor/core/config_loader.hpp"
#include "dnsrotor/core/logger.hpp"
#include "dnsrotor/dns/resolver_pair.hpp"
#include "dnsrotor/system/dns_configurator.hpp"

namespace dnsrotor
{
namespace core
{

/// \brief Raw configuration as given on the command line and in TOML.
///
/// Every field is optional: a set value was given explicitly, an unset one
/// falls through to the next layer and finally to the Settings default.
struct Config
{
  struct GeneralConfig
  {
    std::optional<std::int64_t> interval;
    std::optional<std::string> interface;
  } general;
  struct HealthConfig
  {
    std::optional<std::int64_t> probeTimeout;
    std::optional<std::int64_t> cacheTtl;
    std::optional<std::int64_t> maxRetries;
  } health;
  struct SystemConfig
  {
    std::optional<std::string> platform;
    std::optional<std::int64_t> commandTimeout;
    std::optional<std::vector<std::string>> privilegePrefix;
    std::optional<std::string> lockFile;
  } system;
  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> directory;
    std::optional<std::int64_t> retentionDays;
    std::optional<bool> console;
    std::optional<std::string> format;
  } log;
  struct ServersConfig
  {
    std::optional<std::vector<std::pair<std::string, std::string>>> candidates;
  } servers;

  // Configuration file path (used for CLI parsing)
  std::optional<std::string> configFile;
};

/// \brief Fills every field of \p config that is still unset from \p loader.
///
/// Keys live under the "dnsrotor." prefix, e.g. "dnsrotor.general.interval".
/// \throws std::runtime_error if a candidate list has the wrong shape
inline void applyToml(Config &config, const ConfigLoader &loader)
{
  auto fill = [](auto &field, auto value)
  {
    if (!field.has_value() && value.has_value())
    {
      field = *value;
    }
  };

  fill(config.general.interval, loader.getInt("dnsrotor.general.interval"));
  fill(config.general.interface, loader.getString("dnsrotor.general.interface"));

  fill(config.health.probeTimeout, loader.getInt("dnsrotor.health.probe_timeout"));
  fill(config.health.cacheTtl, loader.getInt("dnsrotor.health.cache_ttl"));
  fill(config.health.maxRetries, loader.getInt("dnsrotor.health.max_retries"));

  fill(config.system.platform, loader.getString("dnsrotor.system.platform"));
  fill(config.system.commandTimeout, loader.getInt("dnsrotor.system.command_timeout"));
  fill(config.system.privilegePrefix, loader.getStringArray("dnsrotor.system.privilege_prefix"));
  fill(config.system.lockFile, loader.getString("dnsrotor.system.lock_file"));

  fill(config.log.level, loader.getString("dnsrotor.log.level"));
  fill(config.log.directory, loader.getString("dnsrotor.log.directory"));
  fill(config.log.retentionDays, loader.getInt("dnsrotor.log.retention_days"));
  fill(config.log.console, loader.getBool("dnsrotor.log.console"));
  fill(config.log.format, loader.getString("dnsrotor.log.format"));

  fill(config.servers.candidates, loader.getStringPairs("dnsrotor.servers.candidates"));
}

/// \brief Home directory of the current user, from $HOME or the password database.
inline std::string homeDirectory()
{
  if (const char *home = std::getenv("HOME"))
  {
    if (*home)
    {
      return home;
    }
  }
  if (const passwd *pw = ::getpwuid(::getuid()))
  {
    if (pw->pw_dir)
    {
      return pw->pw_dir;
    }
  }
  return ".";
}

/// \brief Per-user directory used when system locations are not writable.
inline std::string userStateDirectory() { return homeDirectory() + "/.dnsrotor"; }

/// \brief Configuration files tried in order when none is given explicitly.
inline std::vector<std::string> configSearchPaths(const std::string &executablePath = "")
{
  std::vector<std::string> paths = {
    "/etc/dnsrotor/dnsrotor.toml",
    "/usr/local/etc/dnsrotor/dnsrotor.toml",
    userStateDirectory() + "/dnsrotor.toml",
  };
  if (!executablePath.empty())
  {
    std::filesystem::path exe(executablePath);
    paths.push_back((exe.parent_path() / "dnsrotor.toml").string());
  }
  return paths;
}

/// \brief First existing file from configSearchPaths(), or nullopt.
inline std::optional<std::string> discoverConfigFile(const std::string &executablePath = "")
{
  for (const auto &path : configSearchPaths(executablePath))
  {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec))
    {
      return path;
    }
  }
  return std::nullopt;
}

/// \brief Validated, fully defaulted runtime settings.
///
/// Built once at startup and passed to the components that need it.
struct Settings
{
  static constexpr std::int64_t DefaultInterval = 300;
  static constexpr const char *AutoInterface = "auto";
  static constexpr const char *DefaultLogDirectory = "/var/log/dnsrotor";
  static constexpr const char *DefaultLockFile = "/var/run/dnsrotor.pid";
  static constexpr const char *LogBaseName = "dnsrotor";
  /// Upper bound for probe and command timeouts, in seconds.
  static constexpr std::int64_t MaxTimeoutSeconds = 3600;
  /// Upper bound for the health cache TTL, in seconds (one week).
  static constexpr std::int64_t MaxCacheTtlSeconds = 604800;

  std::int64_t interval = DefaultInterval;
  std::string interface = AutoInterface;

  std::chrono::seconds probeTimeout{2};
  std::chrono::seconds cacheTtl{1800};
  int maxRetries = 5;

  system::Platform platform = system::hostPlatform();
  std::chrono::seconds commandTimeout{10};
  std::vector<std::string> privilegePrefix = system::CommandDnsConfigurator::defaultPrivilegePrefix(
    system::hostPlatform());
  std::string lockFile; ///< empty until resolvePaths()

  Logger::Level logLevel = Logger::Level::Info;
  std::string logDirectory = DefaultLogDirectory;
  int logRetentionDays = 7;
  bool logConsole = true;
  std::optional<std::string> logFormat;

  dns::CandidateList candidates = dns::defaultCandidates();

  bool autoDetectInterface() const { return interface.empty() || interface == AutoInterface; }

  /// \brief Path of the log file base, "<directory>/dnsrotor".
  std::string logFilePath() const
  {
    return (std::filesystem::path(logDirectory) / LogBaseName).string();
  }

  /// \brief Resolves \p config against the defaults and validates the result.
  /// \throws std::invalid_argument on any out-of-range or malformed value
  static Settings fromConfig(const Config &config)
  {
    Settings s;

    if (config.general.interval)
    {
      s.interval = *config.general.interval;
    }
    if (config.general.interface)
    {
      s.interface = *config.general.interface;
    }

    if (config.health.probeTimeout)
    {
      s.probeTimeout = boundedSeconds("health.probe_timeout", *config.health.probeTimeout,
                                      MaxTimeoutSeconds);
    }
    if (config.health.cacheTtl)
    {
      s.cacheTtl = boundedSeconds("health.cache_ttl", *config.health.cacheTtl, MaxCacheTtlSeconds);
    }
    if (config.health.maxRetries)
    {
      if (*config.health.maxRetries < 1 || *config.health.maxRetries > 1000)
      {
        throw std::invalid_argument("health.max_retries must be between 1 and 1000, got " +
                                    std::to_string(*config.health.maxRetries));
      }
      s.maxRetries = static_cast<int>(*config.health.maxRetries);
    }

    if (config.system.platform && *config.system.platform != "auto")
    {
      auto platform = system::platformFromString(*config.system.platform);
      if (!platform)
      {
        throw std::invalid_argument("Unknown platform: " + *config.system.platform);
      }
      s.platform = *platform;
    }
    s.privilegePrefix = config.system.privilegePrefix
                          ? *config.system.privilegePrefix
                          : system::CommandDnsConfigurator::defaultPrivilegePrefix(s.platform);
    if (config.system.commandTimeout)
    {
      s.commandTimeout = boundedSeconds("system.command_timeout",
                                        *config.system.commandTimeout, MaxTimeoutSeconds);
    }
    if (config.system.lockFile)
    {
      s.lockFile = *config.system.lockFile;
    }

    if (config.log.level)
    {
      auto level = Logger::levelFromString(*config.log.level);
      if (!level)
      {
        throw std::invalid_argument("Unknown log level: " + *config.log.level);
      }
      s.logLevel = *level;
    }
    if (config.log.directory)
    {
      s.logDirectory = *config.log.directory;
    }
    if (config.log.retentionDays)
    {
      if (*config.log.retentionDays < 0)
      {
        throw std::invalid_argument("log.retention_days must not be negative");
      }
      s.logRetentionDays = static_cast<int>(*config.log.retentionDays);
    }
    if (config.log.console)
    {
      s.logConsole = *config.log.console;
    }
    s.logFormat = config.log.format;

    if (config.servers.candidates)
    {
      if (config.servers.candidates->empty())
      {
        throw std::invalid_argument("servers.candidates must not be empty");
      }
      s.candidates.clear();
      for (const auto &entry : *config.servers.candidates)
      {
        s.candidates.push_back(dns::ResolverPair::parse(entry.first, entry.second));
      }
    }

    return s;
  }

  /// \brief Settles the log directory and lock file paths.
  ///
  /// When the log directory cannot be created or written, both the logs and a
  /// defaulted lock file move to the per-user state directory together.
  void resolvePaths()
  {
    bool logDirUsable = prepareDirectory(logDirectory, std::filesystem::perms::owner_all |
                                                         std::filesystem::perms::group_read |
                                                         std::filesystem::perms::group_exec);
    bool fallback = !logDirUsable;
    if (fallback)
    {
      logDirectory = userStateDirectory();
      prepareDirectory(logDirectory, std::filesystem::perms::owner_all);
    }

    if (lockFile.empty())
    {
      bool runDirWritable = ::access(
                              std::filesystem::path(DefaultLockFile).parent_path().c_str(),
                              W_OK) == 0;
      if (fallback || !runDirWritable)
      {
        std::string dir = userStateDirectory();
        prepareDirectory(dir, std::filesystem::perms::owner_all);
        lockFile = dir + "/dnsrotor.pid";
      }
      else
      {
        lockFile = DefaultLockFile;
      }
    }
  }

private:
  static std::chrono::seconds boundedSeconds(const std::string &key, std::int64_t value,
                                             std::int64_t max)
  {
    if (value <= 0)
    {
      throw std::invalid_argument(key + " must be positive, got " + std::to_string(value));
    }
    if (value > max)
    {
      throw std::invalid_argument(key + " must be at most " + std::to_string(max) + " seconds, got " +
                                  std::to_string(value));
    }
    return std::chrono::seconds(value);
  }

  static bool prepareDirectory(const std::string &dir, std::filesystem::perms mode)
  {
    std::error_code ec;
    bool created = std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir, ec))
    {
      return false;
    }
    if (created)
    {
      std::filesystem::permissions(dir, mode, ec);
    }
    return ::access(dir.c_str(), W_OK) == 0;
  }
};

} // namespace core
} // namespace dnsrotor
