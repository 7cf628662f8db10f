// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <cstdint>
#include <cstdlib>

using dnsrotor::core::Config;
using dnsrotor::core::ConfigLoader;
using dnsrotor::core::Settings;

namespace
{
/// Points $HOME at a scratch directory for the lifetime of the object.
class ScopedHome
{
public:
  explicit ScopedHome(const std::string &home)
  {
    if (const char *old = std::getenv("HOME"))
    {
      _old = old;
    }
    ::setenv("HOME", home.c_str(), 1);
  }

  ~ScopedHome()
  {
    if (_old)
    {
      ::setenv("HOME", _old->c_str(), 1);
    }
    else
    {
      ::unsetenv("HOME");
    }
  }

private:
  std::optional<std::string> _old;
};
} // namespace

TEST_CASE("Settings defaults", "[settings]")
{
  Settings s = Settings::fromConfig(Config{});

  REQUIRE(s.interval == 300);
  REQUIRE(s.autoDetectInterface());
  REQUIRE(s.probeTimeout == std::chrono::seconds(2));
  REQUIRE(s.cacheTtl == std::chrono::seconds(1800));
  REQUIRE(s.maxRetries == 5);
  REQUIRE(s.platform == dnsrotor::system::hostPlatform());
  REQUIRE(s.commandTimeout == std::chrono::seconds(10));
  REQUIRE(s.lockFile.empty());
  REQUIRE(s.logLevel == dnsrotor::core::Logger::Level::Info);
  REQUIRE(s.logDirectory == "/var/log/dnsrotor");
  REQUIRE(s.logFilePath() == "/var/log/dnsrotor/dnsrotor");
  REQUIRE(s.logRetentionDays == 7);
  REQUIRE(s.logConsole);
  REQUIRE_FALSE(s.logFormat.has_value());
  REQUIRE(s.candidates == dnsrotor::dns::defaultCandidates());
}

TEST_CASE("Privilege prefix follows the platform", "[settings][platform]")
{
  Config config;

  config.system.platform = "macos";
  Settings onMac = Settings::fromConfig(config);
  REQUIRE(onMac.platform == dnsrotor::system::Platform::MacOS);
  REQUIRE(onMac.privilegePrefix == std::vector<std::string>{"sudo"});

  config.system.platform = "linux";
  Settings onLinux = Settings::fromConfig(config);
  REQUIRE(onLinux.platform == dnsrotor::system::Platform::Linux);
  REQUIRE(onLinux.privilegePrefix.empty());

  config.system.privilegePrefix = std::vector<std::string>{"doas"};
  REQUIRE(Settings::fromConfig(config).privilegePrefix == std::vector<std::string>{"doas"});

  config.system.platform = "auto";
  REQUIRE(Settings::fromConfig(config).platform == dnsrotor::system::hostPlatform());
}

TEST_CASE("Invalid values are rejected", "[settings][validation]")
{
  Config config;

  SECTION("Probe timeout")
  {
    config.health.probeTimeout = 0;
    REQUIRE_THROWS_AS(Settings::fromConfig(config), std::invalid_argument);
  }
  SECTION("Cache TTL")
  {
    config.health.cacheTtl = -1;
    REQUIRE_THROWS_AS(Settings::fromConfig(config), std::invalid_argument);
  }
  SECTION("Retries")
  {
    config.health.maxRetries = 0;
    REQUIRE_THROWS_AS(Settings::fromConfig(config), std::invalid_argument);
    config.health.maxRetries = 1001;
    REQUIRE_THROWS_AS(Settings::fromConfig(config), std::invalid_argument);
  }
  SECTION("Command timeout")
  {
    config.system.commandTimeout = 0;
    REQUIRE_THROWS_AS(Settings::fromConfig(config), std::invalid_argument);
  }
  SECTION("Timeouts and TTL have an upper bound")
  {
    config.health.probeTimeout = 2147484;
    REQUIRE_THROWS_WITH(Settings::fromConfig(config), Catch::Contains("at most 3600"));
    config.health.probeTimeout = Settings::MaxTimeoutSeconds;
    REQUIRE(Settings::fromConfig(config).probeTimeout == std::chrono::seconds(3600));

    config.system.commandTimeout = 3601;
    REQUIRE_THROWS_WITH(Settings::fromConfig(config), Catch::Contains("system.command_timeout"));
    config.system.commandTimeout = Settings::MaxTimeoutSeconds;
    REQUIRE(Settings::fromConfig(config).commandTimeout == std::chrono::seconds(3600));

    config.health.cacheTtl = INT64_MAX;
    REQUIRE_THROWS_WITH(Settings::fromConfig(config), Catch::Contains("health.cache_ttl"));
  }
  SECTION("Platform")
  {
    config.system.platform = "windows";
    REQUIRE_THROWS_WITH(Settings::fromConfig(config), Catch::Contains("Unknown platform"));
  }
  SECTION("Log level")
  {
    config.log.level = "loud";
    REQUIRE_THROWS_WITH(Settings::fromConfig(config), Catch::Contains("Unknown log level"));
  }
  SECTION("Retention")
  {
    config.log.retentionDays = -1;
    REQUIRE_THROWS_AS(Settings::fromConfig(config), std::invalid_argument);
  }
  SECTION("Empty candidate list")
  {
    config.servers.candidates = std::vector<std::pair<std::string, std::string>>{};
    REQUIRE_THROWS_AS(Settings::fromConfig(config), std::invalid_argument);
  }
  SECTION("Bad candidate address")
  {
    config.servers.candidates =
      std::vector<std::pair<std::string, std::string>>{{"1.1.1.1", "one.one"}};
    REQUIRE_THROWS_WITH(Settings::fromConfig(config), Catch::Contains("Invalid DNS address"));
  }
}

TEST_CASE("Command line wins over the file", "[settings][layering]")
{
  dnsrotor::test::TempDirManager dir;
  std::string path = dir.writeFile("dnsrotor.toml", "[dnsrotor.general]\n"
                                                    "interval = 900\n"
                                                    "interface = 'en1'\n"
                                                    "[dnsrotor.health]\n"
                                                    "cache_ttl = 60\n"
                                                    "max_retries = 3\n"
                                                    "[dnsrotor.log]\n"
                                                    "level = 'debug'\n"
                                                    "console = false\n"
                                                    "retention_days = 14\n"
                                                    "format = '%L %m'\n"
                                                    "[dnsrotor.servers]\n"
                                                    "candidates = [['8.8.8.8', '8.8.4.4']]\n");
  ConfigLoader loader(path);

  Config config;
  config.general.interval = 200; // as if from -t
  config.log.level = "warning";  // as if from -l
  dnsrotor::core::applyToml(config, loader);

  Settings s = Settings::fromConfig(config);
  REQUIRE(s.interval == 200);
  REQUIRE(s.interface == "en1");
  REQUIRE_FALSE(s.autoDetectInterface());
  REQUIRE(s.cacheTtl == std::chrono::seconds(60));
  REQUIRE(s.maxRetries == 3);
  REQUIRE(s.logLevel == dnsrotor::core::Logger::Level::Warning);
  REQUIRE_FALSE(s.logConsole);
  REQUIRE(s.logRetentionDays == 14);
  REQUIRE(s.logFormat == std::string("%L %m"));
  REQUIRE(s.candidates.size() == 1);
  REQUIRE(s.candidates[0] == dnsrotor::dns::ResolverPair("8.8.8.8", "8.8.4.4"));
}

TEST_CASE("Shipped sample configuration parses", "[settings][sample]")
{
  std::string sample = std::string(DNSROTOR_SOURCE_DIR) + "/config/dnsrotor.toml";
  ConfigLoader loader(sample);

  Config config;
  dnsrotor::core::applyToml(config, loader);
  Settings s = Settings::fromConfig(config);
  REQUIRE_FALSE(s.candidates.empty());
  REQUIRE(s.interval >= 180);
}

TEST_CASE("Paths fall back to the user directory together", "[settings][paths]")
{
  dnsrotor::test::TempDirManager dir;
  ScopedHome home(dir.filePath("home"));
  std::filesystem::create_directories(dir.filePath("home"));

  SECTION("Writable log directory is kept")
  {
    Settings s;
    s.logDirectory = dir.filePath("logs/dnsrotor");
    s.lockFile = dir.filePath("run/dnsrotor.pid");
    s.resolvePaths();
    REQUIRE(s.logDirectory == dir.filePath("logs/dnsrotor"));
    REQUIRE(std::filesystem::is_directory(s.logDirectory));
    REQUIRE(s.lockFile == dir.filePath("run/dnsrotor.pid"));
  }

  SECTION("Unusable log directory moves logs and lock")
  {
    dir.writeFile("blocker", "not a directory");
    Settings s;
    s.logDirectory = dir.filePath("blocker/logs");
    s.resolvePaths();

    std::string userDir = dir.filePath("home") + "/.dnsrotor";
    REQUIRE(s.logDirectory == userDir);
    REQUIRE(std::filesystem::is_directory(userDir));
    REQUIRE(s.lockFile == userDir + "/dnsrotor.pid");
  }

  SECTION("Explicit lock file survives the fallback")
  {
    dir.writeFile("blocker", "not a directory");
    Settings s;
    s.logDirectory = dir.filePath("blocker/logs");
    s.lockFile = dir.filePath("explicit.pid");
    s.resolvePaths();
    REQUIRE(s.lockFile == dir.filePath("explicit.pid"));
  }
}

TEST_CASE("Config discovery order", "[settings][discovery]")
{
  dnsrotor::test::TempDirManager dir;
  ScopedHome home(dir.filePath("home"));
  std::filesystem::create_directories(dir.filePath("home/.dnsrotor"));
  std::filesystem::create_directories(dir.filePath("bin"));
  std::string exe = dir.filePath("bin/dnsrotor");

  auto paths = dnsrotor::core::configSearchPaths(exe);
  REQUIRE(paths.size() == 4);
  REQUIRE(paths[0] == "/etc/dnsrotor/dnsrotor.toml");
  REQUIRE(paths[2] == dir.filePath("home") + "/.dnsrotor/dnsrotor.toml");
  REQUIRE(paths[3] == dir.filePath("bin/dnsrotor.toml"));
  REQUIRE(dnsrotor::core::configSearchPaths().size() == 3);

  // Assumes no system-wide configuration on the test host.
  if (std::filesystem::exists(paths[0]) || std::filesystem::exists(paths[1]))
  {
    WARN("System configuration present; skipping discovery checks");
    return;
  }

  REQUIRE_FALSE(dnsrotor::core::discoverConfigFile(exe).has_value());

  dir.writeFile("bin/dnsrotor.toml", "");
  REQUIRE(dnsrotor::core::discoverConfigFile(exe) == dir.filePath("bin/dnsrotor.toml"));

  dir.writeFile("home/.dnsrotor/dnsrotor.toml", "");
  REQUIRE(dnsrotor::core::discoverConfigFile(exe) ==
          dir.filePath("home") + "/.dnsrotor/dnsrotor.toml");
}
