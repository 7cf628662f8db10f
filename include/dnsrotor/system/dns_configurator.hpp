// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "dnsrotor/core/logger.hpp"
#include "dnsrotor/dns/resolver_pair.hpp"
#include "dnsrotor/system/shell_runner.hpp"

namespace dnsrotor
{
namespace system
{

/// \brief Operating system whose DNS tools are driven.
enum class Platform
{
  MacOS,
  Linux
};

inline const char *platformToString(Platform platform)
{
  return platform == Platform::MacOS ? "macos" : "linux";
}

/// \brief Parses "macos" or "linux"; anything else gives nullopt.
inline std::optional<Platform> platformFromString(const std::string &name)
{
  if (name == "macos" || name == "darwin")
  {
    return Platform::MacOS;
  }
  if (name == "linux")
  {
    return Platform::Linux;
  }
  return std::nullopt;
}

/// \brief Platform this binary was built for.
inline Platform hostPlatform()
{
#if defined(__APPLE__)
  return Platform::MacOS;
#else
  return Platform::Linux;
#endif
}

/// \brief Outcome of one external DNS command.
struct CommandResult
{
  bool ok = false;
  std::string message;
};

/// \brief Reads and changes the resolvers of a network interface.
///
/// Implementations never throw from these calls; failures surface as
/// CommandResult::ok == false, nullopt or false.
class DnsConfigurator
{
public:
  virtual ~DnsConfigurator() = default;

  /// \brief Resolver pair the OS reports for \p iface, or nullopt if unreadable.
  virtual std::optional<dns::ResolverPair> readResolvers(const std::string &iface) = 0;

  virtual CommandResult applyResolvers(const std::string &iface, const dns::ResolverPair &pair) = 0;

  /// \brief Returns \p iface to automatically assigned resolvers.
  virtual CommandResult clearResolvers(const std::string &iface) = 0;

  /// \brief True if a VPN-class interface is up.
  virtual bool isVpnActive() = 0;

  virtual std::vector<std::string> listInterfaces() = 0;

  virtual bool isInterfaceEnabled(const std::string &iface) = 0;

  virtual std::optional<std::string> defaultRouteInterface() = 0;

  virtual std::string platformDefaultInterface() const = 0;

  /// \brief Picks the interface to manage.
  ///
  /// First enabled listed interface, then the default-route interface, then
  /// the platform default.
  std::string detectInterface()
  {
    DNSROTOR_LOG_INFO("Starting network interface detection");

    std::vector<std::string> enabled;
    for (const auto &iface : listInterfaces())
    {
      if (isInterfaceEnabled(iface))
      {
        enabled.push_back(iface);
      }
    }

    if (!enabled.empty())
    {
      if (enabled.size() > 1)
      {
        std::ostringstream names;
        for (std::size_t i = 0; i < enabled.size(); ++i)
        {
          names << (i ? ", " : "") << enabled[i];
        }
        DNSROTOR_LOG_WARN("Multiple active interfaces detected: "
                          << names.str() << ". Using '" << enabled.front()
                          << "'. Override with --interface <name> if needed.");
      }
      else
      {
        DNSROTOR_LOG_INFO("Detected active interface: " << enabled.front());
      }
      return enabled.front();
    }

    if (auto routed = defaultRouteInterface())
    {
      DNSROTOR_LOG_INFO("Detected interface via default route: " << *routed);
      return *routed;
    }

    std::string fallback = platformDefaultInterface();
    DNSROTOR_LOG_WARN("Could not auto-detect network interface. Defaulting to '"
                      << fallback << "'. Use --interface <name> to override.");
    return fallback;
  }
};

/// \brief DnsConfigurator that runs the platform's own network tools.
///
/// macOS uses networksetup, route and ifconfig. Linux uses ip and resolvectl.
/// Commands that change or read resolver settings are prefixed with the
/// privilege prefix (for example "sudo").
class CommandDnsConfigurator : public DnsConfigurator
{
public:
  using CommandRunner =
    std::function<ExecutionResult(const std::vector<std::string> &, const ExecutionOptions &)>;

  static constexpr std::chrono::seconds DefaultCommandTimeout{10};

  CommandDnsConfigurator(Platform platform,
                         std::chrono::milliseconds timeout = DefaultCommandTimeout,
                         std::vector<std::string> privilegePrefix = {},
                         CommandRunner runner = &ShellRunner::execute)
    : _platform(platform), _privilegePrefix(std::move(privilegePrefix)),
      _runner(std::move(runner))
  {
    _options.timeout = timeout;
  }

  static std::vector<std::string> defaultPrivilegePrefix(Platform platform)
  {
    if (platform == Platform::MacOS)
    {
      return {"sudo"};
    }
    return {};
  }

  Platform platform() const { return _platform; }

  std::optional<dns::ResolverPair> readResolvers(const std::string &iface) override
  {
    CommandResult result =
      _platform == Platform::MacOS
        ? run({"networksetup", "-getdnsservers", iface}, true)
        : run({"resolvectl", "dns", iface}, false);
    if (!result.ok)
    {
      DNSROTOR_LOG_DEBUG("Could not read DNS servers for " << iface << ": " << result.message);
      return std::nullopt;
    }
    return parseResolvers(result.message);
  }

  CommandResult applyResolvers(const std::string &iface, const dns::ResolverPair &pair) override
  {
    if (!pair.isValid())
    {
      return {false, "Invalid DNS address: '" + pair.primary() + "' or '" + pair.secondary() + "'"};
    }
    if (_platform == Platform::MacOS)
    {
      return run({"networksetup", "-setdnsservers", iface, pair.primary(), pair.secondary()},
                 true);
    }
    return run({"resolvectl", "dns", iface, pair.primary(), pair.secondary()}, true);
  }

  CommandResult clearResolvers(const std::string &iface) override
  {
    if (_platform == Platform::MacOS)
    {
      return run({"networksetup", "-setdnsservers", iface, "Empty"}, true);
    }
    return run({"resolvectl", "revert", iface}, true);
  }

  bool isVpnActive() override
  {
    if (_platform == Platform::MacOS)
    {
      CommandResult result = run({"ifconfig"}, false);
      return result.ok && parseIfconfigVpn(result.message);
    }
    CommandResult result = run({"ip", "-o", "link", "show", "up"}, false);
    return result.ok && parseIpLinkVpn(result.message);
  }

  std::vector<std::string> listInterfaces() override
  {
    if (_platform == Platform::MacOS)
    {
      CommandResult result = run({"networksetup", "-listallnetworkservices"}, false);
      return result.ok ? parseServiceList(result.message) : std::vector<std::string>{};
    }
    CommandResult result = run({"ip", "-o", "link", "show"}, false);
    return result.ok ? parseIpLinkList(result.message) : std::vector<std::string>{};
  }

  bool isInterfaceEnabled(const std::string &iface) override
  {
    if (_platform == Platform::MacOS)
    {
      CommandResult result = run({"networksetup", "-getnetworkserviceenabled", iface}, false);
      return result.ok && result.message.find("Enabled") != std::string::npos;
    }
    CommandResult result = run({"ip", "-o", "link", "show", "dev", iface}, false);
    return result.ok && hasFlag(result.message, "UP");
  }

  std::optional<std::string> defaultRouteInterface() override
  {
    if (_platform == Platform::MacOS)
    {
      CommandResult result = run({"route", "get", "default"}, false);
      return result.ok ? parseRouteGet(result.message) : std::nullopt;
    }
    CommandResult result = run({"ip", "route", "show", "default"}, false);
    return result.ok ? parseIpRouteDefault(result.message) : std::nullopt;
  }

  std::string platformDefaultInterface() const override
  {
    return _platform == Platform::MacOS ? "Wi-Fi" : "eth0";
  }

  // Output parsers.

  /// \brief Collects IP-literal tokens: two or more give (first, second), one
  /// gives (ip, ip), none gives nullopt.
  static std::optional<dns::ResolverPair> parseResolvers(const std::string &output)
  {
    std::vector<std::string> ips;
    std::istringstream in(output);
    std::string token;
    while (in >> token)
    {
      // resolvectl may append "#server-name" or "%scope".
      auto cut = token.find_first_of("#%");
      if (cut != std::string::npos)
      {
        token.erase(cut);
      }
      if (dns::isIpLiteral(token))
      {
        ips.push_back(token);
      }
    }
    if (ips.empty())
    {
      return std::nullopt;
    }
    if (ips.size() == 1)
    {
      return dns::ResolverPair(ips[0], ips[0]);
    }
    return dns::ResolverPair(ips[0], ips[1]);
  }

  /// \brief Service names from "networksetup -listallnetworkservices".
  static std::vector<std::string> parseServiceList(const std::string &output)
  {
    std::vector<std::string> services;
    for (const auto &raw : lines(output))
    {
      std::string line = trim(raw);
      if (line.empty() || raw.front() == '*' || line.rfind("An asterisk", 0) == 0)
      {
        continue;
      }
      services.push_back(line);
    }
    return services;
  }

  /// \brief Interface names from "ip -o link show", loopback excluded.
  static std::vector<std::string> parseIpLinkList(const std::string &output)
  {
    std::vector<std::string> names;
    for (const auto &line : lines(output))
    {
      std::string name = ipLinkName(line);
      if (!name.empty() && name != "lo")
      {
        names.push_back(name);
      }
    }
    return names;
  }

  /// \brief True if an ifconfig header line names a VPN-class interface with UP set.
  static bool parseIfconfigVpn(const std::string &output)
  {
    for (const auto &line : lines(output))
    {
      if (line.empty() || std::isspace(static_cast<unsigned char>(line.front())))
      {
        continue;
      }
      std::string name = line.substr(0, line.find(':'));
      if (isVpnInterfaceName(name) && line.find("flags=") != std::string::npos &&
          hasFlag(line, "UP"))
      {
        DNSROTOR_LOG_DEBUG("Active VPN interface detected: " << name);
        return true;
      }
    }
    return false;
  }

  /// \brief Same check over "ip -o link show up" output.
  static bool parseIpLinkVpn(const std::string &output)
  {
    for (const auto &line : lines(output))
    {
      std::string name = ipLinkName(line);
      if (isVpnInterfaceName(name) && hasFlag(line, "UP"))
      {
        DNSROTOR_LOG_DEBUG("Active VPN interface detected: " << name);
        return true;
      }
    }
    return false;
  }

  /// \brief Interface from the "interface:" line of "route get default".
  static std::optional<std::string> parseRouteGet(const std::string &output)
  {
    for (const auto &line : lines(output))
    {
      auto pos = line.find("interface:");
      if (pos != std::string::npos)
      {
        std::string name = trim(line.substr(pos + 10));
        if (!name.empty())
        {
          return name;
        }
      }
    }
    return std::nullopt;
  }

  /// \brief Interface following "dev" in "ip route show default".
  static std::optional<std::string> parseIpRouteDefault(const std::string &output)
  {
    std::istringstream in(output);
    std::string token;
    while (in >> token)
    {
      if (token == "dev" && in >> token)
      {
        return token;
      }
    }
    return std::nullopt;
  }

  static bool isVpnInterfaceName(const std::string &name)
  {
    static const char *const prefixes[] = {"utun", "ppp", "tun", "tap", "ipsec", "wg"};
    for (const char *prefix : prefixes)
    {
      if (name.rfind(prefix, 0) == 0)
      {
        return true;
      }
    }
    return false;
  }

private:
  CommandResult run(std::vector<std::string> argv, bool privileged)
  {
    if (privileged && !_privilegePrefix.empty())
    {
      argv.insert(argv.begin(), _privilegePrefix.begin(), _privilegePrefix.end());
    }

    DNSROTOR_LOG_TRACE("Running: " << join(argv));
    ExecutionResult result = _runner(argv, _options);

    CommandResult out;
    out.ok = result.succeeded();
    if (out.ok)
    {
      out.message = trim(result.output);
    }
    else if (result.timedOut)
    {
      out.message = "Command timed out";
    }
    else
    {
      out.message = trim(result.errorOutput);
      if (out.message.empty())
      {
        out.message = argv.front() + " exited with code " + std::to_string(result.exitCode);
      }
    }
    if (!out.ok)
    {
      DNSROTOR_LOG_DEBUG("Command failed: " << join(argv) << ": " << out.message);
    }
    return out;
  }

  /// Flags between '<' and '>', comma separated.
  static bool hasFlag(const std::string &line, const std::string &flag)
  {
    auto begin = line.find('<');
    if (begin == std::string::npos)
    {
      return false;
    }
    auto end = line.find('>', begin);
    if (end == std::string::npos)
    {
      return false;
    }
    std::istringstream in(line.substr(begin + 1, end - begin - 1));
    std::string item;
    while (std::getline(in, item, ','))
    {
      if (item == flag)
      {
        return true;
      }
    }
    return false;
  }

  /// "3: wlan0@if7: <...>" -> "wlan0"
  static std::string ipLinkName(const std::string &line)
  {
    auto first = line.find(':');
    if (first == std::string::npos)
    {
      return {};
    }
    auto second = line.find(':', first + 1);
    if (second == std::string::npos)
    {
      return {};
    }
    std::string name = trim(line.substr(first + 1, second - first - 1));
    auto at = name.find('@');
    if (at != std::string::npos)
    {
      name.erase(at);
    }
    return name;
  }

  static std::vector<std::string> lines(const std::string &text)
  {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
      if (!line.empty() && line.back() == '\r')
      {
        line.pop_back();
      }
      out.push_back(line);
    }
    return out;
  }

  static std::string trim(const std::string &s)
  {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
      return {};
    }
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
  }

  static std::string join(const std::vector<std::string> &argv)
  {
    std::string out;
    for (const auto &arg : argv)
    {
      if (!out.empty())
      {
        out += ' ';
      }
      out += arg;
    }
    return out;
  }

  Platform _platform;
  std::vector<std::string> _privilegePrefix;
  CommandRunner _runner;
  ExecutionOptions _options;
};

} // namespace system
} // namespace dnsrotor
