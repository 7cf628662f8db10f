// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace dnsrotor
{
namespace dns
{

/// \brief True if \p address is a numeric IPv4 or IPv6 literal.
inline bool isIpLiteral(const std::string &address)
{
  in_addr v4{};
  in6_addr v6{};
  return ::inet_pton(AF_INET, address.c_str(), &v4) == 1 ||
         ::inet_pton(AF_INET6, address.c_str(), &v6) == 1;
}

/// \brief Primary/secondary resolver addresses applied to one interface.
///
/// Equality is order-sensitive: (a, b) != (b, a).
class ResolverPair
{
public:
  ResolverPair(std::string primary, std::string secondary)
    : _primary(std::move(primary)), _secondary(std::move(secondary))
  {
  }

  /// \brief Builds a pair and rejects non-literal addresses.
  /// \throws std::invalid_argument if either address is not an IP literal
  static ResolverPair parse(const std::string &primary, const std::string &secondary)
  {
    ResolverPair pair(primary, secondary);
    if (!pair.isValid())
    {
      throw std::invalid_argument("Invalid DNS address: '" + primary + "' or '" + secondary +
                                  "'");
    }
    return pair;
  }

  const std::string &primary() const { return _primary; }
  const std::string &secondary() const { return _secondary; }

  bool isValid() const { return isIpLiteral(_primary) && isIpLiteral(_secondary); }

  std::string toString() const { return _primary + ", " + _secondary; }

  bool operator==(const ResolverPair &other) const
  {
    return _primary == other._primary && _secondary == other._secondary;
  }

  bool operator!=(const ResolverPair &other) const { return !(*this == other); }

  bool operator<(const ResolverPair &other) const
  {
    return std::tie(_primary, _secondary) < std::tie(other._primary, other._secondary);
  }

private:
  std::string _primary;
  std::string _secondary;
};

inline std::ostream &operator<<(std::ostream &os, const ResolverPair &pair)
{
  return os << pair.toString();
}

/// Ordered, read-only list of every pair the rotation may choose from.
using CandidateList = std::vector<ResolverPair>;

/// \brief Pair returned when no candidate passes the health check.
inline const ResolverPair &fallbackPair()
{
  static const ResolverPair pair("1.1.1.1", "1.0.0.1");
  return pair;
}

/// \brief Built-in public resolver pairs, used when the configuration has none.
inline CandidateList defaultCandidates()
{
  return {
    {"1.1.1.1", "1.0.0.1"},                 // Cloudflare
    {"9.9.9.9", "149.112.112.112"},         // Quad9
    {"208.67.222.222", "208.67.220.220"},   // OpenDNS
    {"64.6.64.6", "64.6.65.6"},             // Verisign
    {"91.239.100.100", "89.233.43.71"},     // UncensoredDNS
    {"185.228.168.9", "185.228.169.9"},     // CleanBrowsing
    {"77.88.8.8", "77.88.8.1"},             // Yandex
    {"176.103.130.130", "176.103.130.131"}, // AdGuard
    {"156.154.70.1", "156.154.71.1"},       // DNS Advantage
    {"199.85.126.10", "199.85.127.10"},     // Norton
    {"81.218.119.11", "209.88.198.133"},    // GreenTeam
    {"195.46.39.39", "195.46.39.40"},       // SafeDNS
    {"208.76.50.50", "208.76.51.51"},       // SmartViper
    {"216.146.35.35", "216.146.36.36"},     // Dyn
    {"37.235.1.174", "37.235.1.177"},       // FreeDNS
    {"198.101.242.72", "23.253.163.53"},    // Alternate DNS
    {"109.69.8.51", "8.8.8.8"},             // puntCAT
    {"101.101.101.101", "101.102.103.104"}, // Quad101
    {"80.67.169.12", "80.67.169.40"},       // FDN
    {"185.121.177.177", "185.121.177.53"},  // OpenNIC
    {"195.10.46.179", "212.82.225.7"},      // AS250.net
    {"194.168.4.100", "194.168.8.100"},     // Orange
    {"203.122.222.6", "203.122.223.6"},     // SingNet
    {"209.244.0.3", "209.244.0.4"},         // Level3
    {"8.8.8.8", "8.8.4.4"},                 // Google
  };
}

} // namespace dns
} // namespace dnsrotor
