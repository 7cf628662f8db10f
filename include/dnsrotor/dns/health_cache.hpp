// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "dnsrotor/core/logger.hpp"
#include "dnsrotor/dns/resolver_pair.hpp"
#include "dnsrotor/dns/resolver_probe.hpp"

namespace dnsrotor
{
namespace dns
{

/// \brief Read-through cache of the resolver pairs that answered the last probe pass.
///
/// A pass probes both members of every candidate serially; a pair stays in the
/// healthy set if either member answers. The cached set is reused until the TTL
/// lapses or a refresh is forced.
class HealthCache
{
public:
  using Clock = std::chrono::steady_clock;
  /// Checks one address; returns true if it answered.
  using ProbeFunction = std::function<bool(const std::string &address)>;
  using ClockFunction = std::function<Clock::time_point()>;

  static constexpr std::chrono::seconds DefaultTtl{1800};
  static constexpr std::chrono::seconds DefaultProbeTimeout{2};

  /// \brief Cache that probes with ResolverProbe on port 53.
  explicit HealthCache(std::chrono::seconds ttl = DefaultTtl,
                       std::chrono::milliseconds probeTimeout = DefaultProbeTimeout)
    : HealthCache(ttl,
                  [probeTimeout](const std::string &address)
                  { return ResolverProbe::isResponsive(address, probeTimeout); })
  {
  }

  HealthCache(std::chrono::seconds ttl, ProbeFunction probe, ClockFunction clock = Clock::now)
    : _ttl(ttl), _probe(std::move(probe)), _clock(std::move(clock))
  {
  }

  /// \brief Returns the healthy subset of \p candidates, refreshing it when
  /// forced, never populated, or older than the TTL.
  const std::set<ResolverPair> &getHealthy(const CandidateList &candidates,
                                           bool forceRefresh = false)
  {
    auto now = _clock();
    bool expired = !_lastRefresh.has_value() || (now - *_lastRefresh) > _ttl;
    if (forceRefresh || expired)
    {
      DNSROTOR_LOG_INFO("Updating DNS health check cache"
                        << (forceRefresh ? " (forced)" : ""));
      _healthy = validate(candidates);
      // Probing takes time; stamp after it and never move backwards.
      auto stamp = _clock();
      if (!_lastRefresh.has_value() || stamp > *_lastRefresh)
      {
        _lastRefresh = stamp;
      }
    }
    return _healthy;
  }

  /// \brief Probes every pair and returns those with at least one live member.
  std::set<ResolverPair> validate(const CandidateList &candidates)
  {
    std::set<ResolverPair> healthy;
    DNSROTOR_LOG_INFO("Starting health check for " << candidates.size() << " DNS servers");

    for (const auto &pair : candidates)
    {
      bool primaryOk = _probe(pair.primary());
      bool secondaryOk = _probe(pair.secondary());

      if (primaryOk || secondaryOk)
      {
        healthy.insert(pair);
        DNSROTOR_LOG_DEBUG((primaryOk && secondaryOk ? "HEALTHY: " : "PARTIAL: ") << pair);
      }
      else
      {
        DNSROTOR_LOG_DEBUG("FAILED: " << pair);
      }
    }

    DNSROTOR_LOG_INFO("Health check complete: " << healthy.size() << "/" << candidates.size()
                                                << " servers healthy");
    return healthy;
  }

  std::optional<Clock::time_point> lastRefresh() const { return _lastRefresh; }

  std::chrono::seconds ttl() const { return _ttl; }

private:
  std::chrono::seconds _ttl;
  ProbeFunction _probe;
  ClockFunction _clock;
  std::set<ResolverPair> _healthy;
  std::optional<Clock::time_point> _lastRefresh;
};

} // namespace dns
} // namespace dnsrotor
