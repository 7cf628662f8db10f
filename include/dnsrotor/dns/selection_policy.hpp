// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "dnsrotor/core/logger.hpp"
#include "dnsrotor/crypto/secure_rng.hpp"
#include "dnsrotor/dns/health_cache.hpp"
#include "dnsrotor/dns/resolver_pair.hpp"

namespace dnsrotor
{
namespace dns
{

/// \brief Picks the next resolver pair from the healthy set, avoiding the current one.
class SelectionPolicy
{
public:
  /// Returns an index in [0, size).
  using IndexPicker = std::function<std::size_t(std::size_t size)>;

  static constexpr int DefaultMaxRetries = 5;

  explicit SelectionPolicy(HealthCache &cache, IndexPicker picker = secureIndex)
    : _cache(cache), _picker(std::move(picker))
  {
  }

  /// \brief Chooses a healthy pair different from \p exclude.
  ///
  /// An empty healthy set forces one refresh, then falls back to fallbackPair().
  /// Returns nullopt when the only available pair is \p exclude; the caller
  /// skips the cycle.
  std::optional<ResolverPair> choose(const CandidateList &candidates,
                                     const std::optional<ResolverPair> &exclude = std::nullopt,
                                     int maxRetries = DefaultMaxRetries)
  {
    std::set<ResolverPair> healthy = _cache.getHealthy(candidates);

    if (healthy.empty())
    {
      DNSROTOR_LOG_WARN("No healthy DNS servers in cache, forcing re-validation");
      healthy = _cache.getHealthy(candidates, true);
    }

    if (healthy.empty())
    {
      const ResolverPair &fallback = fallbackPair();
      DNSROTOR_LOG_ERROR("No healthy DNS servers found, using fallback " << fallback);
      if (exclude && *exclude == fallback)
      {
        return std::nullopt;
      }
      return fallback;
    }

    std::vector<ResolverPair> pool;
    pool.reserve(healthy.size());
    for (const auto &pair : healthy)
    {
      if (!exclude || pair != *exclude)
      {
        pool.push_back(pair);
      }
    }

    if (pool.empty())
    {
      DNSROTOR_LOG_WARN("Only the current DNS server is healthy, cannot rotate this cycle");
      return std::nullopt;
    }

    for (int attempt = 0; attempt < maxRetries; ++attempt)
    {
      std::size_t index = _picker(pool.size());
      if (index >= pool.size())
      {
        continue;
      }
      if (!exclude || pool[index] != *exclude)
      {
        return pool[index];
      }
    }

    return pool.front();
  }

  static std::size_t secureIndex(std::size_t size)
  {
    return static_cast<std::size_t>(crypto::SecureRng::uniform(size));
  }

private:
  HealthCache &_cache;
  IndexPicker _picker;
};

} // namespace dns
} // namespace dnsrotor
