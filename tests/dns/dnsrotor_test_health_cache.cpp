// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>

using dnsrotor::dns::CandidateList;
using dnsrotor::dns::HealthCache;
using dnsrotor::dns::ResolverPair;

namespace
{
CandidateList threeCandidates()
{
  return {{"10.0.0.1", "10.0.0.2"}, {"10.0.1.1", "10.0.1.2"}, {"10.0.2.1", "10.0.2.2"}};
}
} // namespace

TEST_CASE("Pair is healthy if either member answers", "[health_cache]")
{
  dnsrotor::test::initializeTestLogging();
  dnsrotor::test::ScriptedProbe probe;
  auto candidates = threeCandidates();

  probe.setAlive("10.0.0.1", true);
  probe.setAlive("10.0.0.2", true);
  probe.setAlive("10.0.1.1", false);
  probe.setAlive("10.0.1.2", true);
  // third pair entirely dead

  HealthCache cache(std::chrono::seconds(1800), probe.function());
  auto healthy = cache.validate(candidates);

  REQUIRE(healthy.size() == 2);
  REQUIRE(healthy.count(candidates[0]) == 1);
  REQUIRE(healthy.count(candidates[1]) == 1);
  REQUIRE(healthy.count(candidates[2]) == 0);
  // Both members of every pair are probed, even after the first answers.
  REQUIRE(probe.calls() == 6);
}

TEST_CASE("Cached set is reused inside the TTL", "[health_cache][ttl]")
{
  dnsrotor::test::initializeTestLogging();
  dnsrotor::test::ScriptedProbe probe;
  dnsrotor::test::ManualClock clock;
  auto candidates = threeCandidates();
  probe.setAllAlive(candidates, true);

  HealthCache cache(std::chrono::seconds(1800), probe.function(), clock.function());
  REQUIRE_FALSE(cache.lastRefresh().has_value());

  SECTION("First call populates")
  {
    REQUIRE(cache.getHealthy(candidates).size() == 3);
    REQUIRE(probe.calls() == 6);
    REQUIRE(cache.lastRefresh().has_value());
  }

  SECTION("Second call within the TTL does not probe")
  {
    cache.getHealthy(candidates);
    clock.advance(std::chrono::seconds(1799));
    REQUIRE(cache.getHealthy(candidates).size() == 3);
    REQUIRE(probe.calls() == 6);
  }

  SECTION("Exactly at the TTL is still fresh")
  {
    cache.getHealthy(candidates);
    clock.advance(std::chrono::seconds(1800));
    cache.getHealthy(candidates);
    REQUIRE(probe.calls() == 6);
  }

  SECTION("Past the TTL refreshes")
  {
    cache.getHealthy(candidates);
    auto first = *cache.lastRefresh();
    clock.advance(std::chrono::seconds(1801));
    probe.setAlive("10.0.2.1", false);
    probe.setAlive("10.0.2.2", false);

    auto healthy = cache.getHealthy(candidates);
    REQUIRE(probe.calls() == 12);
    REQUIRE(healthy.size() == 2);
    REQUIRE(*cache.lastRefresh() > first);
  }

  SECTION("Forced refresh probes regardless of age")
  {
    cache.getHealthy(candidates);
    cache.getHealthy(candidates, true);
    REQUIRE(probe.calls() == 12);
  }
}

TEST_CASE("Refresh time never moves backwards", "[health_cache][ttl]")
{
  dnsrotor::test::initializeTestLogging();
  dnsrotor::test::ScriptedProbe probe;
  auto candidates = threeCandidates();
  probe.setAllAlive(candidates, true);

  auto now = HealthCache::Clock::time_point(std::chrono::hours(10));
  HealthCache cache(std::chrono::seconds(60), probe.function(), [&now]() { return now; });

  cache.getHealthy(candidates);
  auto stamped = *cache.lastRefresh();

  now -= std::chrono::hours(1);
  cache.getHealthy(candidates, true);
  REQUIRE(*cache.lastRefresh() == stamped);
}

TEST_CASE("Healthy set stays a subset of the candidates", "[health_cache]")
{
  dnsrotor::test::initializeTestLogging();
  dnsrotor::test::ScriptedProbe probe;
  auto candidates = threeCandidates();
  probe.setAllAlive(candidates, true);
  probe.setAlive("192.0.2.1", true);

  HealthCache cache(std::chrono::seconds(1800), probe.function());
  for (const auto &pair : cache.getHealthy(candidates))
  {
    REQUIRE(std::find(candidates.begin(), candidates.end(), pair) != candidates.end());
  }
}

TEST_CASE("Health check progress is logged", "[health_cache][log]")
{
  dnsrotor::test::ScriptedProbe probe;
  auto candidates = threeCandidates();
  probe.setAllAlive(candidates, false);
  probe.setAlive("10.0.0.1", true);

  dnsrotor::test::LogCapture logs;
  HealthCache cache(std::chrono::seconds(1800), probe.function());
  cache.getHealthy(candidates);

  REQUIRE(logs.count("Starting health check for 3 DNS servers") == 1);
  REQUIRE(logs.count("Health check complete: 1/3") == 1);
  REQUIRE(logs.count("PARTIAL: 10.0.0.1, 10.0.0.2") == 1);
  REQUIRE(logs.count("FAILED: ") == 2);
}
