// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <set>
#include <sstream>

using dnsrotor::dns::ResolverPair;

TEST_CASE("IP literal detection", "[resolver_pair]")
{
  CHECK(dnsrotor::dns::isIpLiteral("1.1.1.1"));
  CHECK(dnsrotor::dns::isIpLiteral("2606:4700:4700::1111"));
  CHECK(dnsrotor::dns::isIpLiteral("::1"));

  CHECK_FALSE(dnsrotor::dns::isIpLiteral(""));
  CHECK_FALSE(dnsrotor::dns::isIpLiteral("one.one.one.one"));
  CHECK_FALSE(dnsrotor::dns::isIpLiteral("1.1.1"));
  CHECK_FALSE(dnsrotor::dns::isIpLiteral("256.1.1.1"));
  CHECK_FALSE(dnsrotor::dns::isIpLiteral("1.1.1.1 "));
}

TEST_CASE("ResolverPair equality is order sensitive", "[resolver_pair]")
{
  ResolverPair a("1.1.1.1", "1.0.0.1");
  ResolverPair b("1.1.1.1", "1.0.0.1");
  ResolverPair swapped("1.0.0.1", "1.1.1.1");

  REQUIRE(a == b);
  REQUIRE(a != swapped);
  REQUIRE((a < swapped || swapped < a));

  std::set<ResolverPair> pairs{a, b, swapped};
  REQUIRE(pairs.size() == 2);
}

TEST_CASE("ResolverPair parse validates both members", "[resolver_pair]")
{
  REQUIRE_NOTHROW(ResolverPair::parse("9.9.9.9", "149.112.112.112"));
  REQUIRE_THROWS_AS(ResolverPair::parse("9.9.9.9", "dns.quad9.net"), std::invalid_argument);
  REQUIRE_THROWS_AS(ResolverPair::parse("", "9.9.9.9"), std::invalid_argument);

  REQUIRE_FALSE(ResolverPair("8.8.8.8", "garbage").isValid());
}

TEST_CASE("ResolverPair formatting", "[resolver_pair]")
{
  ResolverPair pair("8.8.8.8", "8.8.4.4");
  REQUIRE(pair.toString() == "8.8.8.8, 8.8.4.4");

  std::ostringstream os;
  os << pair;
  REQUIRE(os.str() == "8.8.8.8, 8.8.4.4");
}

TEST_CASE("Built-in candidates are valid and distinct", "[resolver_pair]")
{
  auto candidates = dnsrotor::dns::defaultCandidates();
  REQUIRE(candidates.size() == 25);

  std::set<ResolverPair> unique(candidates.begin(), candidates.end());
  REQUIRE(unique.size() == candidates.size());

  for (const auto &pair : candidates)
  {
    INFO(pair.toString());
    CHECK(pair.isValid());
  }

  REQUIRE(candidates.front() == dnsrotor::dns::fallbackPair());
  REQUIRE(dnsrotor::dns::fallbackPair() == ResolverPair("1.1.1.1", "1.0.0.1"));
}
