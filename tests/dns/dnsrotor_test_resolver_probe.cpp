// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "MockResolver.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <array>

using dnsrotor::dns::ResolverProbe;

namespace
{
std::vector<std::uint8_t> validReply()
{
  std::vector<std::uint8_t> reply(ResolverProbe::Query.begin(), ResolverProbe::Query.end());
  reply[2] |= 0x80;
  return reply;
}
} // namespace

TEST_CASE("Probe query is the fixed google.com A question", "[probe][wire]")
{
  const std::array<std::uint8_t, 28> expected = {
    0xAB, 0xCD, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x06, 'g',
    'o',  'o',  'g',  'l',  'e',  0x03, 'c',  'o',  'm',  0x00, 0x00, 0x01, 0x00, 0x01};
  REQUIRE(ResolverProbe::Query == expected);
}

TEST_CASE("Reply predicate boundaries", "[probe][wire]")
{
  auto reply = validReply();

  SECTION("Full echo with QR set is valid")
  {
    REQUIRE(ResolverProbe::isValidReply(reply.data(), reply.size()));
  }

  SECTION("Exactly a header is enough")
  {
    REQUIRE(ResolverProbe::isValidReply(reply.data(), 12));
  }

  SECTION("Eleven bytes are too short")
  {
    REQUIRE_FALSE(ResolverProbe::isValidReply(reply.data(), 11));
  }

  SECTION("Empty or null input")
  {
    REQUIRE_FALSE(ResolverProbe::isValidReply(reply.data(), 0));
    REQUIRE_FALSE(ResolverProbe::isValidReply(nullptr, 28));
  }

  SECTION("Mismatched transaction id")
  {
    reply[1] = 0xCE;
    REQUIRE_FALSE(ResolverProbe::isValidReply(reply.data(), reply.size()));
    reply[1] = 0xCD;
    reply[0] = 0x00;
    REQUIRE_FALSE(ResolverProbe::isValidReply(reply.data(), reply.size()));
  }

  SECTION("QR bit clear")
  {
    reply[2] &= 0x7F;
    REQUIRE_FALSE(ResolverProbe::isValidReply(reply.data(), reply.size()));
  }

  SECTION("Error rcode still counts as a reply")
  {
    reply[3] = 0x83; // NXDOMAIN
    REQUIRE(ResolverProbe::isValidReply(reply.data(), reply.size()));
  }
}

TEST_CASE("Probe against a loopback responder", "[probe][network]")
{
  dnsrotor::test::initializeTestLogging();
  const auto timeout = std::chrono::milliseconds(500);

  SECTION("Answering resolver is responsive")
  {
    MockResolver resolver(MockResolver::Behavior::Answer);
    REQUIRE(ResolverProbe::isResponsive("127.0.0.1", timeout, resolver.port()));
    REQUIRE(resolver.queriesReceived() == 1);

    auto query = resolver.lastQuery();
    REQUIRE(query.size() == ResolverProbe::Query.size());
    REQUIRE(std::equal(query.begin(), query.end(), ResolverProbe::Query.begin()));
  }

  SECTION("Wrong transaction id is rejected")
  {
    MockResolver resolver(MockResolver::Behavior::WrongId);
    REQUIRE_FALSE(ResolverProbe::isResponsive("127.0.0.1", timeout, resolver.port()));
  }

  SECTION("Reply without QR bit is rejected")
  {
    MockResolver resolver(MockResolver::Behavior::NoQrBit);
    REQUIRE_FALSE(ResolverProbe::isResponsive("127.0.0.1", timeout, resolver.port()));
  }

  SECTION("Short reply is rejected")
  {
    MockResolver resolver(MockResolver::Behavior::ShortReply);
    REQUIRE_FALSE(ResolverProbe::isResponsive("127.0.0.1", timeout, resolver.port()));
  }

  SECTION("Silent resolver times out within the bound")
  {
    MockResolver resolver(MockResolver::Behavior::Silent);
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(ResolverProbe::isResponsive("127.0.0.1", std::chrono::milliseconds(200),
                                              resolver.port()));
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
    REQUIRE(elapsedMs >= 150);
    REQUIRE(elapsedMs < 2000);
    REQUIRE(resolver.queriesReceived() == 1);
  }
}

TEST_CASE("Probe rejects non-literal addresses without sending", "[probe]")
{
  dnsrotor::test::initializeTestLogging();
  REQUIRE_FALSE(ResolverProbe::isResponsive("not-an-ip", std::chrono::milliseconds(100)));
  REQUIRE_FALSE(ResolverProbe::isResponsive("", std::chrono::milliseconds(100)));
}
