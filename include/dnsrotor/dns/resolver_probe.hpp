// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "dnsrotor/core/logger.hpp"

namespace dnsrotor
{
namespace dns
{

/// \brief One-shot UDP liveness check against a single resolver address.
///
/// Sends a fixed "google.com IN A" query and waits for one reply. The reply
/// counts only if it is at least a full header, echoes the transaction id and
/// has the QR bit set. Every failure collapses to false.
class ResolverProbe
{
public:
  static constexpr std::uint16_t TransactionId = 0xABCD;
  static constexpr std::size_t HeaderSize = 12;
  static constexpr std::size_t MaxReplySize = 512;
  static constexpr std::uint16_t DnsPort = 53;

  /// Header (id AB CD, RD, QDCOUNT 1) + QNAME google.com + QTYPE A + QCLASS IN.
  static constexpr std::array<std::uint8_t, 28> Query = {
    0xAB, 0xCD, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, //
    0x06, 'g',  'o',  'o',  'g',  'l',  'e',  0x03, 'c',  'o',  'm',  0x00, //
    0x00, 0x01, 0x00, 0x01};

  /// \brief Judges whether \p data is a reply to Query.
  static bool isValidReply(const std::uint8_t *data, std::size_t size)
  {
    if (data == nullptr || size < HeaderSize)
    {
      return false;
    }
    if (data[0] != Query[0] || data[1] != Query[1])
    {
      return false;
    }
    return (data[2] & 0x80) != 0;
  }

  /// \brief Sends one query to \p address and waits up to \p timeout for a valid reply.
  static bool isResponsive(const std::string &address, std::chrono::milliseconds timeout,
                           std::uint16_t port = DnsPort)
  {
    sockaddr_storage storage{};
    socklen_t addrLen = 0;
    if (!toSockaddr(address, port, storage, addrLen))
    {
      DNSROTOR_LOG_DEBUG("Health probe skipped, not an IP literal: " << address);
      return false;
    }

    Socket sock(::socket(storage.ss_family, SOCK_DGRAM, 0));
    if (!sock.valid())
    {
      DNSROTOR_LOG_DEBUG("Health probe for " << address << " failed: socket: "
                                             << std::strerror(errno));
      return false;
    }

    // A connected UDP socket only delivers datagrams from the probed peer and
    // surfaces ICMP port-unreachable as ECONNREFUSED.
    if (::connect(sock.fd(), reinterpret_cast<const sockaddr *>(&storage), addrLen) != 0 ||
        ::send(sock.fd(), Query.data(), Query.size(), 0) != static_cast<ssize_t>(Query.size()))
    {
      DNSROTOR_LOG_DEBUG("Health probe for " << address << " failed: send: "
                                             << std::strerror(errno));
      return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<std::uint8_t, MaxReplySize> reply{};
    while (true)
    {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0)
      {
        DNSROTOR_LOG_DEBUG("Health probe for " << address << " timed out");
        return false;
      }

      pollfd pfd{sock.fd(), POLLIN, 0};
      int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (rc < 0 && errno == EINTR)
      {
        continue;
      }
      if (rc <= 0)
      {
        DNSROTOR_LOG_DEBUG("Health probe for " << address << " timed out");
        return false;
      }

      ssize_t n = ::recv(sock.fd(), reply.data(), reply.size(), 0);
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n < 0)
      {
        DNSROTOR_LOG_DEBUG("Health probe for " << address << " failed: recv: "
                                               << std::strerror(errno));
        return false;
      }

      bool valid = isValidReply(reply.data(), static_cast<std::size_t>(n));
      if (!valid)
      {
        DNSROTOR_LOG_DEBUG("Health probe for " << address << " got a malformed reply (" << n
                                               << " bytes)");
      }
      return valid;
    }
  }

private:
  class Socket
  {
  public:
    explicit Socket(int fd) : _fd(fd) {}
    ~Socket()
    {
      if (_fd >= 0)
      {
        ::close(_fd);
      }
    }
    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    int fd() const { return _fd; }
    bool valid() const { return _fd >= 0; }

  private:
    int _fd;
  };

  static bool toSockaddr(const std::string &address, std::uint16_t port, sockaddr_storage &out,
                         socklen_t &len)
  {
    auto *v4 = reinterpret_cast<sockaddr_in *>(&out);
    if (::inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1)
    {
      v4->sin_family = AF_INET;
      v4->sin_port = htons(port);
      len = sizeof(sockaddr_in);
      return true;
    }
    out = sockaddr_storage{};
    auto *v6 = reinterpret_cast<sockaddr_in6 *>(&out);
    if (::inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1)
    {
      v6->sin6_family = AF_INET6;
      v6->sin6_port = htons(port);
      len = sizeof(sockaddr_in6);
      return true;
    }
    return false;
  }
};

} // namespace dns
} // namespace dnsrotor
