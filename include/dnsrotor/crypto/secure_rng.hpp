// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace dnsrotor
{
namespace crypto
{

/// \brief Cryptographically secure random numbers backed by OpenSSL RAND_bytes().
class SecureRng
{
public:
  /// \brief Fill a buffer with cryptographically secure random bytes.
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    if (len == 0)
    {
      return;
    }
    if (RAND_bytes(dst, static_cast<int>(len)) != 1)
    {
      throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
    }
  }

  /// \brief Returns a value uniformly distributed in [0, bound).
  ///
  /// Draws 64-bit words and rejects the tail that would bias the modulo.
  /// \throws std::invalid_argument if bound is zero
  /// \throws std::runtime_error if RAND_bytes fails
  static std::uint64_t uniform(std::uint64_t bound)
  {
    if (bound == 0)
    {
      throw std::invalid_argument("SecureRng/uniform: bound must be positive");
    }
    const std::uint64_t limit =
      std::numeric_limits<std::uint64_t>::max() - (std::numeric_limits<std::uint64_t>::max() % bound);
    while (true)
    {
      std::uint64_t word = 0;
      fill(reinterpret_cast<std::uint8_t *>(&word), sizeof(word));
      if (word < limit)
      {
        return word % bound;
      }
    }
  }

private:
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

} // namespace crypto
} // namespace dnsrotor
