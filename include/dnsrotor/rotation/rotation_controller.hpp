// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "dnsrotor/core/cancellation.hpp"
#include "dnsrotor/core/logger.hpp"
#include "dnsrotor/dns/resolver_pair.hpp"
#include "dnsrotor/dns/selection_policy.hpp"
#include "dnsrotor/system/dns_configurator.hpp"

namespace dnsrotor
{
namespace rotation
{

/// \brief Rotates the resolvers of one interface on a timer.
///
/// The controller is Active until the OS reports a pair other than the one it
/// last applied (drift), which usually means a VPN or another tool took over
/// DNS. It then stays Paused, changing nothing, until the reported pair matches
/// again.
class RotationController
{
public:
  static constexpr std::int64_t MinRotationInterval = 180;
  static constexpr std::int64_t MaxRotationInterval = 86400;

  enum class State
  {
    Active,
    Paused
  };

  /// \brief What one loop iteration observed and did.
  struct TickOutcome
  {
    bool drift = false;
    bool vpnActive = false;
    State state = State::Active;
    bool rotated = false;
  };

  RotationController(system::DnsConfigurator &configurator, dns::SelectionPolicy &policy,
                     dns::CandidateList candidates, std::string interface,
                     std::int64_t intervalSeconds,
                     int maxRetries = dns::SelectionPolicy::DefaultMaxRetries)
    : _configurator(configurator), _policy(policy), _candidates(std::move(candidates)),
      _interface(std::move(interface)), _interval(clampInterval(intervalSeconds)),
      _maxRetries(maxRetries)
  {
    DNSROTOR_LOG_INFO("DNS rotation initialized for interface: " << _interface);
  }

  /// \brief Limits \p seconds to [MinRotationInterval, MaxRotationInterval], warning when it moves.
  static std::int64_t clampInterval(std::int64_t seconds)
  {
    if (seconds < MinRotationInterval)
    {
      DNSROTOR_LOG_WARN("Interval " << seconds << "s is too short. Using minimum "
                                    << MinRotationInterval << "s.");
      return MinRotationInterval;
    }
    if (seconds > MaxRotationInterval)
    {
      DNSROTOR_LOG_WARN("Interval " << seconds << "s exceeds maximum. Using maximum "
                                    << MaxRotationInterval << "s.");
      return MaxRotationInterval;
    }
    DNSROTOR_LOG_INFO("Rotation interval set to " << seconds << "s");
    return seconds;
  }

  std::chrono::seconds effectiveInterval() const { return std::chrono::seconds(_interval); }

  State state() const { return _state; }

  bool running() const { return _running.load(); }

  /// \brief Pair this controller last applied successfully, if any.
  const std::optional<dns::ResolverPair> &lastApplied() const { return _current; }

  const std::string &interface() const { return _interface; }

  /// \brief Applies a healthy pair other than the current one.
  /// \return false if no alternative exists this cycle or the apply failed
  bool rotate()
  {
    auto choice = _policy.choose(_candidates, _current, _maxRetries);
    if (!choice)
    {
      DNSROTOR_LOG_WARN("No alternative DNS available this cycle. Keeping current DNS.");
      return false;
    }
    return apply(*choice);
  }

  bool rotateOnce()
  {
    DNSROTOR_LOG_INFO("Running single DNS rotation");
    return rotate();
  }

  /// \brief Pair the OS currently reports for the interface.
  std::optional<dns::ResolverPair> getCurrent() { return _configurator.readResolvers(_interface); }

  /// \brief Applies \p pair as given, after checking both addresses.
  bool setExplicit(const dns::ResolverPair &pair)
  {
    if (!pair.isValid())
    {
      DNSROTOR_LOG_ERROR("Invalid DNS address: '" << pair.primary() << "' or '"
                                                  << pair.secondary() << "'");
      return false;
    }
    return apply(pair);
  }

  /// \brief Returns the interface to automatically assigned resolvers.
  bool reset()
  {
    system::CommandResult result = _configurator.clearResolvers(_interface);
    if (!result.ok)
    {
      DNSROTOR_LOG_ERROR("Error resetting DNS: " << result.message);
      return false;
    }
    _current.reset();
    DNSROTOR_LOG_INFO("DNS reset to automatic configuration");
    return true;
  }

  /// \brief True if the OS reports a pair other than the one last applied.
  ///
  /// Nothing applied yet, or an unreadable value, counts as no drift.
  bool driftDetected()
  {
    if (!_current)
    {
      return false;
    }
    auto reported = _configurator.readResolvers(_interface);
    if (!reported)
    {
      DNSROTOR_LOG_WARN("Could not read current DNS; skipping overwrite check.");
      return false;
    }
    if (*reported != *_current)
    {
      DNSROTOR_LOG_WARN("DNS overwrite detected! Expected: " << *_current
                                                           << ", Current: " << *reported);
      return true;
    }
    return false;
  }

  /// \brief One iteration after the sleep: drift check, state transition, rotation.
  TickOutcome tick()
  {
    TickOutcome outcome;
    outcome.drift = driftDetected();

    if (outcome.drift)
    {
      if (_state == State::Active)
      {
        outcome.vpnActive = _configurator.isVpnActive();
        if (outcome.vpnActive)
        {
          DNSROTOR_LOG_WARN("VPN detected with DNS overwrite. Pausing rotation to avoid conflicts.");
        }
        else
        {
          DNSROTOR_LOG_WARN("DNS was overwritten by an external process. Pausing rotation.");
        }
        _state = State::Paused;
      }
    }
    else if (_state == State::Paused)
    {
      DNSROTOR_LOG_INFO("DNS is stable again. Resuming rotation.");
      _state = State::Active;
    }

    if (_state == State::Active)
    {
      outcome.rotated = rotate();
    }
    else
    {
      DNSROTOR_LOG_DEBUG("Rotation paused on " << _interface);
    }

    outcome.state = _state;
    return outcome;
  }

  /// \brief Rotates once, then every interval until \p token is cancelled.
  ///
  /// Errors inside an iteration are logged and the loop goes on. Cancellation
  /// wakes the sleep immediately; no final rotation or reset is made.
  void runContinuous(core::CancellationToken &token)
  {
    runContinuous(token, effectiveInterval());
  }

  /// \brief Same loop, sleeping \p period between iterations instead of the interval.
  void runContinuous(core::CancellationToken &token, std::chrono::milliseconds period)
  {
    _running = true;
    DNSROTOR_LOG_INFO("Starting DNS rotation every " << period.count() / 1000.0 << " seconds");

    guarded([this] { rotate(); });

    while (!token.waitFor(period))
    {
      guarded([this] { tick(); });
    }

    _running = false;
    DNSROTOR_LOG_INFO("DNS rotation stopped");
  }

private:
  bool apply(const dns::ResolverPair &pair)
  {
    system::CommandResult result = _configurator.applyResolvers(_interface, pair);
    if (!result.ok)
    {
      DNSROTOR_LOG_ERROR("Error changing DNS: " << result.message);
      return false;
    }
    _current = pair;
    DNSROTOR_LOG_INFO("DNS changed to: " << pair);
    return true;
  }

  template <typename Fn> void guarded(Fn &&fn)
  {
    try
    {
      fn();
    }
    catch (const std::exception &e)
    {
      DNSROTOR_LOG_ERROR("Unexpected error in rotation loop: " << e.what());
    }
  }

  system::DnsConfigurator &_configurator;
  dns::SelectionPolicy &_policy;
  dns::CandidateList _candidates;
  std::string _interface;
  std::int64_t _interval;
  int _maxRetries;
  State _state = State::Active;
  std::atomic<bool> _running{false};
  std::optional<dns::ResolverPair> _current;
};

} // namespace rotation
} // namespace dnsrotor
