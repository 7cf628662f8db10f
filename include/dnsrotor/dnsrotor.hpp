// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/cancellation.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/settings.hpp"
#include "crypto/secure_rng.hpp"
#include "dns/health_cache.hpp"
#include "dns/resolver_pair.hpp"
#include "dns/resolver_probe.hpp"
#include "dns/selection_policy.hpp"
#include "rotation/rotation_controller.hpp"
#include "system/dns_configurator.hpp"
#include "system/instance_lock.hpp"
#include "system/shell_runner.hpp"
#include "system/signal_watcher.hpp"

#define DNSROTOR_VERSION "1.0.0"
