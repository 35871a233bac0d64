// BSD 3-Clause License
//
// Copyright (c) 2021-2025, kcenon
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

/**
 * @file engine_config.h
 * @brief Configuration of the alert engine and its background tasks
 */

#include "alert_types.h"
#include "../core/result_types.h"
#include "../utils/config_parser.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace watchtower {

/**
 * @struct engine_config
 * @brief Tunables for ingestion, correlation, delivery and maintenance
 *
 * Keys accepted by from_config_map() match the field names. Durations
 * accept the config_parser suffixes (ms, s, m, h, d).
 */
struct engine_config {
    bool enabled = true;
    std::string service_name{"watchtower"};
    std::string environment{"development"};

    std::size_t max_samples_per_metric = 1000;

    /// Alerts at or above this severity are correlated into incidents.
    alert_severity incident_min_severity = alert_severity::error;

    std::chrono::milliseconds stale_alert_threshold{std::chrono::hours(24)};
    std::chrono::milliseconds stale_sweep_interval{std::chrono::minutes(5)};

    std::chrono::milliseconds health_check_interval{std::chrono::minutes(1)};
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(10)};
    double probe_failure_latency_ms = 30000.0;

    std::chrono::milliseconds notification_timeout{std::chrono::seconds(10)};

    std::chrono::milliseconds cleanup_interval{std::chrono::hours(1)};
    std::chrono::milliseconds alert_retention{std::chrono::hours(24 * 7)};
    std::size_t max_alerts = 10000;
    std::chrono::milliseconds incident_retention{std::chrono::hours(24 * 30)};
    std::size_t max_incidents = 1000;
    /// Open incidents older than this are resolved by cleanup(); zero disables.
    std::chrono::milliseconds incident_auto_resolve_age{0};

    /// Receives escalation notifications; escalations are only recorded when unset.
    std::optional<notification_channel> escalation_channel;

    /// Channels used for manually raised alerts.
    std::vector<notification_channel> default_channels;

    result_void validate() const;

    /**
     * @brief Build from key/value configuration, starting from defaults
     */
    static result<engine_config> from_config_map(const config_map& config);

    /**
     * @brief Build from WATCHTOWER_* environment variables
     *
     * WATCHTOWER_ENABLED, WATCHTOWER_SERVICE_NAME, WATCHTOWER_ENVIRONMENT,
     * WATCHTOWER_ESCALATION_WEBHOOK and the upper-cased form of every
     * from_config_map() key.
     */
    static result<engine_config> from_environment();
};

} // namespace watchtower
