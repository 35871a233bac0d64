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
 * @file error_codes.h
 * @brief Error codes reported by the watchtower alerting engine
 */

#include <cstdint>
#include <string>

namespace watchtower {

/**
 * @enum error_code
 * @brief Domain error codes, grouped by component range
 */
enum class error_code : std::int32_t {
    success = 0,

    // Configuration errors (1000-1999)
    invalid_configuration = 1000,
    invalid_argument = 1001,
    configuration_parse_error = 1002,

    // Rule errors (2000-2999)
    rule_not_found = 2000,
    rule_already_exists = 2001,
    invalid_rule = 2002,
    invalid_threshold = 2003,
    unknown_operator = 2004,
    unknown_severity = 2005,
    evaluation_failed = 2006,

    // Alert and incident errors (3000-3999)
    alert_not_found = 3000,
    alert_already_exists = 3001,
    incident_not_found = 3002,
    invalid_state_transition = 3003,
    already_exists = 3004,

    // Notification errors (4000-4999)
    channel_not_registered = 4000,
    channel_disabled = 4001,
    delivery_failed = 4002,
    delivery_timeout = 4003,

    // Scheduling errors (5000-5999)
    already_started = 5000,
    not_running = 5001,
    already_armed = 5002,

    // Health probe errors (6000-6999)
    probe_not_configured = 6000,
    probe_failed = 6001,
    probe_timeout = 6002,

    unknown_error = 9999
};

/**
 * @brief Convert error code to human-readable string
 */
inline std::string error_code_to_string(error_code code) {
    switch (code) {
        case error_code::success:
            return "Success";

        case error_code::invalid_configuration:
            return "Invalid configuration";
        case error_code::invalid_argument:
            return "Invalid argument";
        case error_code::configuration_parse_error:
            return "Configuration parse error";

        case error_code::rule_not_found:
            return "Rule not found";
        case error_code::rule_already_exists:
            return "Rule already exists";
        case error_code::invalid_rule:
            return "Invalid rule";
        case error_code::invalid_threshold:
            return "Invalid threshold";
        case error_code::unknown_operator:
            return "Unknown operator";
        case error_code::unknown_severity:
            return "Unknown severity";
        case error_code::evaluation_failed:
            return "Condition evaluation failed";

        case error_code::alert_not_found:
            return "Alert not found";
        case error_code::alert_already_exists:
            return "Alert already exists";
        case error_code::incident_not_found:
            return "Incident not found";
        case error_code::invalid_state_transition:
            return "Invalid state transition";
        case error_code::already_exists:
            return "Already exists";

        case error_code::channel_not_registered:
            return "No client registered for channel";
        case error_code::channel_disabled:
            return "Channel disabled";
        case error_code::delivery_failed:
            return "Notification delivery failed";
        case error_code::delivery_timeout:
            return "Notification delivery timed out";

        case error_code::already_started:
            return "Already started";
        case error_code::not_running:
            return "Not running";
        case error_code::already_armed:
            return "Escalation already armed";

        case error_code::probe_not_configured:
            return "Health probe not configured";
        case error_code::probe_failed:
            return "Health probe failed";
        case error_code::probe_timeout:
            return "Health probe timed out";

        case error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

} // namespace watchtower
