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
 * @file alert_types.h
 * @brief Core alert and incident data structures
 *
 * Alerts are created by rule evaluation (or manually) and go through two
 * one-way transitions: resolution and escalation. Incidents group alerts
 * of one category and carry an append-only timeline.
 */

#include "../core/result_types.h"
#include "../utils/time_format.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace watchtower {

/**
 * @enum alert_severity
 * @brief Ordered severity levels: info < warning < error < critical
 */
enum class alert_severity : uint8_t {
    info = 1,
    warning = 2,
    error = 3,
    critical = 4
};

constexpr const char* alert_severity_to_string(alert_severity severity) noexcept {
    switch (severity) {
        case alert_severity::info:     return "info";
        case alert_severity::warning:  return "warning";
        case alert_severity::error:    return "error";
        case alert_severity::critical: return "critical";
        default:                       return "unknown";
    }
}

/**
 * @brief Numeric rank used for severity comparisons (1..4)
 */
constexpr int severity_rank(alert_severity severity) noexcept {
    return static_cast<int>(severity);
}

inline result<alert_severity> parse_severity(const std::string& str) {
    if (str == "info") return make_success(alert_severity::info);
    if (str == "warning") return make_success(alert_severity::warning);
    if (str == "error") return make_success(alert_severity::error);
    if (str == "critical") return make_success(alert_severity::critical);
    return make_error<alert_severity>(error_code::unknown_severity,
                                      "Unknown severity: " + str);
}

/**
 * @enum incident_status
 * @brief Lifecycle status of an incident
 */
enum class incident_status : uint8_t {
    open = 0,
    investigating,
    resolved,
    closed
};

constexpr const char* incident_status_to_string(incident_status status) noexcept {
    switch (status) {
        case incident_status::open:          return "open";
        case incident_status::investigating: return "investigating";
        case incident_status::resolved:      return "resolved";
        case incident_status::closed:        return "closed";
        default:                             return "unknown";
    }
}

inline result<incident_status> parse_incident_status(const std::string& str) {
    if (str == "open") return make_success(incident_status::open);
    if (str == "investigating") return make_success(incident_status::investigating);
    if (str == "resolved") return make_success(incident_status::resolved);
    if (str == "closed") return make_success(incident_status::closed);
    return make_error<incident_status>(error_code::invalid_argument,
                                       "Unknown incident status: " + str);
}

/**
 * @enum channel_type
 * @brief Outbound notification transports
 */
enum class channel_type : uint8_t {
    slack = 0,
    email,
    webhook,
    pagerduty
};

constexpr const char* channel_type_to_string(channel_type type) noexcept {
    switch (type) {
        case channel_type::slack:     return "slack";
        case channel_type::email:     return "email";
        case channel_type::webhook:   return "webhook";
        case channel_type::pagerduty: return "pagerduty";
        default:                      return "unknown";
    }
}

inline result<channel_type> parse_channel_type(const std::string& str) {
    if (str == "slack") return make_success(channel_type::slack);
    if (str == "email") return make_success(channel_type::email);
    if (str == "webhook") return make_success(channel_type::webhook);
    if (str == "pagerduty") return make_success(channel_type::pagerduty);
    return make_error<channel_type>(error_code::invalid_argument,
                                    "Unknown channel type: " + str);
}

/**
 * @struct notification_channel
 * @brief A destination for notifications
 *
 * The config map carries transport routing such as "channel" for slack,
 * "recipients" for email, "url" for webhooks and "routing_key" for pagerduty.
 */
struct notification_channel {
    channel_type type = channel_type::webhook;
    std::unordered_map<std::string, std::string> config;
    bool enabled = true;

    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = config.find(key);
        return it != config.end() ? it->second : fallback;
    }

    static notification_channel slack(const std::string& channel) {
        return {channel_type::slack, {{"channel", channel}}, true};
    }

    static notification_channel email(const std::string& recipients) {
        return {channel_type::email, {{"recipients", recipients}}, true};
    }

    static notification_channel webhook(const std::string& url) {
        return {channel_type::webhook, {{"url", url}}, true};
    }

    static notification_channel pagerduty(const std::string& routing_key) {
        return {channel_type::pagerduty, {{"routing_key", routing_key}}, true};
    }
};

/**
 * @struct alert
 * @brief A fired (or manually raised) alert
 *
 * resolved and escalated only ever go from false to true. Both are
 * changed exclusively through alert_store so readers get consistent
 * snapshots.
 */
struct alert {
    std::string id;
    std::string title;
    std::string description;
    alert_severity severity = alert_severity::info;
    std::string category;
    std::string source;
    time_point timestamp;
    std::map<std::string, std::string> metadata;

    bool resolved = false;
    std::optional<time_point> resolved_at;
    std::optional<std::string> resolved_by;

    bool escalated = false;
    std::optional<time_point> escalated_at;

    bool is_active() const { return !resolved; }
};

/**
 * @struct timeline_entry
 * @brief One append-only record in an incident's history
 */
struct timeline_entry {
    time_point timestamp;
    std::string action;
    std::string description;
    std::optional<std::string> user;
    std::map<std::string, std::string> metadata;
};

/**
 * @struct incident
 * @brief A group of related alerts sharing a category
 *
 * severity never decreases; alerts and timeline are append-only.
 */
struct incident {
    std::string id;
    std::string title;
    std::string description;
    std::string category;
    alert_severity severity = alert_severity::info;
    incident_status status = incident_status::open;
    std::vector<alert> alerts;
    time_point created_at;
    time_point updated_at;
    std::optional<time_point> resolved_at;
    std::optional<std::string> assignee;
    std::vector<timeline_entry> timeline;

    bool is_open() const { return status == incident_status::open; }
};

} // namespace watchtower
