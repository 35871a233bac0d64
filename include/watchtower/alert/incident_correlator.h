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
 * @file incident_correlator.h
 * @brief Groups alerts of one category into incidents
 *
 * The correlator owns every incident. For each correlated alert it either
 * appends to the open incident of that category or opens a new one, and
 * records what happened on the incident's timeline.
 */

#include "alert_types.h"
#include "../core/engine_logger.h"
#include "../core/result_types.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace watchtower {

/**
 * @struct incident_correlator_config
 * @brief Retention bounds for closed-out incidents
 */
struct incident_correlator_config {
    std::chrono::milliseconds retention{std::chrono::hours(24 * 30)};
    std::size_t max_incidents = 1000;

    result_void validate() const {
        if (retention <= std::chrono::milliseconds::zero()) {
            return make_void_error(error_code::invalid_configuration,
                                   "Incident retention must be positive");
        }
        if (max_incidents == 0) {
            return make_void_error(error_code::invalid_configuration,
                                   "Max incidents must be positive");
        }
        return make_void_success();
    }
};

/**
 * @struct incident_statistics
 * @brief Counters over all known incidents
 */
struct incident_statistics {
    std::size_t total = 0;
    std::size_t open = 0;
    std::size_t investigating = 0;
    std::size_t resolved = 0;
    std::size_t closed = 0;
    std::map<std::string, std::size_t> by_severity;
    std::map<std::string, std::size_t> by_category;
    std::chrono::milliseconds average_resolution_time{0};
};

/**
 * @class incident_correlator
 * @brief Thread-safe incident bookkeeping
 *
 * At most one incident per category has status open at any time, and an
 * incident's severity never decreases.
 */
class incident_correlator {
public:
    explicit incident_correlator(const incident_correlator_config& config = {},
                                 engine_logger logger = {});

    /**
     * @brief Attach an alert to the open incident of its category, or open one
     *
     * Appending writes an "alert_added" timeline entry, followed by a
     * "severity_escalated" entry when the alert outranks the incident.
     * Opening writes an "incident_created" entry.
     * @return Snapshot of the affected incident
     */
    incident correlate(const alert& a, time_point now);

    /**
     * @brief Change status, recording a "status_changed" entry
     *
     * Resolving or closing sets resolved_at. Reopening fails with
     * already_exists while another incident of the category is open.
     */
    result<incident> update_status(const std::string& incident_id,
                                   incident_status status,
                                   const std::optional<std::string>& user,
                                   const std::optional<std::string>& notes,
                                   time_point now);

    result<incident> assign(const std::string& incident_id,
                            const std::string& assignee,
                            const std::optional<std::string>& user,
                            time_point now);

    result<incident> add_note(const std::string& incident_id,
                              const std::string& note,
                              const std::optional<std::string>& user,
                              time_point now);

    /**
     * @brief Resolve open incidents created more than max_age ago
     * @return Number of incidents resolved
     */
    std::size_t auto_resolve_stale(time_point now, std::chrono::milliseconds max_age);

    std::optional<incident> get_incident(const std::string& incident_id) const;

    /**
     * @brief Incidents whose status is exactly open
     */
    std::vector<incident> get_open_incidents() const;
    std::vector<incident> get_all_incidents() const;
    std::vector<incident> get_incidents_by_category(const std::string& category) const;
    std::vector<incident> get_incidents_by_assignee(const std::string& assignee) const;

    /**
     * @brief Drop resolved or closed incidents not updated within retention,
     *        then the least recently updated resolved or closed ones beyond
     *        max_incidents; open and investigating incidents are never dropped
     * @return Number of incidents removed
     */
    std::size_t prune(time_point now);

    incident_statistics statistics() const;
    std::size_t size() const;

private:
    std::string generate_id(time_point now);
    incident* find_open_for_category_locked(const std::string& category);
    result<incident> missing(const std::string& incident_id) const;

    incident_correlator_config config_;
    engine_logger logger_;
    std::atomic<std::uint64_t> sequence_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, incident> incidents_;
};

} // namespace watchtower
