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
 * @file alert_store.h
 * @brief Authoritative, thread-safe store of alerts
 */

#include "alert_types.h"
#include "../core/result_types.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace watchtower {

/**
 * @struct alert_counts
 * @brief Point-in-time counters over the stored alerts
 */
struct alert_counts {
    std::size_t total = 0;
    std::size_t active = 0;
    std::size_t resolved = 0;
    std::size_t critical_active = 0;
    std::size_t escalated = 0;
    std::map<std::string, std::size_t> by_category;
    std::map<std::string, std::size_t> by_severity;
};

/**
 * @class alert_store
 * @brief Holds every alert by id in creation order
 *
 * All state transitions happen under the store's lock so that a reader
 * never observes a half-resolved or half-escalated alert, and concurrent
 * resolve calls flip an alert exactly once.
 */
class alert_store {
public:
    /**
     * @brief Store a new alert
     * @return alert_already_exists if the id is taken
     */
    result_void insert(const alert& a);

    bool contains(const std::string& alert_id) const;
    std::optional<alert> get(const std::string& alert_id) const;

    /**
     * @brief Resolve an active alert
     * @return false when the alert is unknown or already resolved
     */
    bool resolve(const std::string& alert_id,
                 const std::string& resolved_by,
                 time_point now);

    /**
     * @brief Mark an active, not yet escalated alert as escalated
     * @return Snapshot after the transition, or nullopt when nothing changed
     */
    std::optional<alert> mark_escalated(const std::string& alert_id, time_point now);

    /**
     * @brief Resolve every active alert older than threshold
     *
     * An alert is stale when now - timestamp > threshold.
     * @return The alerts that were resolved
     */
    std::vector<alert> resolve_stale(time_point now,
                                     std::chrono::milliseconds threshold,
                                     const std::string& resolved_by);

    std::vector<alert> active_alerts() const;
    std::vector<alert> all_alerts() const;

    /**
     * @brief Drop resolved alerts older than retention, then the oldest
     *        resolved alerts until at most max_alerts remain
     *
     * Active alerts are never pruned.
     * @return Number of alerts removed
     */
    std::size_t prune(time_point now,
                      std::chrono::milliseconds retention,
                      std::size_t max_alerts);

    alert_counts counts() const;
    std::size_t size() const;
    void clear();

private:
    void erase_locked(const std::string& alert_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, alert> alerts_;
    std::vector<std::string> order_;
};

} // namespace watchtower
