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

#include "watchtower/alert/alert_store.h"

#include <algorithm>

namespace watchtower {

result_void alert_store::insert(const alert& a) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (alerts_.find(a.id) != alerts_.end()) {
        return make_void_error(error_code::alert_already_exists,
                               "Alert with id '" + a.id + "' already exists");
    }
    alerts_.emplace(a.id, a);
    order_.push_back(a.id);
    return make_void_success();
}

bool alert_store::contains(const std::string& alert_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alerts_.find(alert_id) != alerts_.end();
}

std::optional<alert> alert_store::get(const std::string& alert_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool alert_store::resolve(const std::string& alert_id,
                          const std::string& resolved_by,
                          time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end() || it->second.resolved) {
        return false;
    }
    it->second.resolved = true;
    it->second.resolved_at = now;
    it->second.resolved_by = resolved_by;
    return true;
}

std::optional<alert> alert_store::mark_escalated(const std::string& alert_id, time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end() || it->second.resolved || it->second.escalated) {
        return std::nullopt;
    }
    it->second.escalated = true;
    it->second.escalated_at = now;
    return it->second;
}

std::vector<alert> alert_store::resolve_stale(time_point now,
                                              std::chrono::milliseconds threshold,
                                              const std::string& resolved_by) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<alert> resolved;
    for (const auto& id : order_) {
        auto& a = alerts_.at(id);
        if (!a.resolved && now - a.timestamp > threshold) {
            a.resolved = true;
            a.resolved_at = now;
            a.resolved_by = resolved_by;
            resolved.push_back(a);
        }
    }
    return resolved;
}

std::vector<alert> alert_store::active_alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<alert> result;
    for (const auto& id : order_) {
        const auto& a = alerts_.at(id);
        if (!a.resolved) {
            result.push_back(a);
        }
    }
    return result;
}

std::vector<alert> alert_store::all_alerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<alert> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(alerts_.at(id));
    }
    return result;
}

void alert_store::erase_locked(const std::string& alert_id) {
    alerts_.erase(alert_id);
}

std::size_t alert_store::prune(time_point now,
                               std::chrono::milliseconds retention,
                               std::size_t max_alerts) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t before = order_.size();

    std::vector<std::string> kept;
    kept.reserve(order_.size());
    for (const auto& id : order_) {
        const auto& a = alerts_.at(id);
        if (a.resolved && now - a.timestamp > retention) {
            erase_locked(id);
        } else {
            kept.push_back(id);
        }
    }

    // Oldest resolved alerts go first when over capacity.
    std::size_t excess = kept.size() > max_alerts ? kept.size() - max_alerts : 0;
    if (excess > 0) {
        std::vector<std::string> survivors;
        survivors.reserve(kept.size());
        for (const auto& id : kept) {
            if (excess > 0 && alerts_.at(id).resolved) {
                erase_locked(id);
                --excess;
            } else {
                survivors.push_back(id);
            }
        }
        kept.swap(survivors);
    }

    order_.swap(kept);
    return before - order_.size();
}

alert_counts alert_store::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    alert_counts counts;
    counts.total = alerts_.size();
    for (const auto& [id, a] : alerts_) {
        if (a.resolved) {
            ++counts.resolved;
        } else {
            ++counts.active;
            if (a.severity == alert_severity::critical) {
                ++counts.critical_active;
            }
        }
        if (a.escalated) {
            ++counts.escalated;
        }
        ++counts.by_category[a.category];
        ++counts.by_severity[alert_severity_to_string(a.severity)];
    }
    return counts;
}

std::size_t alert_store::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alerts_.size();
}

void alert_store::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    alerts_.clear();
    order_.clear();
}

} // namespace watchtower
