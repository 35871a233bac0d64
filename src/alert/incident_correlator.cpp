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

#include "watchtower/alert/incident_correlator.h"

#include <algorithm>
#include <stdexcept>

namespace watchtower {

namespace {

bool is_closed_out(incident_status status) {
    return status == incident_status::resolved || status == incident_status::closed;
}

std::vector<incident> sorted_by_creation(std::vector<incident> incidents) {
    std::sort(incidents.begin(), incidents.end(), [](const incident& a, const incident& b) {
        return a.created_at < b.created_at;
    });
    return incidents;
}

} // namespace

incident_correlator::incident_correlator(const incident_correlator_config& config,
                                         engine_logger logger)
    : config_(config), logger_(logger.for_component("incident_correlator")) {
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid incident_correlator configuration: " +
                                    validation.error().message);
    }
}

std::string incident_correlator::generate_id(time_point now) {
    return "incident_" + std::to_string(to_epoch_ms(now)) + "_" +
           std::to_string(sequence_.fetch_add(1) + 1);
}

incident* incident_correlator::find_open_for_category_locked(const std::string& category) {
    for (auto& [id, inc] : incidents_) {
        if (!inc.is_open()) {
            continue;
        }
        bool same_category = std::any_of(inc.alerts.begin(), inc.alerts.end(),
                                          [&category](const alert& member) {
                                              return member.category == category;
                                          });
        if (same_category) {
            return &inc;
        }
    }
    return nullptr;
}

incident incident_correlator::correlate(const alert& a, time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto* existing = find_open_for_category_locked(a.category)) {
        existing->alerts.push_back(a);
        existing->updated_at = now;
        existing->timeline.push_back(timeline_entry{
            now, "alert_added", "Added alert: " + a.title, std::nullopt, {{"alert_id", a.id}}});

        if (severity_rank(a.severity) > severity_rank(existing->severity)) {
            const auto previous = existing->severity;
            existing->severity = a.severity;
            existing->timeline.push_back(timeline_entry{
                now,
                "severity_escalated",
                std::string("Incident severity escalated from ") +
                    alert_severity_to_string(previous) + " to " +
                    alert_severity_to_string(a.severity),
                std::nullopt,
                {{"previous_severity", alert_severity_to_string(previous)},
                 {"new_severity", alert_severity_to_string(a.severity)},
                 {"triggering_alert_id", a.id}}});
            logger_.warning("Incident " + existing->id + " escalated to " +
                            alert_severity_to_string(a.severity));
        }
        return *existing;
    }

    incident created;
    created.id = generate_id(now);
    created.title = a.category + " - " + a.title;
    created.description = a.description;
    created.category = a.category;
    created.severity = a.severity;
    created.status = incident_status::open;
    created.alerts.push_back(a);
    created.created_at = now;
    created.updated_at = now;
    created.timeline.push_back(timeline_entry{
        now, "incident_created", "Incident created from alert: " + a.title, std::nullopt,
        {{"alert_id", a.id}}});

    logger_.warning("Incident created: " + created.id + " (" + created.title + ")");
    auto [it, inserted] = incidents_.emplace(created.id, std::move(created));
    return it->second;
}

result<incident> incident_correlator::missing(const std::string& incident_id) const {
    return make_error<incident>(error_code::incident_not_found,
                                "Incident not found: " + incident_id);
}

result<incident> incident_correlator::update_status(const std::string& incident_id,
                                                    incident_status status,
                                                    const std::optional<std::string>& user,
                                                    const std::optional<std::string>& notes,
                                                    time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return missing(incident_id);
    }
    auto& inc = it->second;
    const auto previous = inc.status;

    if (status == incident_status::open && previous != incident_status::open) {
        if (auto* other = find_open_for_category_locked(inc.category)) {
            return make_error<incident>(error_code::already_exists,
                                        "Incident " + other->id + " is already open for category '" +
                                            inc.category + "'");
        }
    }

    inc.status = status;
    inc.updated_at = now;
    if (is_closed_out(status)) {
        inc.resolved_at = now;
    }

    std::string description = std::string("Status changed from ") +
                              incident_status_to_string(previous) + " to " +
                              incident_status_to_string(status);
    if (notes && !notes->empty()) {
        description += ": " + *notes;
    }
    inc.timeline.push_back(timeline_entry{
        now, "status_changed", description, user,
        {{"previous_status", incident_status_to_string(previous)},
         {"new_status", incident_status_to_string(status)}}});

    logger_.info("Incident " + inc.id + " " + description);
    return make_success(inc);
}

result<incident> incident_correlator::assign(const std::string& incident_id,
                                             const std::string& assignee,
                                             const std::optional<std::string>& user,
                                             time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return missing(incident_id);
    }
    auto& inc = it->second;

    std::string description = "Incident assigned to " + assignee;
    std::map<std::string, std::string> metadata{{"assignee", assignee}};
    if (inc.assignee) {
        description += " (previously: " + *inc.assignee + ")";
        metadata["previous_assignee"] = *inc.assignee;
    }

    inc.assignee = assignee;
    inc.updated_at = now;
    inc.timeline.push_back(timeline_entry{now, "assigned", description, user, std::move(metadata)});
    return make_success(inc);
}

result<incident> incident_correlator::add_note(const std::string& incident_id,
                                               const std::string& note,
                                               const std::optional<std::string>& user,
                                               time_point now) {
    if (note.empty()) {
        return make_error<incident>(error_code::invalid_argument, "Note cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return missing(incident_id);
    }
    auto& inc = it->second;
    inc.updated_at = now;
    inc.timeline.push_back(timeline_entry{now, "note_added", note, user, {}});
    return make_success(inc);
}

std::size_t incident_correlator::auto_resolve_stale(time_point now,
                                                    std::chrono::milliseconds max_age) {
    std::vector<std::string> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, inc] : incidents_) {
            if (inc.is_open() && now - inc.created_at > max_age) {
                stale.push_back(id);
            }
        }
    }

    std::size_t resolved = 0;
    for (const auto& id : stale) {
        auto result = update_status(id, incident_status::resolved, std::string("system"),
                                    std::string("Auto-resolved due to age"), now);
        if (result.is_ok()) {
            ++resolved;
        }
    }

    if (resolved > 0) {
        logger_.info("Auto-resolved " + std::to_string(resolved) + " stale incidents");
    }
    return resolved;
}

std::optional<incident> incident_correlator::get_incident(const std::string& incident_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(incident_id);
    if (it == incidents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<incident> incident_correlator::get_open_incidents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<incident> result;
    for (const auto& [id, inc] : incidents_) {
        if (inc.is_open()) {
            result.push_back(inc);
        }
    }
    return sorted_by_creation(std::move(result));
}

std::vector<incident> incident_correlator::get_all_incidents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<incident> result;
    result.reserve(incidents_.size());
    for (const auto& [id, inc] : incidents_) {
        result.push_back(inc);
    }
    return sorted_by_creation(std::move(result));
}

std::vector<incident> incident_correlator::get_incidents_by_category(
    const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<incident> result;
    for (const auto& [id, inc] : incidents_) {
        if (inc.category == category) {
            result.push_back(inc);
        }
    }
    return sorted_by_creation(std::move(result));
}

std::vector<incident> incident_correlator::get_incidents_by_assignee(
    const std::string& assignee) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<incident> result;
    for (const auto& [id, inc] : incidents_) {
        if (inc.assignee && *inc.assignee == assignee) {
            result.push_back(inc);
        }
    }
    return sorted_by_creation(std::move(result));
}

std::size_t incident_correlator::prune(time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t before = incidents_.size();

    for (auto it = incidents_.begin(); it != incidents_.end();) {
        if (is_closed_out(it->second.status) && now - it->second.updated_at > config_.retention) {
            it = incidents_.erase(it);
        } else {
            ++it;
        }
    }

    if (incidents_.size() > config_.max_incidents) {
        std::vector<std::pair<time_point, std::string>> candidates;
        for (const auto& [id, inc] : incidents_) {
            if (is_closed_out(inc.status)) {
                candidates.emplace_back(inc.updated_at, id);
            }
        }
        std::sort(candidates.begin(), candidates.end());

        std::size_t excess = incidents_.size() - config_.max_incidents;
        for (const auto& candidate : candidates) {
            if (excess == 0) {
                break;
            }
            incidents_.erase(candidate.second);
            --excess;
        }
    }

    const std::size_t removed = before - incidents_.size();
    if (removed > 0) {
        logger_.info("Cleaned up " + std::to_string(removed) + " old incidents");
    }
    return removed;
}

incident_statistics incident_correlator::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    incident_statistics stats;
    stats.total = incidents_.size();

    std::chrono::milliseconds total_resolution{0};
    std::size_t resolved_count = 0;

    for (const auto& [id, inc] : incidents_) {
        switch (inc.status) {
            case incident_status::open:          ++stats.open; break;
            case incident_status::investigating: ++stats.investigating; break;
            case incident_status::resolved:      ++stats.resolved; break;
            case incident_status::closed:        ++stats.closed; break;
        }
        ++stats.by_severity[alert_severity_to_string(inc.severity)];
        ++stats.by_category[inc.category];

        if (inc.resolved_at) {
            total_resolution +=
                std::chrono::duration_cast<std::chrono::milliseconds>(*inc.resolved_at - inc.created_at);
            ++resolved_count;
        }
    }

    if (resolved_count > 0) {
        stats.average_resolution_time =
            total_resolution / static_cast<std::chrono::milliseconds::rep>(resolved_count);
    }
    return stats;
}

std::size_t incident_correlator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incidents_.size();
}

} // namespace watchtower
