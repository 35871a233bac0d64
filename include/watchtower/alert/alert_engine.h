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
 * @file alert_engine.h
 * @brief Entry point of the alerting pipeline
 *
 * The engine wires metric ingestion, rule evaluation, cooldowns, alert
 * storage, incident correlation, notification dispatch, escalation and
 * periodic maintenance into one explicitly constructed instance.
 */

#include "alert_rule.h"
#include "alert_store.h"
#include "alert_types.h"
#include "condition_evaluator.h"
#include "cooldown_tracker.h"
#include "engine_config.h"
#include "escalation_scheduler.h"
#include "incident_correlator.h"
#include "notification_dispatcher.h"
#include "rule_registry.h"
#include "../core/engine_logger.h"
#include "../core/periodic_task.h"
#include "../core/result_types.h"
#include "../health/health_probe.h"
#include "../utils/metric_store.h"

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace watchtower {

/**
 * @struct manual_alert
 * @brief An alert raised directly by the application instead of a rule
 */
struct manual_alert {
    std::string type;                   ///< e.g. "payment_gateway_down"; becomes the title
    std::string message;
    alert_severity severity = alert_severity::warning;
    std::string category{"system_health"};
    std::string source{"Manual"};
    std::map<std::string, std::string> metadata;
    std::vector<notification_channel> channels;     ///< empty: engine default channels
};

/**
 * @struct alert_statistics
 * @brief Snapshot returned by alert_engine::get_statistics()
 */
struct alert_statistics {
    std::size_t total_alerts = 0;
    std::size_t active_alerts = 0;
    std::size_t resolved_alerts = 0;
    std::size_t critical_alerts = 0;    ///< active and critical
    std::size_t open_incidents = 0;
    std::size_t escalated_alerts = 0;
    std::map<std::string, std::size_t> alerts_by_category;
    std::map<std::string, std::size_t> alerts_by_severity;
};

/**
 * @struct alert_engine_metrics
 * @brief Operation counters of the engine
 */
struct alert_engine_metrics {
    std::atomic<uint64_t> samples_recorded{0};
    std::atomic<uint64_t> rules_evaluated{0};
    std::atomic<uint64_t> evaluation_errors{0};
    std::atomic<uint64_t> alerts_fired{0};
    std::atomic<uint64_t> alerts_suppressed{0};
    std::atomic<uint64_t> alerts_resolved{0};
    std::atomic<uint64_t> alerts_escalated{0};
    std::atomic<uint64_t> stale_alerts_resolved{0};

    alert_engine_metrics() = default;

    alert_engine_metrics(const alert_engine_metrics& other)
        : samples_recorded(other.samples_recorded.load())
        , rules_evaluated(other.rules_evaluated.load())
        , evaluation_errors(other.evaluation_errors.load())
        , alerts_fired(other.alerts_fired.load())
        , alerts_suppressed(other.alerts_suppressed.load())
        , alerts_resolved(other.alerts_resolved.load())
        , alerts_escalated(other.alerts_escalated.load())
        , stale_alerts_resolved(other.stale_alerts_resolved.load()) {}
};

/**
 * @class alert_engine
 * @brief Evaluates rules on every recorded sample and drives alert follow-up
 *
 * Ingestion and evaluation of one metric name are serialized; different
 * metrics are processed concurrently. Incident correlation, dispatch and
 * escalation arming happen after the per-metric section is released.
 *
 * @thread_safety All public methods may be called from multiple threads.
 *
 * @code
 * engine_config config;
 * config.service_name = "checkout";
 *
 * alert_engine engine(config, logger);
 * engine.load_rules(default_rule_definitions());
 * engine.register_channel_client(channel_type::slack, slack_client);
 * engine.start();
 *
 * engine.record_metric("api_response_time", 6200.0);
 * @endcode
 */
class alert_engine {
public:
    using clock_func = std::function<time_point()>;

    explicit alert_engine(const engine_config& config = {},
                          std::shared_ptr<common::interfaces::ILogger> logger = nullptr);
    ~alert_engine();

    alert_engine(const alert_engine&) = delete;
    alert_engine& operator=(const alert_engine&) = delete;
    alert_engine(alert_engine&&) = delete;
    alert_engine& operator=(alert_engine&&) = delete;

    // ========== Lifecycle ==========

    /**
     * @brief Start the escalation worker, stale sweeper, cleanup task and
     *        health probe (when one is set)
     */
    result_void start();
    result_void stop();
    bool is_running() const { return running_.load(); }

    // ========== Rules ==========

    result_void add_rule(const alert_rule& rule);
    result_void remove_rule(const std::string& rule_id);
    result_void toggle_rule(const std::string& rule_id, bool enabled);
    result<std::size_t> load_rules(const std::vector<rule_definition>& definitions);

    // ========== Ingestion ==========

    /**
     * @brief Record a sample and evaluate every enabled rule on that metric
     *
     * Never throws; failures are logged.
     */
    void record_metric(const std::string& name, double value) noexcept;

    /**
     * @brief Raise an alert that bypasses rules and cooldowns
     */
    result<alert> send_alert(const manual_alert& request);

    // ========== Alerts ==========

    /**
     * @brief Resolve an active alert and cancel its pending escalation
     * @return false when the alert is unknown or already resolved
     */
    bool resolve_alert(const std::string& alert_id, const std::string& resolved_by = "user");

    std::vector<alert> get_active_alerts() const;
    std::vector<alert> get_all_alerts() const;
    std::optional<alert> get_alert(const std::string& alert_id) const;

    // ========== Incidents ==========

    std::vector<incident> get_open_incidents() const;
    std::vector<incident> get_all_incidents() const;
    std::optional<incident> get_incident(const std::string& incident_id) const;
    std::vector<incident> get_incidents_by_assignee(const std::string& assignee) const;

    result<incident> update_incident_status(const std::string& incident_id,
                                            incident_status status,
                                            const std::optional<std::string>& user = std::nullopt,
                                            const std::optional<std::string>& notes = std::nullopt);
    result<incident> assign_incident(const std::string& incident_id,
                                     const std::string& assignee,
                                     const std::optional<std::string>& user = std::nullopt);
    result<incident> add_incident_note(const std::string& incident_id,
                                       const std::string& note,
                                       const std::optional<std::string>& user = std::nullopt);

    // ========== Statistics ==========

    alert_statistics get_statistics() const;
    incident_statistics get_incident_statistics() const { return incidents_.statistics(); }
    alert_engine_metrics get_metrics() const { return metrics_; }

    // ========== Maintenance ==========

    /**
     * @brief Resolve active alerts older than stale_alert_threshold
     * @return Number of alerts resolved
     */
    std::size_t sweep_stale_alerts();

    /**
     * @brief Apply alert and incident retention limits
     *
     * When incident_auto_resolve_age is set, open incidents older than it
     * are resolved first.
     * @return Number of alerts and incidents removed
     */
    std::size_t cleanup();

    bool clear_cooldown(const std::string& rule_id);
    void clear_all_cooldowns();

    // ========== Health probe ==========

    /**
     * @brief Install the health probe run every health_check_interval
     * @return already_started while the engine is running
     */
    result_void set_health_probe(health_probe::probe_function probe);

    /**
     * @brief Run the health probe immediately
     */
    result<probe_report> run_health_check();

    // ========== Collaborators ==========

    void register_channel_client(channel_type type, std::shared_ptr<channel_client> client);

    /**
     * @brief Replace the wall clock used for sample and alert timestamps
     */
    void set_clock(clock_func clock);
    time_point now() const;

    const engine_config& config() const { return config_; }
    rule_registry& rules() { return registry_; }
    const metric_store& samples() const { return store_; }
    incident_correlator& incidents() { return incidents_; }
    notification_dispatcher& dispatcher() { return dispatcher_; }
    escalation_scheduler& escalations() { return scheduler_; }

private:
    struct fired_alert {
        alert record;
        rule_registry::rule_ptr rule;
    };

    std::mutex& metric_lock(const std::string& name);
    alert build_alert(const alert_rule& rule, double value, time_point now) const;
    alert store_unique(alert a);
    std::optional<incident> correlate_if_severe(const alert& a);
    void handle_fired(const fired_alert& fired);
    void escalate(const std::string& alert_id);

    engine_config config_;
    engine_logger logger_;
    alert_engine_metrics metrics_;

    mutable std::mutex clock_mutex_;
    clock_func clock_;

    metric_store store_;
    rule_registry registry_;
    condition_evaluator evaluator_;
    cooldown_tracker cooldowns_;
    alert_store alerts_;
    incident_correlator incidents_;
    notification_dispatcher dispatcher_;
    escalation_scheduler scheduler_;

    std::mutex metric_locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> metric_locks_;

    std::atomic<uint64_t> manual_sequence_{0};

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::unique_ptr<health_probe> probe_;
    std::unique_ptr<periodic_task> sweeper_;
    std::unique_ptr<periodic_task> cleanup_task_;
};

} // namespace watchtower
