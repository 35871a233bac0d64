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

#include "watchtower/alert/alert_engine.h"

#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>

namespace watchtower {

namespace {

const engine_config& validated(const engine_config& config) {
    auto validation = config.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid alert_engine configuration: " +
                                    validation.error().message);
    }
    return config;
}

metric_store_config store_config(const engine_config& config) {
    metric_store_config cfg;
    cfg.max_samples_per_metric = config.max_samples_per_metric;
    return cfg;
}

incident_correlator_config incident_config(const engine_config& config) {
    incident_correlator_config cfg;
    cfg.retention = config.incident_retention;
    cfg.max_incidents = config.max_incidents;
    return cfg;
}

notification_dispatcher_config dispatcher_config(const engine_config& config) {
    notification_dispatcher_config cfg;
    cfg.service_name = config.service_name;
    cfg.environment = config.environment;
    cfg.timeout = config.notification_timeout;
    return cfg;
}

std::string manual_title(const std::string& type) {
    std::string title = type;
    for (auto& c : title) {
        c = (c == '_') ? ' ' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return title;
}

} // namespace

// ========== Construction / lifecycle ==========

alert_engine::alert_engine(const engine_config& config,
                           std::shared_ptr<common::interfaces::ILogger> logger)
    : config_(validated(config))
    , logger_(std::move(logger), "alert_engine")
    , clock_([] { return clock_type::now(); })
    , store_(store_config(config_))
    , registry_(logger_)
    , evaluator_(store_)
    , incidents_(incident_config(config_), logger_)
    , dispatcher_(dispatcher_config(config_), logger_)
    , scheduler_([this](const std::string& alert_id) { escalate(alert_id); }, logger_) {
    sweeper_ = std::make_unique<periodic_task>(
        "stale_sweeper", config_.stale_sweep_interval, [this] { sweep_stale_alerts(); },
        logger_.for_component("stale_sweeper"));
    cleanup_task_ = std::make_unique<periodic_task>(
        "cleanup", config_.cleanup_interval, [this] { cleanup(); },
        logger_.for_component("cleanup"));
}

alert_engine::~alert_engine() {
    if (running_.load()) {
        stop();
    }
}

result_void alert_engine::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return make_void_error(error_code::already_started, "Alert engine is already running");
    }

    auto scheduler_started = scheduler_.start();
    if (scheduler_started.is_err()) {
        return scheduler_started;
    }
    auto sweeper_started = sweeper_->start();
    if (sweeper_started.is_err()) {
        scheduler_.stop();
        return sweeper_started;
    }
    auto cleanup_started = cleanup_task_->start();
    if (cleanup_started.is_err()) {
        sweeper_->stop();
        scheduler_.stop();
        return cleanup_started;
    }
    if (probe_) {
        auto probe_started = probe_->start();
        if (probe_started.is_err()) {
            cleanup_task_->stop();
            sweeper_->stop();
            scheduler_.stop();
            return probe_started;
        }
    }

    running_.store(true);
    logger_.info("Alert engine started for " + config_.service_name + " (" +
                 config_.environment + ")");
    return make_void_success();
}

result_void alert_engine::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        return make_void_success();
    }

    result_void outcome = make_void_success();
    auto keep_first_error = [&outcome](result_void stopped) {
        if (stopped.is_err() && outcome.is_ok()) {
            outcome = std::move(stopped);
        }
    };

    if (probe_) {
        keep_first_error(probe_->stop());
    }
    keep_first_error(cleanup_task_->stop());
    keep_first_error(sweeper_->stop());
    keep_first_error(scheduler_.stop());

    running_.store(false);
    if (outcome.is_err()) {
        logger_.error("Alert engine stopped with errors: " + outcome.error().message);
    } else {
        logger_.info("Alert engine stopped");
    }
    return outcome;
}

// ========== Rules ==========

result_void alert_engine::add_rule(const alert_rule& rule) {
    return registry_.add_rule(rule);
}

result_void alert_engine::remove_rule(const std::string& rule_id) {
    auto removed = registry_.remove_rule(rule_id);
    if (removed.is_ok()) {
        cooldowns_.clear(rule_id);
    }
    return removed;
}

result_void alert_engine::toggle_rule(const std::string& rule_id, bool enabled) {
    return registry_.set_enabled(rule_id, enabled);
}

result<std::size_t> alert_engine::load_rules(const std::vector<rule_definition>& definitions) {
    return registry_.load_definitions(definitions);
}

// ========== Ingestion ==========

std::mutex& alert_engine::metric_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(metric_locks_mutex_);
    auto& slot = metric_locks_[name];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

alert alert_engine::build_alert(const alert_rule& rule, double value, time_point now) const {
    const auto& condition = rule.condition();
    const auto value_text = format_metric_value(value);
    const auto threshold_text = format_threshold(condition.threshold);

    alert a;
    a.id = rule.id() + "_" + std::to_string(to_epoch_ms(now));
    a.title = rule.name();
    a.description = rule.description() + ". Current value: " + value_text +
                    ", Threshold: " + threshold_text;
    a.severity = rule.severity();
    a.category = rule.category();
    a.source = "rule_engine";
    a.timestamp = now;
    a.metadata = {
        {"rule_id", rule.id()},
        {"metric", condition.metric},
        {"value", value_text},
        {"threshold", threshold_text},
        {"operator", condition_operator_to_string(condition.op)},
    };
    return a;
}

alert alert_engine::store_unique(alert a) {
    const std::string base_id = a.id;
    for (int suffix = 2; alerts_.insert(a).is_err(); ++suffix) {
        a.id = base_id + "_" + std::to_string(suffix);
    }
    return a;
}

void alert_engine::record_metric(const std::string& name, double value) noexcept {
    if (!config_.enabled) {
        return;
    }

    try {
        std::vector<fired_alert> fired;
        {
            std::lock_guard<std::mutex> lock(metric_lock(name));
            const auto timestamp = now();

            store_.record_sample(name, value, timestamp);
            metrics_.samples_recorded.fetch_add(1);

            for (const auto& rule : registry_.rules_for_metric(name)) {
                metrics_.rules_evaluated.fetch_add(1);

                if (cooldowns_.is_suppressed(rule->id(), rule->cooldown(), timestamp)) {
                    metrics_.alerts_suppressed.fetch_add(1);
                    continue;
                }

                auto verdict = evaluator_.evaluate(rule->condition(), value, timestamp);
                if (verdict.is_err()) {
                    metrics_.evaluation_errors.fetch_add(1);
                    logger_.error("Failed to evaluate rule '" + rule->id() + "': " +
                                  verdict.error().message);
                    continue;
                }
                if (!verdict.value()) {
                    continue;
                }

                auto stored = store_unique(build_alert(*rule, value, timestamp));
                cooldowns_.record_fire(rule->id(), timestamp);
                metrics_.alerts_fired.fetch_add(1);
                fired.push_back(fired_alert{std::move(stored), rule});
            }
        }

        for (const auto& f : fired) {
            handle_fired(f);
        }
    } catch (const std::exception& e) {
        logger_.error("Failed to process metric '" + name + "': " + e.what());
    }
}

std::optional<incident> alert_engine::correlate_if_severe(const alert& a) {
    if (severity_rank(a.severity) < severity_rank(config_.incident_min_severity)) {
        return std::nullopt;
    }
    return incidents_.correlate(a, now());
}

void alert_engine::handle_fired(const fired_alert& fired) {
    const auto& a = fired.record;
    logger_.warning("Alert triggered: " + a.title + " [" + alert_severity_to_string(a.severity) +
                    "] " + a.description);

    auto related = correlate_if_severe(a);
    dispatcher_.dispatch(a, fired.rule->channels(), related ? &*related : nullptr);

    const auto delay = fired.rule->escalation_delay();
    if (delay > std::chrono::milliseconds::zero()) {
        auto armed = scheduler_.arm(a.id, delay);
        if (armed.is_err()) {
            logger_.error("Could not arm escalation for " + a.id + ": " + armed.error().message);
        }
    }
}

result<alert> alert_engine::send_alert(const manual_alert& request) {
    if (request.type.empty()) {
        return make_error<alert>(error_code::invalid_argument, "Manual alert type is required");
    }

    const auto timestamp = now();
    alert a;
    a.id = "manual_" + std::to_string(to_epoch_ms(timestamp)) + "_" +
           std::to_string(manual_sequence_.fetch_add(1) + 1);
    a.title = manual_title(request.type);
    a.description = request.message;
    a.severity = request.severity;
    a.category = request.category.empty() ? "system_health" : request.category;
    a.source = request.source.empty() ? "Manual" : request.source;
    a.timestamp = timestamp;
    a.metadata = request.metadata;
    a.metadata["type"] = request.type;

    auto stored = store_unique(std::move(a));
    metrics_.alerts_fired.fetch_add(1);
    logger_.warning("Manual alert raised: " + stored.title);

    auto related = correlate_if_severe(stored);
    const auto& channels = request.channels.empty() ? config_.default_channels : request.channels;
    dispatcher_.dispatch(stored, channels, related ? &*related : nullptr);

    return make_success(std::move(stored));
}

// ========== Alerts ==========

bool alert_engine::resolve_alert(const std::string& alert_id, const std::string& resolved_by) {
    if (!alerts_.resolve(alert_id, resolved_by, now())) {
        return false;
    }
    scheduler_.cancel(alert_id);
    metrics_.alerts_resolved.fetch_add(1);
    logger_.info("Alert resolved: " + alert_id + " by " + resolved_by);
    return true;
}

std::vector<alert> alert_engine::get_active_alerts() const {
    return alerts_.active_alerts();
}

std::vector<alert> alert_engine::get_all_alerts() const {
    return alerts_.all_alerts();
}

std::optional<alert> alert_engine::get_alert(const std::string& alert_id) const {
    return alerts_.get(alert_id);
}

void alert_engine::escalate(const std::string& alert_id) {
    auto escalated = alerts_.mark_escalated(alert_id, now());
    if (!escalated) {
        return;
    }

    metrics_.alerts_escalated.fetch_add(1);
    logger_.warning("Escalating alert: " + escalated->title + " (" + alert_id + ")");

    if (config_.escalation_channel) {
        dispatcher_.dispatch_escalation(*escalated, *config_.escalation_channel);
    }
}

// ========== Incidents ==========

std::vector<incident> alert_engine::get_open_incidents() const {
    return incidents_.get_open_incidents();
}

std::vector<incident> alert_engine::get_all_incidents() const {
    return incidents_.get_all_incidents();
}

std::optional<incident> alert_engine::get_incident(const std::string& incident_id) const {
    return incidents_.get_incident(incident_id);
}

std::vector<incident> alert_engine::get_incidents_by_assignee(const std::string& assignee) const {
    return incidents_.get_incidents_by_assignee(assignee);
}

result<incident> alert_engine::update_incident_status(const std::string& incident_id,
                                                      incident_status status,
                                                      const std::optional<std::string>& user,
                                                      const std::optional<std::string>& notes) {
    return incidents_.update_status(incident_id, status, user, notes, now());
}

result<incident> alert_engine::assign_incident(const std::string& incident_id,
                                               const std::string& assignee,
                                               const std::optional<std::string>& user) {
    return incidents_.assign(incident_id, assignee, user, now());
}

result<incident> alert_engine::add_incident_note(const std::string& incident_id,
                                                 const std::string& note,
                                                 const std::optional<std::string>& user) {
    return incidents_.add_note(incident_id, note, user, now());
}

// ========== Statistics ==========

alert_statistics alert_engine::get_statistics() const {
    const auto counts = alerts_.counts();

    alert_statistics stats;
    stats.total_alerts = counts.total;
    stats.active_alerts = counts.active;
    stats.resolved_alerts = counts.resolved;
    stats.critical_alerts = counts.critical_active;
    stats.escalated_alerts = counts.escalated;
    stats.alerts_by_category = counts.by_category;
    stats.alerts_by_severity = counts.by_severity;
    stats.open_incidents = incidents_.get_open_incidents().size();
    return stats;
}

// ========== Maintenance ==========

std::size_t alert_engine::sweep_stale_alerts() {
    auto resolved = alerts_.resolve_stale(now(), config_.stale_alert_threshold,
                                          "system_auto_resolve");
    for (const auto& a : resolved) {
        scheduler_.cancel(a.id);
        logger_.warning("Auto-resolved stale alert: " + a.title + " (" + a.id + ")");
    }
    metrics_.stale_alerts_resolved.fetch_add(resolved.size());
    metrics_.alerts_resolved.fetch_add(resolved.size());
    return resolved.size();
}

std::size_t alert_engine::cleanup() {
    const auto timestamp = now();
    if (config_.incident_auto_resolve_age > std::chrono::milliseconds::zero()) {
        incidents_.auto_resolve_stale(timestamp, config_.incident_auto_resolve_age);
    }
    const auto alerts_removed = alerts_.prune(timestamp, config_.alert_retention, config_.max_alerts);
    const auto incidents_removed = incidents_.prune(timestamp);
    if (alerts_removed > 0) {
        logger_.info("Cleaned up " + std::to_string(alerts_removed) + " old alerts");
    }
    return alerts_removed + incidents_removed;
}

bool alert_engine::clear_cooldown(const std::string& rule_id) {
    return cooldowns_.clear(rule_id);
}

void alert_engine::clear_all_cooldowns() {
    cooldowns_.clear_all();
}

// ========== Health probe ==========

result_void alert_engine::set_health_probe(health_probe::probe_function probe) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return make_void_error(error_code::already_started,
                               "Cannot replace the health probe while running");
    }
    if (!probe) {
        probe_.reset();
        return make_void_success();
    }

    health_probe_config cfg;
    cfg.interval = config_.health_check_interval;
    cfg.timeout = config_.probe_timeout;
    cfg.failure_latency_ms = config_.probe_failure_latency_ms;

    probe_ = std::make_unique<health_probe>(
        std::move(probe),
        [this](const std::string& metric, double value) { record_metric(metric, value); },
        cfg, logger_);
    return make_void_success();
}

result<probe_report> alert_engine::run_health_check() {
    if (!probe_) {
        return make_error<probe_report>(error_code::probe_not_configured);
    }
    return make_success(probe_->run_once());
}

// ========== Collaborators ==========

void alert_engine::register_channel_client(channel_type type,
                                           std::shared_ptr<channel_client> client) {
    dispatcher_.register_client(type, std::move(client));
}

void alert_engine::set_clock(clock_func clock) {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    clock_ = clock ? std::move(clock) : clock_func([] { return clock_type::now(); });
}

time_point alert_engine::now() const {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    return clock_();
}

} // namespace watchtower
