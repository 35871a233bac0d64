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

#include "watchtower/alert/rule_registry.h"

namespace watchtower {

// ========== rule_builder ==========

result<alert_rule> rule_builder::build(const rule_definition& def) {
    if (def.id.empty()) {
        return make_error<alert_rule>(error_code::invalid_rule, "Rule id is required");
    }
    if (def.condition.metric.empty()) {
        return make_error<alert_rule>(error_code::invalid_rule,
                                      "Rule '" + def.id + "' requires a metric");
    }

    auto severity = parse_severity(def.severity);
    if (severity.is_err()) {
        return make_error<alert_rule>(error_code::unknown_severity,
                                      "Rule '" + def.id + "': " + severity.error().message);
    }

    auto op = parse_operator(def.condition.operator_str);
    if (op.is_err()) {
        return make_error<alert_rule>(error_code::unknown_operator,
                                      "Rule '" + def.id + "': " + op.error().message);
    }

    if (def.cooldown_seconds < 0 || def.escalation_seconds < 0) {
        return make_error<alert_rule>(error_code::invalid_rule,
                                      "Rule '" + def.id + "' has a negative duration");
    }

    alert_condition condition;
    condition.metric = def.condition.metric;
    condition.op = op.value();
    if (def.condition.threshold_text.empty()) {
        condition.threshold = def.condition.threshold;
    } else {
        condition.threshold = def.condition.threshold_text;
    }
    condition.time_window = std::chrono::seconds(def.condition.window_seconds);
    if (def.condition.consecutive_failures != 0) {
        condition.consecutive_failures = def.condition.consecutive_failures;
    }

    alert_rule rule(def.id);
    rule.set_name(def.name.empty() ? def.id : def.name)
        .set_description(def.description)
        .set_category(def.category)
        .set_severity(severity.value())
        .set_enabled(def.enabled)
        .set_condition(std::move(condition))
        .set_cooldown(std::chrono::seconds(def.cooldown_seconds))
        .set_escalation_delay(std::chrono::seconds(def.escalation_seconds))
        .set_channels(def.channels);

    auto validation = rule.validate();
    if (validation.is_err()) {
        return make_error<alert_rule>(code_of(validation.error()), validation.error().message);
    }
    return make_success(std::move(rule));
}

// ========== rule_registry ==========

rule_registry::rule_registry(engine_logger logger)
    : logger_(logger.for_component("rule_registry")) {}

result_void rule_registry::add_rule(const alert_rule& rule) {
    auto validation = rule.validate();
    if (validation.is_err()) {
        logger_.error("Rejected rule '" + rule.id() + "': " + validation.error().message);
        return validation;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rules_.find(rule.id()) != rules_.end()) {
            return make_void_error(error_code::rule_already_exists,
                                   "Rule with id '" + rule.id() + "' already exists");
        }
        rules_.emplace(rule.id(), std::make_shared<const alert_rule>(rule));
    }

    logger_.info("Registered rule '" + rule.id() + "' on metric '" + rule.metric_name() + "'");
    return make_void_success();
}

result_void rule_registry::remove_rule(const std::string& rule_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rules_.erase(rule_id) == 0) {
            return make_void_error(error_code::rule_not_found, "Rule not found: " + rule_id);
        }
    }
    logger_.info("Removed rule '" + rule_id + "'");
    return make_void_success();
}

result_void rule_registry::set_enabled(const std::string& rule_id, bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rules_.find(rule_id);
        if (it == rules_.end()) {
            return make_void_error(error_code::rule_not_found, "Rule not found: " + rule_id);
        }
        if (it->second->enabled() == enabled) {
            return make_void_success();
        }
        alert_rule updated = *it->second;
        updated.set_enabled(enabled);
        it->second = std::make_shared<const alert_rule>(std::move(updated));
    }
    logger_.info("Rule '" + rule_id + "' " + (enabled ? "enabled" : "disabled"));
    return make_void_success();
}

rule_registry::rule_ptr rule_registry::get_rule(const std::string& rule_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(rule_id);
    return it != rules_.end() ? it->second : nullptr;
}

std::vector<rule_registry::rule_ptr> rule_registry::get_all_rules() const {
    return select([](const alert_rule&) { return true; });
}

std::vector<rule_registry::rule_ptr> rule_registry::get_enabled_rules() const {
    return select([](const alert_rule& rule) { return rule.enabled(); });
}

std::vector<rule_registry::rule_ptr> rule_registry::rules_for_metric(
    const std::string& metric) const {
    return select([&metric](const alert_rule& rule) {
        return rule.enabled() && rule.metric_name() == metric;
    });
}

std::vector<rule_registry::rule_ptr> rule_registry::get_rules_by_category(
    const std::string& category) const {
    return select([&category](const alert_rule& rule) { return rule.category() == category; });
}

std::vector<rule_registry::rule_ptr> rule_registry::get_rules_by_severity(
    alert_severity severity) const {
    return select([severity](const alert_rule& rule) { return rule.severity() == severity; });
}

rule_statistics rule_registry::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    rule_statistics stats;
    stats.total = rules_.size();
    for (const auto& [id, rule] : rules_) {
        if (rule->enabled()) {
            ++stats.enabled;
        } else {
            ++stats.disabled;
        }
        ++stats.by_category[rule->category()];
        ++stats.by_severity[alert_severity_to_string(rule->severity())];
    }
    return stats;
}

std::size_t rule_registry::rule_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

result<std::size_t> rule_registry::load_definitions(
    const std::vector<rule_definition>& definitions) {
    std::size_t loaded = 0;
    std::vector<std::string> errors;

    for (const auto& def : definitions) {
        auto rule_result = rule_builder::build(def);
        if (rule_result.is_err()) {
            errors.push_back(def.id + ": " + rule_result.error().message);
            continue;
        }
        auto reg_result = add_rule(rule_result.value());
        if (reg_result.is_err()) {
            errors.push_back(def.id + ": " + reg_result.error().message);
            continue;
        }
        ++loaded;
    }

    for (const auto& error : errors) {
        logger_.error("Failed to load rule " + error);
    }

    if (!errors.empty() && loaded == 0) {
        return make_error<std::size_t>(error_code::configuration_parse_error,
                                       "Failed to load any rules: " + errors.front());
    }
    return make_success(loaded);
}

void rule_registry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.clear();
}

// ========== built-in rules ==========

std::vector<rule_definition> default_rule_definitions() {
    std::vector<rule_definition> rules;

    {
        rule_definition def;
        def.id = "high_api_response_time";
        def.name = "High API Response Time";
        def.description = "API response time is above acceptable threshold";
        def.category = "api_performance";
        def.severity = "warning";
        def.condition.metric = "api_response_time";
        def.condition.operator_str = "gt";
        def.condition.threshold = 5000;
        def.condition.window_seconds = 5 * 60;
        def.condition.consecutive_failures = 3;
        def.cooldown_seconds = 10 * 60;
        def.escalation_seconds = 30 * 60;
        def.channels.push_back(notification_channel::slack("#alerts"));
        rules.push_back(std::move(def));
    }
    {
        rule_definition def;
        def.id = "critical_api_response_time";
        def.name = "Critical API Response Time";
        def.description = "API response time is critically high";
        def.category = "api_performance";
        def.severity = "critical";
        def.condition.metric = "api_response_time";
        def.condition.operator_str = "gt";
        def.condition.threshold = 15000;
        def.condition.window_seconds = 3 * 60;
        def.condition.consecutive_failures = 2;
        def.cooldown_seconds = 5 * 60;
        def.escalation_seconds = 15 * 60;
        def.channels.push_back(notification_channel::slack("#critical-alerts"));
        def.channels.push_back(notification_channel::email("oncall@example.com"));
        rules.push_back(std::move(def));
    }
    {
        rule_definition def;
        def.id = "high_error_rate";
        def.name = "High Error Rate";
        def.description = "Error rate is above acceptable threshold";
        def.category = "system_health";
        def.severity = "error";
        def.condition.metric = "error_rate";
        def.condition.operator_str = "gt";
        def.condition.threshold = 5;
        def.condition.window_seconds = 5 * 60;
        def.condition.consecutive_failures = 2;
        def.cooldown_seconds = 10 * 60;
        def.escalation_seconds = 20 * 60;
        def.channels.push_back(notification_channel::slack("#alerts"));
        rules.push_back(std::move(def));
    }
    {
        rule_definition def;
        def.id = "database_connection_failure";
        def.name = "Database Connection Failure";
        def.description = "Unable to connect to database";
        def.category = "database";
        def.severity = "critical";
        def.condition.metric = "database_health";
        def.condition.operator_str = "contains";
        def.condition.threshold_text = "unhealthy";
        def.condition.window_seconds = 60;
        def.condition.consecutive_failures = 1;
        def.cooldown_seconds = 3 * 60;
        def.escalation_seconds = 5 * 60;
        def.channels.push_back(notification_channel::slack("#critical-alerts"));
        rules.push_back(std::move(def));
    }
    {
        rule_definition def;
        def.id = "ai_service_failure";
        def.name = "AI Service Failure";
        def.description = "AI service success rate is below threshold";
        def.category = "ai_service";
        def.severity = "error";
        def.condition.metric = "ai_success_rate";
        def.condition.operator_str = "lt";
        def.condition.threshold = 90;
        def.condition.window_seconds = 10 * 60;
        def.condition.consecutive_failures = 2;
        def.cooldown_seconds = 15 * 60;
        def.escalation_seconds = 30 * 60;
        def.channels.push_back(notification_channel::slack("#alerts"));
        rules.push_back(std::move(def));
    }
    {
        rule_definition def;
        def.id = "security_breach_attempt";
        def.name = "Security Breach Attempt";
        def.description = "Multiple failed login attempts detected";
        def.category = "security";
        def.severity = "critical";
        def.condition.metric = "failed_login_attempts";
        def.condition.operator_str = "gt";
        def.condition.threshold = 10;
        def.condition.window_seconds = 5 * 60;
        def.condition.consecutive_failures = 1;
        def.cooldown_seconds = 10 * 60;
        def.escalation_seconds = 5 * 60;
        def.channels.push_back(notification_channel::slack("#security-alerts"));
        def.channels.push_back(notification_channel::email("security@example.com"));
        rules.push_back(std::move(def));
    }

    return rules;
}

} // namespace watchtower
