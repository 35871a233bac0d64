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
 * @file alert_rule.h
 * @brief Alert conditions and rule definitions
 *
 * A rule binds a condition on one metric to an alert template: severity,
 * category, cooldown, escalation delay and notification channels.
 */

#include "alert_types.h"
#include "../core/result_types.h"

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace watchtower {

/**
 * @enum condition_operator
 * @brief Comparison applied between a sample value and the threshold
 *
 * gt, lt, gte, lte and eq are numeric. contains and not_contains compare
 * the string forms of value and threshold.
 */
enum class condition_operator : uint8_t {
    gt = 0,
    lt,
    gte,
    lte,
    eq,
    contains,
    not_contains
};

constexpr const char* condition_operator_to_string(condition_operator op) noexcept {
    switch (op) {
        case condition_operator::gt:           return "gt";
        case condition_operator::lt:           return "lt";
        case condition_operator::gte:          return "gte";
        case condition_operator::lte:          return "lte";
        case condition_operator::eq:           return "eq";
        case condition_operator::contains:     return "contains";
        case condition_operator::not_contains: return "not_contains";
        default:                               return "unknown";
    }
}

constexpr bool is_categorical(condition_operator op) noexcept {
    return op == condition_operator::contains || op == condition_operator::not_contains;
}

/**
 * @brief Parse operator from its name or symbol (">", "<", ">=", "<=", "==")
 */
inline result<condition_operator> parse_operator(const std::string& str) {
    if (str == "gt" || str == ">") return make_success(condition_operator::gt);
    if (str == "lt" || str == "<") return make_success(condition_operator::lt);
    if (str == "gte" || str == ">=") return make_success(condition_operator::gte);
    if (str == "lte" || str == "<=") return make_success(condition_operator::lte);
    if (str == "eq" || str == "==") return make_success(condition_operator::eq);
    if (str == "contains") return make_success(condition_operator::contains);
    if (str == "not_contains") return make_success(condition_operator::not_contains);
    return make_error<condition_operator>(error_code::unknown_operator,
                                          "Unknown operator: " + str);
}

/**
 * @brief Numeric or categorical threshold
 */
using condition_threshold = std::variant<double, std::string>;

/**
 * @struct alert_condition
 * @brief When a rule passes: op(latest, threshold) inside time_window,
 *        optionally held for consecutive_failures samples
 */
struct alert_condition {
    std::string metric;
    condition_operator op = condition_operator::gt;
    condition_threshold threshold{0.0};
    std::chrono::milliseconds time_window{std::chrono::minutes(5)};
    std::optional<int> consecutive_failures;

    bool has_numeric_threshold() const {
        return std::holds_alternative<double>(threshold);
    }

    result_void validate() const {
        if (metric.empty()) {
            return make_void_error(error_code::invalid_rule,
                                   "Condition metric cannot be empty");
        }
        if (time_window <= std::chrono::milliseconds::zero()) {
            return make_void_error(error_code::invalid_rule,
                                   "Condition time window must be positive");
        }
        if (consecutive_failures && *consecutive_failures < 1) {
            return make_void_error(error_code::invalid_rule,
                                   "Consecutive failures must be at least 1");
        }
        if (!is_categorical(op) && !has_numeric_threshold()) {
            return make_void_error(error_code::invalid_threshold,
                                   std::string("Operator '") + condition_operator_to_string(op) +
                                       "' requires a numeric threshold");
        }
        return make_void_success();
    }
};

/**
 * @class alert_rule
 * @brief Declarative rule evaluated whenever its metric is recorded
 *
 * @code
 * alert_rule rule("high_latency");
 * rule.set_name("High latency")
 *     .set_category("api_performance")
 *     .set_severity(alert_severity::warning)
 *     .set_condition({"api_response_time", condition_operator::gt, 5000.0,
 *                     std::chrono::minutes(5), 3})
 *     .set_cooldown(std::chrono::minutes(10));
 * @endcode
 */
class alert_rule {
public:
    alert_rule() = default;

    explicit alert_rule(std::string rule_id)
        : id_(std::move(rule_id)), name_(id_) {}

    const std::string& id() const { return id_; }

    alert_rule& set_id(std::string rule_id) {
        id_ = std::move(rule_id);
        return *this;
    }

    const std::string& name() const { return name_; }

    alert_rule& set_name(std::string rule_name) {
        name_ = std::move(rule_name);
        return *this;
    }

    const std::string& description() const { return description_; }

    alert_rule& set_description(std::string description) {
        description_ = std::move(description);
        return *this;
    }

    const std::string& category() const { return category_; }

    alert_rule& set_category(std::string category) {
        category_ = std::move(category);
        return *this;
    }

    alert_severity severity() const { return severity_; }

    alert_rule& set_severity(alert_severity sev) {
        severity_ = sev;
        return *this;
    }

    const alert_condition& condition() const { return condition_; }

    alert_rule& set_condition(alert_condition condition) {
        condition_ = std::move(condition);
        return *this;
    }

    /**
     * @brief Metric this rule listens to
     */
    const std::string& metric_name() const { return condition_.metric; }

    bool enabled() const { return enabled_; }

    alert_rule& set_enabled(bool enabled) {
        enabled_ = enabled;
        return *this;
    }

    std::chrono::milliseconds cooldown() const { return cooldown_; }

    /**
     * @brief Minimum time between two alerts fired by this rule
     */
    alert_rule& set_cooldown(std::chrono::milliseconds cooldown) {
        cooldown_ = cooldown;
        return *this;
    }

    std::chrono::milliseconds escalation_delay() const { return escalation_delay_; }

    /**
     * @brief Delay before an unresolved alert is escalated (zero disables)
     */
    alert_rule& set_escalation_delay(std::chrono::milliseconds delay) {
        escalation_delay_ = delay;
        return *this;
    }

    const std::vector<notification_channel>& channels() const { return channels_; }

    alert_rule& add_channel(notification_channel channel) {
        channels_.push_back(std::move(channel));
        return *this;
    }

    alert_rule& set_channels(std::vector<notification_channel> channels) {
        channels_ = std::move(channels);
        return *this;
    }

    result_void validate() const {
        if (id_.empty()) {
            return make_void_error(error_code::invalid_rule, "Rule id cannot be empty");
        }
        if (cooldown_ < std::chrono::milliseconds::zero()) {
            return make_void_error(error_code::invalid_rule,
                                   "Rule '" + id_ + "' has a negative cooldown");
        }
        if (escalation_delay_ < std::chrono::milliseconds::zero()) {
            return make_void_error(error_code::invalid_rule,
                                   "Rule '" + id_ + "' has a negative escalation delay");
        }
        auto condition_check = condition_.validate();
        if (condition_check.is_err()) {
            return make_void_error(code_of(condition_check.error()),
                                   "Rule '" + id_ + "': " + condition_check.error().message);
        }
        return make_void_success();
    }

private:
    std::string id_;
    std::string name_;
    std::string description_;
    std::string category_{"system_health"};
    alert_severity severity_ = alert_severity::warning;
    alert_condition condition_;
    bool enabled_ = true;
    std::chrono::milliseconds cooldown_{std::chrono::minutes(10)};
    std::chrono::milliseconds escalation_delay_{0};
    std::vector<notification_channel> channels_;
};

} // namespace watchtower
