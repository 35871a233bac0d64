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
 * @file rule_registry.h
 * @brief Rule definitions, validation and the live rule set
 *
 * Rules can be declared as plain rule_definition records (for example
 * loaded from configuration) and turned into validated alert_rule
 * instances by rule_builder. The registry hands out immutable snapshots:
 * toggling a rule swaps in a modified copy, so an evaluation that already
 * holds a snapshot keeps a consistent view.
 */

#include "alert_rule.h"
#include "../core/engine_logger.h"
#include "../core/result_types.h"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace watchtower {

/**
 * @struct rule_definition
 * @brief Declarative description of an alert rule
 */
struct rule_definition {
    std::string id;
    std::string name;
    std::string description;
    std::string category{"system_health"};
    std::string severity{"warning"};    // "info", "warning", "error", "critical"
    bool enabled = true;

    struct condition_config {
        std::string metric;
        std::string operator_str{"gt"}; // "gt", "lt", "gte", "lte", "eq", "contains", "not_contains"
        double threshold = 0.0;
        std::string threshold_text;     // used instead of threshold when non-empty
        int window_seconds = 300;
        int consecutive_failures = 0;   // 0 leaves the requirement unset
    } condition;

    int cooldown_seconds = 600;
    int escalation_seconds = 0;
    std::vector<notification_channel> channels;
};

/**
 * @class rule_builder
 * @brief Builds validated alert_rule instances from definitions
 */
class rule_builder {
public:
    static result<alert_rule> build(const rule_definition& def);
};

/**
 * @struct rule_statistics
 * @brief Summary of the registered rule set
 */
struct rule_statistics {
    std::size_t total = 0;
    std::size_t enabled = 0;
    std::size_t disabled = 0;
    std::map<std::string, std::size_t> by_category;
    std::map<std::string, std::size_t> by_severity;
};

/**
 * @class rule_registry
 * @brief Thread-safe set of registered rules keyed by rule id
 */
class rule_registry {
public:
    using rule_ptr = std::shared_ptr<const alert_rule>;

    explicit rule_registry(engine_logger logger = {});

    /**
     * @brief Validate and register a rule
     * @return invalid_rule / invalid_threshold when validation fails,
     *         rule_already_exists when the id is taken
     */
    result_void add_rule(const alert_rule& rule);

    result_void remove_rule(const std::string& rule_id);

    /**
     * @brief Enable or disable a rule by swapping in a modified copy
     */
    result_void set_enabled(const std::string& rule_id, bool enabled);

    rule_ptr get_rule(const std::string& rule_id) const;
    std::vector<rule_ptr> get_all_rules() const;
    std::vector<rule_ptr> get_enabled_rules() const;

    /**
     * @brief Enabled rules whose condition watches the metric
     */
    std::vector<rule_ptr> rules_for_metric(const std::string& metric) const;

    std::vector<rule_ptr> get_rules_by_category(const std::string& category) const;
    std::vector<rule_ptr> get_rules_by_severity(alert_severity severity) const;

    rule_statistics statistics() const;
    std::size_t rule_count() const;

    /**
     * @brief Build and register every definition
     * @return Number of rules loaded; an error only when none could be loaded
     *         from a non-empty list
     */
    result<std::size_t> load_definitions(const std::vector<rule_definition>& definitions);

    void clear();

private:
    template <typename Predicate>
    std::vector<rule_ptr> select(Predicate&& predicate) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<rule_ptr> result;
        for (const auto& [id, rule] : rules_) {
            if (predicate(*rule)) {
                result.push_back(rule);
            }
        }
        return result;
    }

    engine_logger logger_;
    mutable std::mutex mutex_;
    std::map<std::string, rule_ptr> rules_;
};

/**
 * @brief Built-in rule set covering API latency, error rate, database
 *        health, AI service success rate and failed logins
 */
std::vector<rule_definition> default_rule_definitions();

} // namespace watchtower
