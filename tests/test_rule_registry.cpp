/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Rule Registry Tests
 *
 * Tests for rule_registry.h covering:
 * - Rule validation and definition building
 * - Registration, removal and enable toggling
 * - Metric, category and severity lookups
 * - Built-in rule set
 */

#include <gtest/gtest.h>
#include <watchtower/alert/rule_registry.h>

#include <algorithm>
#include <chrono>
#include <string>

using namespace watchtower;
using namespace std::chrono_literals;

namespace {

alert_rule make_rule(const std::string& id,
                     const std::string& metric,
                     alert_severity severity = alert_severity::warning,
                     const std::string& category = "system_health") {
    alert_condition condition;
    condition.metric = metric;
    condition.op = condition_operator::gt;
    condition.threshold = 10.0;

    alert_rule rule(id);
    rule.set_severity(severity).set_category(category).set_condition(condition);
    return rule;
}

} // namespace

// =============================================================================
// Rule Validation
// =============================================================================

TEST(AlertRuleTest, DefaultsAreApplied) {
    alert_rule rule("cpu_high");
    EXPECT_EQ(rule.name(), "cpu_high");
    EXPECT_EQ(rule.category(), "system_health");
    EXPECT_EQ(rule.severity(), alert_severity::warning);
    EXPECT_TRUE(rule.enabled());
    EXPECT_EQ(rule.cooldown(), std::chrono::milliseconds(10min));
    EXPECT_EQ(rule.escalation_delay(), std::chrono::milliseconds(0));
}

TEST(AlertRuleTest, EmptyIdRejected) {
    alert_rule rule;
    EXPECT_TRUE(rule.validate().is_err());
}

TEST(AlertRuleTest, EmptyMetricRejected) {
    alert_rule rule("no_metric");
    auto result = rule.validate();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::invalid_rule);
}

TEST(AlertRuleTest, NumericOperatorNeedsNumericThreshold) {
    auto rule = make_rule("r", "m");
    alert_condition condition = rule.condition();
    condition.threshold = std::string("high");
    rule.set_condition(condition);

    auto result = rule.validate();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::invalid_threshold);
}

TEST(AlertRuleTest, CategoricalOperatorAcceptsText) {
    auto rule = make_rule("r", "m");
    alert_condition condition = rule.condition();
    condition.op = condition_operator::contains;
    condition.threshold = std::string("unhealthy");
    rule.set_condition(condition);
    EXPECT_TRUE(rule.validate().is_ok());
}

TEST(AlertRuleTest, NegativeCooldownRejected) {
    auto rule = make_rule("r", "m");
    rule.set_cooldown(std::chrono::milliseconds(-1));
    EXPECT_TRUE(rule.validate().is_err());
}

TEST(ParseOperatorTest, NamesAndSymbols) {
    EXPECT_EQ(parse_operator(">").value(), condition_operator::gt);
    EXPECT_EQ(parse_operator("lte").value(), condition_operator::lte);
    EXPECT_EQ(parse_operator("not_contains").value(), condition_operator::not_contains);
    EXPECT_TRUE(parse_operator("between").is_err());
}

// =============================================================================
// Rule Builder
// =============================================================================

TEST(RuleBuilderTest, BuildsFromDefinition) {
    rule_definition def;
    def.id = "slow";
    def.name = "Slow Responses";
    def.severity = "error";
    def.condition.metric = "latency";
    def.condition.operator_str = ">=";
    def.condition.threshold = 250;
    def.condition.window_seconds = 60;
    def.condition.consecutive_failures = 2;
    def.cooldown_seconds = 30;
    def.escalation_seconds = 120;
    def.channels.push_back(notification_channel::slack("#ops"));

    auto result = rule_builder::build(def);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto& rule = result.value();
    EXPECT_EQ(rule.name(), "Slow Responses");
    EXPECT_EQ(rule.severity(), alert_severity::error);
    EXPECT_EQ(rule.condition().op, condition_operator::gte);
    EXPECT_EQ(rule.condition().time_window, std::chrono::milliseconds(60s));
    ASSERT_TRUE(rule.condition().consecutive_failures.has_value());
    EXPECT_EQ(*rule.condition().consecutive_failures, 2);
    EXPECT_EQ(rule.cooldown(), std::chrono::milliseconds(30s));
    EXPECT_EQ(rule.escalation_delay(), std::chrono::milliseconds(120s));
    ASSERT_EQ(rule.channels().size(), 1u);
}

TEST(RuleBuilderTest, ZeroConsecutiveLeavesRequirementUnset) {
    rule_definition def;
    def.id = "plain";
    def.condition.metric = "m";
    auto result = rule_builder::build(def);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().condition().consecutive_failures.has_value());
}

TEST(RuleBuilderTest, UnknownSeverityRejected) {
    rule_definition def;
    def.id = "bad";
    def.severity = "fatal";
    def.condition.metric = "m";
    auto result = rule_builder::build(def);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::unknown_severity);
}

TEST(RuleBuilderTest, UnknownOperatorRejected) {
    rule_definition def;
    def.id = "bad";
    def.condition.metric = "m";
    def.condition.operator_str = "~";
    auto result = rule_builder::build(def);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::unknown_operator);
}

// =============================================================================
// Registry
// =============================================================================

class RuleRegistryTest : public ::testing::Test {
protected:
    rule_registry registry_;
};

TEST_F(RuleRegistryTest, AddAndGet) {
    ASSERT_TRUE(registry_.add_rule(make_rule("r1", "cpu")).is_ok());
    auto rule = registry_.get_rule("r1");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->metric_name(), "cpu");
    EXPECT_EQ(registry_.rule_count(), 1u);
}

TEST_F(RuleRegistryTest, DuplicateIdRejected) {
    ASSERT_TRUE(registry_.add_rule(make_rule("r1", "cpu")).is_ok());
    auto result = registry_.add_rule(make_rule("r1", "memory"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::rule_already_exists);
    EXPECT_EQ(registry_.get_rule("r1")->metric_name(), "cpu");
}

TEST_F(RuleRegistryTest, InvalidRuleRejected) {
    alert_rule rule("empty");
    EXPECT_TRUE(registry_.add_rule(rule).is_err());
    EXPECT_EQ(registry_.rule_count(), 0u);
}

TEST_F(RuleRegistryTest, RemoveRule) {
    ASSERT_TRUE(registry_.add_rule(make_rule("r1", "cpu")).is_ok());
    EXPECT_TRUE(registry_.remove_rule("r1").is_ok());
    EXPECT_EQ(registry_.get_rule("r1"), nullptr);

    auto missing = registry_.remove_rule("r1");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(code_of(missing.error()), error_code::rule_not_found);
}

TEST_F(RuleRegistryTest, ToggleDoesNotMutateSnapshots) {
    ASSERT_TRUE(registry_.add_rule(make_rule("r1", "cpu")).is_ok());
    auto before = registry_.get_rule("r1");

    ASSERT_TRUE(registry_.set_enabled("r1", false).is_ok());
    EXPECT_TRUE(before->enabled());
    EXPECT_FALSE(registry_.get_rule("r1")->enabled());

    EXPECT_TRUE(registry_.set_enabled("missing", true).is_err());
}

TEST_F(RuleRegistryTest, RulesForMetricSkipsDisabled) {
    ASSERT_TRUE(registry_.add_rule(make_rule("a", "cpu")).is_ok());
    ASSERT_TRUE(registry_.add_rule(make_rule("b", "cpu")).is_ok());
    ASSERT_TRUE(registry_.add_rule(make_rule("c", "memory")).is_ok());
    ASSERT_TRUE(registry_.set_enabled("b", false).is_ok());

    auto rules = registry_.rules_for_metric("cpu");
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0]->id(), "a");
    EXPECT_EQ(registry_.get_enabled_rules().size(), 2u);
    EXPECT_EQ(registry_.get_all_rules().size(), 3u);
}

TEST_F(RuleRegistryTest, CategoryAndSeverityQueries) {
    ASSERT_TRUE(registry_.add_rule(make_rule("a", "m", alert_severity::critical, "security")).is_ok());
    ASSERT_TRUE(registry_.add_rule(make_rule("b", "m", alert_severity::warning, "security")).is_ok());
    ASSERT_TRUE(registry_.add_rule(make_rule("c", "m", alert_severity::critical, "database")).is_ok());

    EXPECT_EQ(registry_.get_rules_by_category("security").size(), 2u);
    EXPECT_EQ(registry_.get_rules_by_severity(alert_severity::critical).size(), 2u);

    auto stats = registry_.statistics();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.enabled, 3u);
    EXPECT_EQ(stats.by_category["security"], 2u);
    EXPECT_EQ(stats.by_severity["critical"], 2u);
}

TEST_F(RuleRegistryTest, LoadDefinitionsCountsSuccesses) {
    std::vector<rule_definition> defs(2);
    defs[0].id = "good";
    defs[0].condition.metric = "m";
    defs[1].id = "bad";

    auto result = registry_.load_definitions(defs);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 1u);
}

TEST_F(RuleRegistryTest, LoadDefinitionsFailsWhenNothingLoads) {
    std::vector<rule_definition> defs(1);
    defs[0].id = "bad";
    EXPECT_TRUE(registry_.load_definitions(defs).is_err());
}

// =============================================================================
// Built-in Rules
// =============================================================================

TEST(DefaultRulesTest, AllBuiltInRulesLoad) {
    rule_registry registry;
    auto result = registry.load_definitions(default_rule_definitions());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 6u);

    auto critical = registry.get_rule("critical_api_response_time");
    ASSERT_NE(critical, nullptr);
    EXPECT_EQ(critical->severity(), alert_severity::critical);
    EXPECT_EQ(std::get<double>(critical->condition().threshold), 15000.0);
    EXPECT_EQ(critical->condition().time_window, std::chrono::milliseconds(3min));
    EXPECT_EQ(critical->channels().size(), 2u);

    EXPECT_EQ(registry.rules_for_metric("api_response_time").size(), 2u);

    auto database = registry.get_rule("database_connection_failure");
    ASSERT_NE(database, nullptr);
    EXPECT_EQ(database->condition().op, condition_operator::contains);
    EXPECT_EQ(std::get<std::string>(database->condition().threshold), "unhealthy");
}
