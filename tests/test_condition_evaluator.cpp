/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Condition Evaluator Tests
 *
 * Tests for condition_evaluator.h covering:
 * - Numeric and categorical operators
 * - Value formatting used by categorical comparison
 * - Window and consecutive-failure semantics
 * - Evaluation errors for mismatched thresholds
 */

#include <gtest/gtest.h>
#include <watchtower/alert/condition_evaluator.h>

#include <chrono>
#include <limits>
#include <string>

using namespace watchtower;
using namespace std::chrono_literals;

namespace {

const auto t0 = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50);

alert_condition make_condition(condition_operator op,
                               condition_threshold threshold,
                               std::chrono::milliseconds window = 5min,
                               std::optional<int> consecutive = std::nullopt) {
    alert_condition condition;
    condition.metric = "m";
    condition.op = op;
    condition.threshold = std::move(threshold);
    condition.time_window = window;
    condition.consecutive_failures = consecutive;
    return condition;
}

bool passes(const result<bool>& r) {
    return r.is_ok() && r.value();
}

} // namespace

// =============================================================================
// Formatting
// =============================================================================

TEST(FormatMetricValueTest, IntegralValuesHaveNoFraction) {
    EXPECT_EQ(format_metric_value(0.0), "0");
    EXPECT_EQ(format_metric_value(42.0), "42");
    EXPECT_EQ(format_metric_value(-7.0), "-7");
    EXPECT_EQ(format_metric_value(5000.0), "5000");
}

TEST(FormatMetricValueTest, FractionsUseShortestForm) {
    EXPECT_EQ(format_metric_value(0.1), "0.1");
    EXPECT_EQ(format_metric_value(2.5), "2.5");
    EXPECT_EQ(format_metric_value(99.95), "99.95");
}

TEST(FormatMetricValueTest, NonFiniteValues) {
    EXPECT_EQ(format_metric_value(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(format_metric_value(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(format_metric_value(-std::numeric_limits<double>::infinity()), "-Infinity");
}

TEST(FormatMetricValueTest, ThresholdFormatting) {
    EXPECT_EQ(format_threshold(condition_threshold{15.0}), "15");
    EXPECT_EQ(format_threshold(condition_threshold{std::string("unhealthy")}), "unhealthy");
}

// =============================================================================
// Operators
// =============================================================================

TEST(CompareTest, NumericOperators) {
    EXPECT_TRUE(passes(condition_evaluator::compare(make_condition(condition_operator::gt, 5.0), 6)));
    EXPECT_FALSE(passes(condition_evaluator::compare(make_condition(condition_operator::gt, 5.0), 5)));
    EXPECT_TRUE(passes(condition_evaluator::compare(make_condition(condition_operator::gte, 5.0), 5)));
    EXPECT_TRUE(passes(condition_evaluator::compare(make_condition(condition_operator::lt, 90.0), 89.5)));
    EXPECT_FALSE(passes(condition_evaluator::compare(make_condition(condition_operator::lt, 90.0), 90)));
    EXPECT_TRUE(passes(condition_evaluator::compare(make_condition(condition_operator::lte, 90.0), 90)));
    EXPECT_TRUE(passes(condition_evaluator::compare(make_condition(condition_operator::eq, 1.0), 1)));
    EXPECT_FALSE(passes(condition_evaluator::compare(make_condition(condition_operator::eq, 1.0), 1.0001)));
}

TEST(CompareTest, ContainsUsesStringForms) {
    auto contains = make_condition(condition_operator::contains, std::string("50"));
    EXPECT_TRUE(passes(condition_evaluator::compare(contains, 1500)));
    EXPECT_FALSE(passes(condition_evaluator::compare(contains, 1400)));

    auto numeric_threshold = make_condition(condition_operator::contains, 2.0);
    EXPECT_TRUE(passes(condition_evaluator::compare(numeric_threshold, 123)));
}

TEST(CompareTest, NotContainsNegates) {
    auto not_contains = make_condition(condition_operator::not_contains, std::string("unhealthy"));
    EXPECT_TRUE(passes(condition_evaluator::compare(not_contains, 0)));

    auto contains = make_condition(condition_operator::contains, std::string("unhealthy"));
    EXPECT_FALSE(passes(condition_evaluator::compare(contains, 0)));
}

TEST(CompareTest, NumericOperatorWithStringThresholdIsAnError) {
    auto condition = make_condition(condition_operator::gt, std::string("high"));
    auto result = condition_evaluator::compare(condition, 10);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::evaluation_failed);
}

// =============================================================================
// Evaluation against history
// =============================================================================

class ConditionEvaluatorTest : public ::testing::Test {
protected:
    metric_store store_;
    condition_evaluator evaluator_{store_};

    void record(double value, time_point at) {
        store_.record_sample("m", value, at);
    }
};

TEST_F(ConditionEvaluatorTest, EmptyWindowFails) {
    auto condition = make_condition(condition_operator::gt, 1.0);
    EXPECT_FALSE(passes(evaluator_.evaluate(condition, 10, t0)));
}

TEST_F(ConditionEvaluatorTest, LatestValueMustPass) {
    auto condition = make_condition(condition_operator::gt, 5.0);
    record(3, t0);
    EXPECT_FALSE(passes(evaluator_.evaluate(condition, 3, t0)));

    record(8, t0 + 1s);
    EXPECT_TRUE(passes(evaluator_.evaluate(condition, 8, t0 + 1s)));
}

TEST_F(ConditionEvaluatorTest, ConsecutiveOfOneIsBarePass) {
    auto condition = make_condition(condition_operator::gt, 5.0, 5min, 1);
    record(8, t0);
    EXPECT_TRUE(passes(evaluator_.evaluate(condition, 8, t0)));
}

TEST_F(ConditionEvaluatorTest, ConsecutiveRequiresEnoughSamples) {
    auto condition = make_condition(condition_operator::gt, 5.0, 5min, 3);
    record(8, t0);
    record(9, t0 + 30s);
    EXPECT_FALSE(passes(evaluator_.evaluate(condition, 9, t0 + 30s)));

    record(10, t0 + 60s);
    EXPECT_TRUE(passes(evaluator_.evaluate(condition, 10, t0 + 60s)));
}

TEST_F(ConditionEvaluatorTest, ConsecutiveBrokenByPassingSample) {
    auto condition = make_condition(condition_operator::gt, 5.0, 5min, 3);
    record(8, t0);
    record(2, t0 + 30s);
    record(9, t0 + 60s);
    EXPECT_FALSE(passes(evaluator_.evaluate(condition, 9, t0 + 60s)));

    record(9, t0 + 90s);
    EXPECT_FALSE(passes(evaluator_.evaluate(condition, 9, t0 + 90s)));

    record(9, t0 + 120s);
    EXPECT_TRUE(passes(evaluator_.evaluate(condition, 9, t0 + 120s)));
}

TEST_F(ConditionEvaluatorTest, SamplesOutsideWindowDoNotCount) {
    auto condition = make_condition(condition_operator::gt, 5.0, 1min, 2);
    record(8, t0);
    record(9, t0 + 2min);
    EXPECT_FALSE(passes(evaluator_.evaluate(condition, 9, t0 + 2min)));
}

TEST_F(ConditionEvaluatorTest, EvaluationErrorPropagates) {
    auto condition = make_condition(condition_operator::lt, std::string("ninety"));
    record(80, t0);
    auto result = evaluator_.evaluate(condition, 80, t0);
    EXPECT_TRUE(result.is_err());
}
