/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Health Probe Tests
 *
 * Tests for health_probe.h covering:
 * - Samples emitted for healthy and unhealthy signals
 * - Failure samples on error, exception and timeout
 */

#include <gtest/gtest.h>
#include <watchtower/health/health_probe.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace watchtower;
using namespace std::chrono_literals;

class HealthProbeTest : public ::testing::Test {
protected:
    health_probe::metric_sink sink() {
        return [this](const std::string& metric, double value) { recorded_[metric] = value; };
    }

    std::map<std::string, double> recorded_;
};

TEST(HealthProbeConfigTest, RejectsInvalidConfiguration) {
    health_probe_config config;
    config.timeout = 0ms;
    EXPECT_TRUE(config.validate().is_err());
    EXPECT_THROW(health_probe(nullptr, [](const std::string&, double) {}, config),
                 std::invalid_argument);
}

TEST_F(HealthProbeTest, HealthySignalRecordsLatencyAndHealth) {
    health_probe probe(
        [] {
            health_signal signal;
            signal.database_healthy = true;
            signal.ai_success_rate = 97.5;
            return result<health_signal>(signal);
        },
        sink());

    auto report = probe.run_once();
    EXPECT_TRUE(report.success);
    EXPECT_FALSE(report.error.has_value());
    ASSERT_EQ(recorded_.count("api_response_time"), 1u);
    EXPECT_LT(recorded_["api_response_time"], 10000.0);
    EXPECT_DOUBLE_EQ(recorded_["database_health"], 1.0);
    EXPECT_DOUBLE_EQ(recorded_["ai_success_rate"], 97.5);
    EXPECT_EQ(probe.failure_count(), 0u);
}

TEST_F(HealthProbeTest, UnhealthyDatabaseRecordsZero) {
    health_probe probe(
        [] {
            health_signal signal;
            signal.database_healthy = false;
            return result<health_signal>(signal);
        },
        sink());

    auto report = probe.run_once();
    EXPECT_TRUE(report.success);
    EXPECT_DOUBLE_EQ(recorded_["database_health"], 0.0);
    EXPECT_EQ(recorded_.count("ai_success_rate"), 0u);
}

TEST_F(HealthProbeTest, ErrorResultRecordsFailureSamples) {
    health_probe_config config;
    config.failure_latency_ms = 30000.0;
    health_probe probe(
        [] {
            return make_error<health_signal>(error_code::probe_failed, "connection refused");
        },
        sink(), config);

    auto report = probe.run_once();
    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.error.value_or(""), "connection refused");
    EXPECT_DOUBLE_EQ(recorded_["api_response_time"], 30000.0);
    EXPECT_DOUBLE_EQ(recorded_["database_health"], 0.0);
    EXPECT_EQ(probe.failure_count(), 1u);
}

TEST_F(HealthProbeTest, ThrowingProbeIsTreatedAsFailure) {
    health_probe probe([]() -> result<health_signal> { throw std::runtime_error("dns"); },
                       sink());

    auto report = probe.run_once();
    EXPECT_FALSE(report.success);
    EXPECT_NE(report.error.value_or("").find("dns"), std::string::npos);
    EXPECT_DOUBLE_EQ(recorded_["database_health"], 0.0);
}

TEST_F(HealthProbeTest, SlowProbeTimesOut) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    health_probe_config config;
    config.timeout = 50ms;
    config.failure_latency_ms = 12345.0;
    health_probe probe(
        [release] {
            while (!release->load()) {
                std::this_thread::sleep_for(5ms);
            }
            return result<health_signal>(health_signal{});
        },
        sink(), config);

    auto report = probe.run_once();
    release->store(true);

    EXPECT_FALSE(report.success);
    EXPECT_NE(report.error.value_or("").find("timed out"), std::string::npos);
    EXPECT_DOUBLE_EQ(recorded_["api_response_time"], 12345.0);
}
