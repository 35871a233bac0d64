/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Engine Configuration Tests
 *
 * Tests for config_parser.h and engine_config.h covering:
 * - Typed parsing with default fallback
 * - Duration suffixes and lists
 * - engine_config validation and key mapping
 * - Environment variable overrides
 */

#include <gtest/gtest.h>
#include <watchtower/alert/engine_config.h>
#include <watchtower/utils/config_parser.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

using namespace watchtower;
using namespace std::chrono_literals;

// =============================================================================
// config_parser
// =============================================================================

TEST(ConfigParserTest, TypedValuesWithFallback) {
    config_map config = {{"enabled", "yes"}, {"count", "42"}, {"ratio", "0.5"}, {"broken", "abc"}};

    EXPECT_TRUE(config_parser::get<bool>(config, "enabled", false));
    EXPECT_EQ(config_parser::get<int>(config, "count", 0), 42);
    EXPECT_DOUBLE_EQ(config_parser::get<double>(config, "ratio", 0.0), 0.5);
    EXPECT_EQ(config_parser::get<int>(config, "broken", 7), 7);
    EXPECT_EQ(config_parser::get<int>(config, "missing", 9), 9);
    EXPECT_FALSE(config_parser::get_optional<bool>(config, "broken").has_value());
}

TEST(ConfigParserTest, NegativeUnsignedFallsBack) {
    config_map config = {{"limit", "-5"}};
    EXPECT_EQ(config_parser::get<std::size_t>(config, "limit", std::size_t{10}), 10u);
}

TEST(ConfigParserTest, ClampedValues) {
    config_map config = {{"workers", "64"}};
    EXPECT_EQ(config_parser::get_clamped<int>(config, "workers", 4, 1, 16), 16);
}

TEST(ConfigParserTest, DurationSuffixes) {
    using std::chrono::milliseconds;
    EXPECT_EQ(config_parser::parse_duration<milliseconds>("250ms").value(), milliseconds(250));
    EXPECT_EQ(config_parser::parse_duration<milliseconds>("5s").value(), milliseconds(5000));
    EXPECT_EQ(config_parser::parse_duration<milliseconds>("2m").value(), milliseconds(120000));
    EXPECT_EQ(config_parser::parse_duration<milliseconds>("1h").value(), milliseconds(3600000));
    EXPECT_EQ(config_parser::parse_duration<milliseconds>("7d").value(), milliseconds(7 * 24h));
    EXPECT_EQ(config_parser::parse_duration<milliseconds>("1500").value(), milliseconds(1500));
    EXPECT_FALSE(config_parser::parse_duration<milliseconds>("5 fortnights").has_value());
    EXPECT_FALSE(config_parser::parse_duration<milliseconds>("").has_value());
}

TEST(ConfigParserTest, ListsSkipEmptyEntries) {
    config_map config = {{"channels", "#ops, ,#critical"}};
    auto list = config_parser::get_list<std::string>(config, "channels", {});
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], "#ops");
    EXPECT_EQ(list[1], "#critical");
}

// =============================================================================
// engine_config
// =============================================================================

TEST(EngineConfigTest, DefaultsAreValid) {
    engine_config config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.stale_alert_threshold, std::chrono::milliseconds(24h));
    EXPECT_EQ(config.incident_min_severity, alert_severity::error);
    EXPECT_FALSE(config.escalation_channel.has_value());
}

TEST(EngineConfigTest, RejectsNonPositiveDurations) {
    engine_config config;
    config.notification_timeout = 0ms;
    EXPECT_TRUE(config.validate().is_err());
}

TEST(EngineConfigTest, FromConfigMapReadsKeys) {
    config_map map = {
        {"service_name", "checkout"},
        {"environment", "production"},
        {"stale_alert_threshold", "12h"},
        {"max_samples_per_metric", "250"},
        {"incident_min_severity", "warning"},
        {"escalation_webhook", "https://hooks.example.com/escalate"},
        {"default_slack_channel", "#alerts,#oncall"},
        {"incident_auto_resolve_age", "2h"},
    };

    auto result = engine_config::from_config_map(map);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto& config = result.value();
    EXPECT_EQ(config.service_name, "checkout");
    EXPECT_EQ(config.environment, "production");
    EXPECT_EQ(config.stale_alert_threshold, std::chrono::milliseconds(12h));
    EXPECT_EQ(config.max_samples_per_metric, 250u);
    EXPECT_EQ(config.incident_min_severity, alert_severity::warning);
    ASSERT_TRUE(config.escalation_channel.has_value());
    EXPECT_EQ(config.escalation_channel->get("url"), "https://hooks.example.com/escalate");
    ASSERT_EQ(config.default_channels.size(), 2u);
    EXPECT_EQ(config.default_channels[1].get("channel"), "#oncall");
    EXPECT_EQ(config.incident_auto_resolve_age, std::chrono::milliseconds(2h));
}

TEST(EngineConfigTest, NegativeAutoResolveAgeRejected) {
    engine_config config;
    EXPECT_EQ(config.incident_auto_resolve_age, std::chrono::milliseconds::zero());
    EXPECT_TRUE(config.validate().is_ok());

    config.incident_auto_resolve_age = std::chrono::milliseconds(-1);
    auto validation = config.validate();
    ASSERT_TRUE(validation.is_err());
    EXPECT_EQ(code_of(validation.error()), error_code::invalid_configuration);
}

TEST(EngineConfigTest, UnknownSeverityIsParseError) {
    auto result = engine_config::from_config_map({{"incident_min_severity", "fatal"}});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::configuration_parse_error);
}

TEST(EngineConfigTest, InvalidValuesRejected) {
    auto result = engine_config::from_config_map({{"max_alerts", "0"}});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::invalid_configuration);
}

TEST(EngineConfigTest, EnvironmentOverrides) {
    ::setenv("WATCHTOWER_SERVICE_NAME", "env-service", 1);
    ::setenv("WATCHTOWER_NOTIFICATION_TIMEOUT", "3s", 1);

    auto result = engine_config::from_environment();

    ::unsetenv("WATCHTOWER_SERVICE_NAME");
    ::unsetenv("WATCHTOWER_NOTIFICATION_TIMEOUT");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().service_name, "env-service");
    EXPECT_EQ(result.value().notification_timeout, std::chrono::milliseconds(3s));
}
