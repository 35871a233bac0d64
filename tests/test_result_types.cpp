/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Result Type Tests
 *
 * Tests for result_types.h and error_codes.h covering:
 * - Success and error construction
 * - Error code round trip through common_system errors
 * - Error context rendering
 */

#include <gtest/gtest.h>
#include <watchtower/core/error_codes.h>
#include <watchtower/core/result_types.h>

#include <string>

using namespace watchtower;

class ResultTypesTest : public ::testing::Test {};

TEST_F(ResultTypesTest, SuccessResultContainsValue) {
    auto result = make_success(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST_F(ResultTypesTest, ErrorResultCarriesCode) {
    auto result = make_error<int>(error_code::rule_not_found, "Rule not found: cpu_high");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::rule_not_found);
    EXPECT_EQ(result.error().message, "Rule not found: cpu_high");
}

TEST_F(ResultTypesTest, EmptyMessageUsesCodeDescription) {
    auto result = make_void_error(error_code::probe_not_configured);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message, "Health probe not configured");
}

TEST_F(ResultTypesTest, VoidSuccess) {
    auto result = make_void_success();
    EXPECT_TRUE(result.is_ok());
}

TEST_F(ResultTypesTest, ContextSurvivesConversion) {
    auto result = make_error_with_context<int>(error_code::delivery_failed, "smtp rejected",
                                               "channel=email");
    ASSERT_TRUE(result.is_err());

    auto info = error_info::from_common_error(result.error());
    EXPECT_EQ(info.code, error_code::delivery_failed);
    ASSERT_TRUE(info.context.has_value());
    EXPECT_EQ(*info.context, "channel=email");
    EXPECT_EQ(info.to_string(), "[Notification delivery failed] smtp rejected Context: channel=email");
}

TEST(ErrorCodeTest, EveryCodeHasDescription) {
    const error_code codes[] = {
        error_code::invalid_configuration, error_code::rule_already_exists,
        error_code::evaluation_failed,     error_code::incident_not_found,
        error_code::delivery_failed,       error_code::already_armed,
        error_code::probe_failed,
    };
    for (auto code : codes) {
        EXPECT_NE(error_code_to_string(code), "Unknown error");
    }
    EXPECT_EQ(error_code_to_string(error_code::unknown_error), "Unknown error");
}
