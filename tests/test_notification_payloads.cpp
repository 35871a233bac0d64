/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Notification Payload Tests
 *
 * Tests for notification_payloads.h covering:
 * - Chat attachment layout and severity colours
 * - Email subject, body and recipient list
 * - Webhook and paging documents
 * - JSON escaping
 */

#include <gtest/gtest.h>
#include <watchtower/alert/notification_payloads.h>

#include <chrono>
#include <string>

using namespace watchtower;
using namespace std::chrono_literals;

namespace {

bool has(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

class NotificationPayloadTest : public ::testing::Test {
protected:
    void SetUp() override {
        alert_.id = "high_error_rate_1700000000000";
        alert_.title = "High Error Rate";
        alert_.description = "Error rate is above acceptable threshold. Current value: 8, Threshold: 5";
        alert_.severity = alert_severity::error;
        alert_.category = "system_health";
        alert_.source = "rule_engine";
        alert_.timestamp = time_point{} + std::chrono::milliseconds(1700000000000LL);
        alert_.metadata["rule_id"] = "high_error_rate";

        incident_.id = "incident_1700000000000_1";
        incident_.title = "system_health - High Error Rate";
        incident_.severity = alert_severity::error;
        incident_.alerts.push_back(alert_);
    }

    payload_context context(const incident* inc = nullptr) const {
        return payload_context{alert_, inc, "checkout", "production", alert_.timestamp};
    }

    alert alert_;
    incident incident_;
};

} // namespace

// =============================================================================
// Chat
// =============================================================================

TEST_F(NotificationPayloadTest, ChatPayloadLayout) {
    auto payload = json_payload_builder::build(notification_channel::slack("#ops"), context());

    EXPECT_TRUE(has(payload, "\"channel\":\"#ops\""));
    EXPECT_TRUE(has(payload, "\"alertId\":\"high_error_rate_1700000000000\""));
    EXPECT_TRUE(has(payload, "\"color\":\"#FF6600\""));
    EXPECT_TRUE(has(payload, "\"title\":\"[ERROR] High Error Rate\""));
    EXPECT_TRUE(has(payload, "{\"title\":\"Service\",\"value\":\"checkout\",\"short\":true}"));
    EXPECT_TRUE(has(payload, "{\"title\":\"Environment\",\"value\":\"production\",\"short\":true}"));
    EXPECT_TRUE(has(payload, "\"ts\":1700000000"));
    EXPECT_TRUE(has(payload, "\"timestamp\":\"2023-11-14T22:13:20.000Z\""));
    EXPECT_FALSE(has(payload, "\"Incident\""));
}

TEST_F(NotificationPayloadTest, ChatDefaultsChannelAndShowsIncident) {
    notification_channel channel;
    channel.type = channel_type::slack;
    auto payload = json_payload_builder::chat(channel, context(&incident_));

    EXPECT_TRUE(has(payload, "\"channel\":\"#alerts\""));
    EXPECT_TRUE(has(payload, "{\"title\":\"Incident\",\"value\":\"incident_1700000000000_1\""));
}

TEST(SeverityColorTest, Palette) {
    EXPECT_STREQ(json_payload_builder::severity_color(alert_severity::critical), "#FF0000");
    EXPECT_STREQ(json_payload_builder::severity_color(alert_severity::error), "#FF6600");
    EXPECT_STREQ(json_payload_builder::severity_color(alert_severity::warning), "#FFCC00");
    EXPECT_STREQ(json_payload_builder::severity_color(alert_severity::info), "#0066FF");
}

// =============================================================================
// Email
// =============================================================================

TEST_F(NotificationPayloadTest, EmailSubjectAndRecipients) {
    auto payload = json_payload_builder::build(
        notification_channel::email("oncall@example.com, lead@example.com"), context());

    EXPECT_EQ(json_payload_builder::email_subject(context()), "[ERROR] High Error Rate - checkout");
    EXPECT_TRUE(has(payload, "\"to\":[\"oncall@example.com\",\"lead@example.com\"]"));
    EXPECT_TRUE(has(payload, "\"subject\":\"[ERROR] High Error Rate - checkout\""));
}

TEST_F(NotificationPayloadTest, EmailBodyListsDetails) {
    auto body = json_payload_builder::email_body(context(&incident_));
    EXPECT_TRUE(has(body, "Alert: High Error Rate\n"));
    EXPECT_TRUE(has(body, "- Environment: production\n"));
    EXPECT_TRUE(has(body, "- Incident: incident_1700000000000_1 (open)\n"));
    EXPECT_TRUE(has(body, "Alert ID: high_error_rate_1700000000000"));
}

// =============================================================================
// Webhook and Paging
// =============================================================================

TEST_F(NotificationPayloadTest, WebhookEmbedsAlertAndIncident) {
    auto without = json_payload_builder::webhook(context());
    EXPECT_TRUE(has(without, "\"type\":\"alert\""));
    EXPECT_TRUE(has(without, "\"incident\":null"));
    EXPECT_TRUE(has(without, "\"metadata\":{\"rule_id\":\"high_error_rate\"}"));

    auto with = json_payload_builder::webhook(context(&incident_));
    EXPECT_TRUE(has(with, "\"alertCount\":1"));
    EXPECT_TRUE(has(with, "\"status\":\"open\""));
}

TEST_F(NotificationPayloadTest, PagerPayloadCarriesDedupKey) {
    auto payload = json_payload_builder::build(notification_channel::pagerduty("rk-123"),
                                               context(&incident_));
    EXPECT_TRUE(has(payload, "\"routing_key\":\"rk-123\""));
    EXPECT_TRUE(has(payload, "\"event_action\":\"trigger\""));
    EXPECT_TRUE(has(payload, "\"dedup_key\":\"high_error_rate_1700000000000\""));
    EXPECT_TRUE(has(payload, "\"component\":\"rule_engine\""));
    EXPECT_TRUE(has(payload, "\"incident_id\":\"incident_1700000000000_1\""));
}

TEST_F(NotificationPayloadTest, EscalationDocument) {
    auto payload = json_payload_builder::escalation(alert_, alert_.timestamp + 30min);
    EXPECT_TRUE(has(payload, "\"type\":\"alert_escalation\""));
    EXPECT_TRUE(has(payload, "\"timestamp\":\"2023-11-14T22:43:20.000Z\""));
}

// =============================================================================
// Escaping
// =============================================================================

TEST(EscapeJsonTest, SpecialCharacters) {
    EXPECT_EQ(json_payload_builder::escape_json("a\"b"), "a\\\"b");
    EXPECT_EQ(json_payload_builder::escape_json("back\\slash"), "back\\\\slash");
    EXPECT_EQ(json_payload_builder::escape_json("line\nbreak\ttab"), "line\\nbreak\\ttab");
    EXPECT_EQ(json_payload_builder::escape_json(std::string(1, '\x01')), "\\u0001");
}
