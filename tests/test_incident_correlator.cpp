/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Incident Correlator Tests
 *
 * Tests for incident_correlator.h covering:
 * - Grouping by category into one open incident
 * - Severity escalation and timeline entries
 * - Status workflow, assignment and notes
 * - Stale auto-resolution, pruning and statistics
 */

#include <gtest/gtest.h>
#include <watchtower/alert/incident_correlator.h>

#include <chrono>
#include <stdexcept>
#include <string>

using namespace watchtower;
using namespace std::chrono_literals;

namespace {

const auto t0 = time_point{} + std::chrono::hours(24 * 365 * 50);

alert make_alert(const std::string& id,
                 const std::string& category,
                 alert_severity severity = alert_severity::error) {
    alert a;
    a.id = id;
    a.title = "Title " + id;
    a.description = "Description " + id;
    a.category = category;
    a.severity = severity;
    a.source = "test";
    a.timestamp = t0;
    return a;
}

} // namespace

// =============================================================================
// Configuration
// =============================================================================

TEST(IncidentCorrelatorConfigTest, RejectsInvalidValues) {
    incident_correlator_config config;
    EXPECT_TRUE(config.validate().is_ok());

    config.max_incidents = 0;
    EXPECT_THROW(incident_correlator{config}, std::invalid_argument);
}

// =============================================================================
// Correlation
// =============================================================================

class IncidentCorrelatorTest : public ::testing::Test {
protected:
    incident_correlator correlator_;
};

TEST_F(IncidentCorrelatorTest, FirstAlertCreatesIncident) {
    auto inc = correlator_.correlate(make_alert("a1", "database"), t0);

    EXPECT_EQ(inc.id.rfind("incident_", 0), 0u);
    EXPECT_EQ(inc.title, "database - Title a1");
    EXPECT_EQ(inc.description, "Description a1");
    EXPECT_EQ(inc.category, "database");
    EXPECT_EQ(inc.status, incident_status::open);
    ASSERT_EQ(inc.alerts.size(), 1u);
    ASSERT_EQ(inc.timeline.size(), 1u);
    EXPECT_EQ(inc.timeline[0].action, "incident_created");
    EXPECT_EQ(inc.timeline[0].description, "Incident created from alert: Title a1");
    EXPECT_EQ(inc.created_at, t0);
}

TEST_F(IncidentCorrelatorTest, SameCategoryJoinsOpenIncident) {
    auto first = correlator_.correlate(make_alert("a1", "database"), t0);
    auto second = correlator_.correlate(make_alert("a2", "database"), t0 + 1min);

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(second.alerts.size(), 2u);
    ASSERT_EQ(second.timeline.size(), 2u);
    EXPECT_EQ(second.timeline[1].action, "alert_added");
    EXPECT_EQ(second.timeline[1].metadata.at("alert_id"), "a2");
    EXPECT_EQ(second.updated_at, t0 + 1min);
    EXPECT_EQ(correlator_.size(), 1u);
}

TEST_F(IncidentCorrelatorTest, DifferentCategoriesStaySeparate) {
    auto db = correlator_.correlate(make_alert("a1", "database"), t0);
    auto sec = correlator_.correlate(make_alert("a2", "security"), t0);
    EXPECT_NE(db.id, sec.id);
    EXPECT_EQ(correlator_.get_open_incidents().size(), 2u);
}

TEST_F(IncidentCorrelatorTest, HigherSeverityEscalatesIncident) {
    correlator_.correlate(make_alert("a1", "database", alert_severity::error), t0);
    auto inc = correlator_.correlate(make_alert("a2", "database", alert_severity::critical), t0 + 1s);

    EXPECT_EQ(inc.severity, alert_severity::critical);
    ASSERT_EQ(inc.timeline.size(), 3u);
    const auto& entry = inc.timeline[2];
    EXPECT_EQ(entry.action, "severity_escalated");
    EXPECT_EQ(entry.description, "Incident severity escalated from error to critical");
    EXPECT_EQ(entry.metadata.at("previous_severity"), "error");
    EXPECT_EQ(entry.metadata.at("new_severity"), "critical");
    EXPECT_EQ(entry.metadata.at("triggering_alert_id"), "a2");
}

TEST_F(IncidentCorrelatorTest, LowerSeverityDoesNotDowngrade) {
    correlator_.correlate(make_alert("a1", "database", alert_severity::critical), t0);
    auto inc = correlator_.correlate(make_alert("a2", "database", alert_severity::error), t0 + 1s);
    EXPECT_EQ(inc.severity, alert_severity::critical);
    EXPECT_EQ(inc.timeline.size(), 2u);
}

TEST_F(IncidentCorrelatorTest, InvestigatingIncidentDoesNotAbsorbAlerts) {
    auto first = correlator_.correlate(make_alert("a1", "database"), t0);
    ASSERT_TRUE(correlator_.update_status(first.id, incident_status::investigating,
                                          std::string("alice"), std::nullopt, t0 + 1min)
                    .is_ok());

    auto second = correlator_.correlate(make_alert("a2", "database"), t0 + 2min);
    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(correlator_.size(), 2u);
}

// =============================================================================
// Workflow
// =============================================================================

TEST_F(IncidentCorrelatorTest, StatusChangeRecordsTimeline) {
    auto inc = correlator_.correlate(make_alert("a1", "database"), t0);
    auto updated = correlator_.update_status(inc.id, incident_status::resolved,
                                             std::string("alice"), std::string("fixed"), t0 + 1h);
    ASSERT_TRUE(updated.is_ok());

    const auto& value = updated.value();
    EXPECT_EQ(value.status, incident_status::resolved);
    ASSERT_TRUE(value.resolved_at.has_value());
    EXPECT_EQ(*value.resolved_at, t0 + 1h);
    EXPECT_EQ(value.timeline.back().action, "status_changed");
    EXPECT_EQ(value.timeline.back().description, "Status changed from open to resolved: fixed");
    EXPECT_EQ(value.timeline.back().user.value_or(""), "alice");
}

TEST_F(IncidentCorrelatorTest, ReopenConflictsWithExistingOpenIncident) {
    auto first = correlator_.correlate(make_alert("a1", "database"), t0);
    ASSERT_TRUE(correlator_.update_status(first.id, incident_status::resolved, std::nullopt,
                                          std::nullopt, t0 + 1min)
                    .is_ok());
    correlator_.correlate(make_alert("a2", "database"), t0 + 2min);

    auto reopened = correlator_.update_status(first.id, incident_status::open, std::nullopt,
                                              std::nullopt, t0 + 3min);
    ASSERT_TRUE(reopened.is_err());
    EXPECT_EQ(code_of(reopened.error()), error_code::already_exists);
}

TEST_F(IncidentCorrelatorTest, UnknownIncidentReportsNotFound) {
    auto result = correlator_.update_status("nope", incident_status::closed, std::nullopt,
                                            std::nullopt, t0);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(code_of(result.error()), error_code::incident_not_found);
    EXPECT_TRUE(correlator_.assign("nope", "bob", std::nullopt, t0).is_err());
}

TEST_F(IncidentCorrelatorTest, ReassignmentMentionsPreviousAssignee) {
    auto inc = correlator_.correlate(make_alert("a1", "database"), t0);
    ASSERT_TRUE(correlator_.assign(inc.id, "alice", std::nullopt, t0).is_ok());
    auto result = correlator_.assign(inc.id, "bob", std::string("lead"), t0 + 1min);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().assignee.value_or(""), "bob");
    EXPECT_EQ(result.value().timeline.back().description,
              "Incident assigned to bob (previously: alice)");
    EXPECT_EQ(correlator_.get_incidents_by_assignee("bob").size(), 1u);
    EXPECT_TRUE(correlator_.get_incidents_by_assignee("alice").empty());
}

TEST_F(IncidentCorrelatorTest, NotesAppendToTimeline) {
    auto inc = correlator_.correlate(make_alert("a1", "database"), t0);
    auto result = correlator_.add_note(inc.id, "checking replicas", std::string("alice"), t0);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().timeline.back().action, "note_added");
    EXPECT_EQ(result.value().timeline.back().description, "checking replicas");

    EXPECT_TRUE(correlator_.add_note(inc.id, "", std::nullopt, t0).is_err());
}

// =============================================================================
// Maintenance
// =============================================================================

TEST_F(IncidentCorrelatorTest, AutoResolveStaleOpenIncidents) {
    auto old_inc = correlator_.correlate(make_alert("a1", "database"), t0);
    correlator_.correlate(make_alert("a2", "security"), t0 + 20h);

    EXPECT_EQ(correlator_.auto_resolve_stale(t0 + 25h, 24h), 1u);

    auto resolved = correlator_.get_incident(old_inc.id);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->status, incident_status::resolved);
    EXPECT_EQ(resolved->timeline.back().user.value_or(""), "system");
}

TEST_F(IncidentCorrelatorTest, PruneKeepsOpenIncidents) {
    incident_correlator_config config;
    config.retention = 24h;
    incident_correlator correlator(config);

    auto closed = correlator.correlate(make_alert("a1", "database"), t0);
    ASSERT_TRUE(correlator.update_status(closed.id, incident_status::closed, std::nullopt,
                                         std::nullopt, t0)
                    .is_ok());
    auto open = correlator.correlate(make_alert("a2", "security"), t0);

    EXPECT_EQ(correlator.prune(t0 + 48h), 1u);
    EXPECT_FALSE(correlator.get_incident(closed.id).has_value());
    EXPECT_TRUE(correlator.get_incident(open.id).has_value());
}

TEST_F(IncidentCorrelatorTest, PruneOverLimitKeepsInvestigatingIncidents) {
    incident_correlator_config config;
    config.max_incidents = 1;
    incident_correlator correlator(config);

    auto investigating = correlator.correlate(make_alert("a1", "database"), t0);
    ASSERT_TRUE(correlator.update_status(investigating.id, incident_status::investigating,
                                         std::string("alice"), std::nullopt, t0 + 1min)
                    .is_ok());
    auto open = correlator.correlate(make_alert("a2", "security"), t0 + 2min);

    EXPECT_EQ(correlator.prune(t0 + 48h), 0u);
    EXPECT_EQ(correlator.size(), 2u);
    EXPECT_TRUE(correlator.get_incident(investigating.id).has_value());
    EXPECT_TRUE(correlator.get_incident(open.id).has_value());
}

TEST_F(IncidentCorrelatorTest, PruneOverLimitEvictsOldestClosedOut) {
    incident_correlator_config config;
    config.max_incidents = 2;
    incident_correlator correlator(config);

    auto older = correlator.correlate(make_alert("a1", "database"), t0);
    ASSERT_TRUE(correlator.update_status(older.id, incident_status::resolved, std::nullopt,
                                         std::nullopt, t0 + 1min)
                    .is_ok());
    auto newer = correlator.correlate(make_alert("a2", "security"), t0);
    ASSERT_TRUE(correlator.update_status(newer.id, incident_status::closed, std::nullopt,
                                         std::nullopt, t0 + 2min)
                    .is_ok());
    auto open = correlator.correlate(make_alert("a3", "ai_service"), t0 + 3min);

    EXPECT_EQ(correlator.prune(t0 + 1h), 1u);
    EXPECT_FALSE(correlator.get_incident(older.id).has_value());
    EXPECT_TRUE(correlator.get_incident(newer.id).has_value());
    EXPECT_TRUE(correlator.get_incident(open.id).has_value());
}

TEST_F(IncidentCorrelatorTest, StatisticsAverageResolution) {
    auto a = correlator_.correlate(make_alert("a1", "database"), t0);
    auto b = correlator_.correlate(make_alert("a2", "security"), t0);
    correlator_.correlate(make_alert("a3", "ai_service"), t0);
    ASSERT_TRUE(correlator_.update_status(a.id, incident_status::resolved, std::nullopt,
                                          std::nullopt, t0 + 1h)
                    .is_ok());
    ASSERT_TRUE(correlator_.update_status(b.id, incident_status::closed, std::nullopt,
                                          std::nullopt, t0 + 3h)
                    .is_ok());

    auto stats = correlator_.statistics();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.open, 1u);
    EXPECT_EQ(stats.resolved, 1u);
    EXPECT_EQ(stats.closed, 1u);
    EXPECT_EQ(stats.by_category["database"], 1u);
    EXPECT_EQ(stats.average_resolution_time, std::chrono::milliseconds(2h));
}
