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

/**
 * @file alert_engine_example.cpp
 * @brief Walkthrough of the alert engine from rule loading to incident handling
 *
 * This example demonstrates:
 * - Loading the built-in rule set
 * - Registering a channel client that prints payloads
 * - Feeding metrics and watching alerts fire under consecutive-failure rules
 * - Incident correlation, assignment and resolution
 * - Raising a manual alert
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "watchtower/alert/alert_engine.h"

using namespace watchtower;
using namespace std::chrono_literals;

namespace {

void print_alert(const alert& a) {
    std::cout << "  Alert: " << a.id
              << " | " << alert_severity_to_string(a.severity)
              << " | " << a.title
              << (a.resolved ? " (resolved)" : "") << std::endl;
}

void print_incident(const incident& inc) {
    std::cout << "  Incident: " << inc.id
              << " | " << incident_status_to_string(inc.status)
              << " | " << alert_severity_to_string(inc.severity)
              << " | alerts=" << inc.alerts.size() << std::endl;
    for (const auto& entry : inc.timeline) {
        std::cout << "    - " << format_iso8601(entry.timestamp) << " " << entry.action
                  << ": " << entry.description << std::endl;
    }
}

} // namespace

int main() {
    std::cout << "=== Alert Engine Example ===" << std::endl << std::endl;

    // =========================================================================
    // Section 1: Configuration
    // =========================================================================
    auto config_result = engine_config::from_config_map({
        {"service_name", "checkout-api"},
        {"environment", "staging"},
        {"notification_timeout", "2s"},
        {"default_slack_channel", "#manual-alerts"},
    });
    if (config_result.is_err()) {
        std::cerr << "Invalid configuration: " << config_result.error().message << std::endl;
        return 1;
    }

    alert_engine engine(config_result.value());

    // Print every chat payload instead of posting it.
    engine.register_channel_client(
        channel_type::slack,
        std::make_shared<callback_channel_client>("stdout", [](const notification_message& msg) {
            std::cout << "  [" << msg.channel.get("channel") << "] " << msg.payload.substr(0, 96)
                      << "..." << std::endl;
            return make_void_success();
        }));

    // =========================================================================
    // Section 2: Rules
    // =========================================================================
    auto loaded = engine.load_rules(default_rule_definitions());
    if (loaded.is_err()) {
        std::cerr << "Failed to load rules: " << loaded.error().message << std::endl;
        return 1;
    }
    std::cout << "1. Loaded " << loaded.value() << " built-in rules" << std::endl << std::endl;

    if (auto started = engine.start(); started.is_err()) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    // =========================================================================
    // Section 3: Metrics
    // =========================================================================
    std::cout << "2. Feeding error_rate samples (threshold 5, two consecutive)" << std::endl;
    for (double value : {3.0, 6.0, 7.0, 8.0}) {
        engine.record_metric("error_rate", value);
        std::this_thread::sleep_for(10ms);
    }
    std::cout << std::endl;

    std::cout << "3. Feeding failed_login_attempts spike" << std::endl;
    engine.record_metric("failed_login_attempts", 25);
    std::cout << std::endl;

    std::cout << "Active alerts:" << std::endl;
    for (const auto& a : engine.get_active_alerts()) {
        print_alert(a);
    }
    std::cout << std::endl;

    // =========================================================================
    // Section 4: Incidents
    // =========================================================================
    std::cout << "4. Working the incidents" << std::endl;
    for (const auto& inc : engine.get_open_incidents()) {
        if (auto assigned = engine.assign_incident(inc.id, "oncall-sre"); assigned.is_err()) {
            std::cerr << "Assign failed: " << assigned.error().message << std::endl;
        }
        if (auto noted = engine.add_incident_note(inc.id, "Investigating dashboards", "oncall-sre");
            noted.is_err()) {
            std::cerr << "Note failed: " << noted.error().message << std::endl;
        }
        if (auto resolved = engine.update_incident_status(inc.id, incident_status::resolved,
                                                          "oncall-sre", "Rolled back deploy");
            resolved.is_ok()) {
            print_incident(resolved.value());
        }
    }
    std::cout << std::endl;

    // =========================================================================
    // Section 5: Manual alert
    // =========================================================================
    std::cout << "5. Raising a manual alert" << std::endl;
    manual_alert request;
    request.type = "payment_gateway_down";
    request.message = "Gateway returned HTTP 503 for all requests";
    request.severity = alert_severity::critical;
    request.category = "payments";
    if (auto raised = engine.send_alert(request); raised.is_ok()) {
        print_alert(raised.value());
    }
    std::cout << std::endl;

    // =========================================================================
    // Section 6: Statistics
    // =========================================================================
    auto stats = engine.get_statistics();
    std::cout << "Statistics:" << std::endl
              << "  total=" << stats.total_alerts
              << " active=" << stats.active_alerts
              << " critical=" << stats.critical_alerts
              << " open_incidents=" << stats.open_incidents << std::endl;

    auto stopped = engine.stop();
    if (stopped.is_err()) {
        std::cerr << "Failed to stop: " << stopped.error().message << std::endl;
        return 1;
    }

    std::cout << std::endl << "=== Example completed ===" << std::endl;
    return 0;
}
