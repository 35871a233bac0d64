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

#include "watchtower/alert/engine_config.h"

#include <cctype>
#include <cstdlib>

namespace watchtower {

namespace {

const std::vector<std::string>& known_keys() {
    static const std::vector<std::string> keys = {
        "enabled",
        "service_name",
        "environment",
        "max_samples_per_metric",
        "incident_min_severity",
        "stale_alert_threshold",
        "stale_sweep_interval",
        "health_check_interval",
        "probe_timeout",
        "probe_failure_latency_ms",
        "notification_timeout",
        "cleanup_interval",
        "alert_retention",
        "max_alerts",
        "incident_retention",
        "max_incidents",
        "incident_auto_resolve_age",
        "escalation_webhook",
        "default_slack_channel",
    };
    return keys;
}

result_void require_positive(std::chrono::milliseconds value, const std::string& name) {
    if (value <= std::chrono::milliseconds::zero()) {
        return make_void_error(error_code::invalid_configuration, name + " must be positive");
    }
    return make_void_success();
}

} // namespace

result_void engine_config::validate() const {
    if (service_name.empty()) {
        return make_void_error(error_code::invalid_configuration, "Service name cannot be empty");
    }
    if (max_samples_per_metric == 0) {
        return make_void_error(error_code::invalid_configuration,
                               "Max samples per metric must be positive");
    }
    if (max_alerts == 0 || max_incidents == 0) {
        return make_void_error(error_code::invalid_configuration,
                               "Alert and incident limits must be positive");
    }
    if (incident_auto_resolve_age < std::chrono::milliseconds::zero()) {
        return make_void_error(error_code::invalid_configuration,
                               "Incident auto-resolve age cannot be negative");
    }
    if (probe_failure_latency_ms < 0.0) {
        return make_void_error(error_code::invalid_configuration,
                               "Probe failure latency cannot be negative");
    }

    const std::pair<std::chrono::milliseconds, const char*> durations[] = {
        {stale_alert_threshold, "Stale alert threshold"},
        {stale_sweep_interval, "Stale sweep interval"},
        {health_check_interval, "Health check interval"},
        {probe_timeout, "Probe timeout"},
        {notification_timeout, "Notification timeout"},
        {cleanup_interval, "Cleanup interval"},
        {alert_retention, "Alert retention"},
        {incident_retention, "Incident retention"},
    };
    for (const auto& [value, name] : durations) {
        auto check = require_positive(value, name);
        if (check.is_err()) {
            return check;
        }
    }

    if (escalation_channel && escalation_channel->type == channel_type::webhook &&
        escalation_channel->get("url").empty()) {
        return make_void_error(error_code::invalid_configuration,
                               "Escalation webhook requires a url");
    }
    return make_void_success();
}

result<engine_config> engine_config::from_config_map(const config_map& config) {
    using std::chrono::milliseconds;

    engine_config cfg;
    cfg.enabled = config_parser::get<bool>(config, "enabled", cfg.enabled);
    cfg.service_name = config_parser::get<std::string>(config, "service_name", cfg.service_name);
    cfg.environment = config_parser::get<std::string>(config, "environment", cfg.environment);
    cfg.max_samples_per_metric = config_parser::get<std::size_t>(
        config, "max_samples_per_metric", cfg.max_samples_per_metric);

    if (auto severity = config_parser::get_optional<std::string>(config, "incident_min_severity")) {
        auto parsed = parse_severity(*severity);
        if (parsed.is_err()) {
            return make_error<engine_config>(error_code::configuration_parse_error,
                                             "incident_min_severity: " + parsed.error().message);
        }
        cfg.incident_min_severity = parsed.value();
    }

    cfg.stale_alert_threshold =
        config_parser::get_duration(config, "stale_alert_threshold", cfg.stale_alert_threshold);
    cfg.stale_sweep_interval =
        config_parser::get_duration(config, "stale_sweep_interval", cfg.stale_sweep_interval);
    cfg.health_check_interval =
        config_parser::get_duration(config, "health_check_interval", cfg.health_check_interval);
    cfg.probe_timeout = config_parser::get_duration(config, "probe_timeout", cfg.probe_timeout);
    cfg.probe_failure_latency_ms = config_parser::get<double>(
        config, "probe_failure_latency_ms", cfg.probe_failure_latency_ms);
    cfg.notification_timeout =
        config_parser::get_duration(config, "notification_timeout", cfg.notification_timeout);
    cfg.cleanup_interval =
        config_parser::get_duration(config, "cleanup_interval", cfg.cleanup_interval);
    cfg.alert_retention =
        config_parser::get_duration(config, "alert_retention", cfg.alert_retention);
    cfg.max_alerts = config_parser::get<std::size_t>(config, "max_alerts", cfg.max_alerts);
    cfg.incident_retention =
        config_parser::get_duration(config, "incident_retention", cfg.incident_retention);
    cfg.max_incidents = config_parser::get<std::size_t>(config, "max_incidents", cfg.max_incidents);
    cfg.incident_auto_resolve_age = config_parser::get_duration(
        config, "incident_auto_resolve_age", cfg.incident_auto_resolve_age);

    auto webhook = config_parser::get<std::string>(config, "escalation_webhook", "");
    if (!webhook.empty()) {
        cfg.escalation_channel = notification_channel::webhook(webhook);
    }

    for (const auto& slack_channel :
         config_parser::get_list<std::string>(config, "default_slack_channel", {})) {
        cfg.default_channels.push_back(notification_channel::slack(slack_channel));
    }

    auto validation = cfg.validate();
    if (validation.is_err()) {
        return make_error<engine_config>(code_of(validation.error()), validation.error().message);
    }
    return make_success(std::move(cfg));
}

result<engine_config> engine_config::from_environment() {
    config_map config;
    for (const auto& key : known_keys()) {
        std::string variable = "WATCHTOWER_";
        for (char c : key) {
            variable += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (const char* value = std::getenv(variable.c_str())) {
            config[key] = value;
        }
    }
    return from_config_map(config);
}

} // namespace watchtower
