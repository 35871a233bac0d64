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

#include "watchtower/alert/notification_payloads.h"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace watchtower {

namespace {

std::string upper(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string quoted(const std::string& s) {
    return "\"" + json_payload_builder::escape_json(s) + "\"";
}

void write_string_map(std::ostringstream& oss, const std::map<std::string, std::string>& values) {
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : values) {
        if (!first) oss << ",";
        oss << quoted(key) << ":" << quoted(value);
        first = false;
    }
    oss << "}";
}

void write_field(std::ostringstream& oss, const std::string& title, const std::string& value) {
    oss << "{\"title\":" << quoted(title) << ",\"value\":" << quoted(value) << ",\"short\":true}";
}

} // namespace

std::string json_payload_builder::escape_json(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(c));
                    oss << buffer;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

const char* json_payload_builder::severity_color(alert_severity severity) {
    switch (severity) {
        case alert_severity::critical: return "#FF0000";
        case alert_severity::error:    return "#FF6600";
        case alert_severity::warning:  return "#FFCC00";
        case alert_severity::info:
        default:                       return "#0066FF";
    }
}

std::string json_payload_builder::alert_json(const alert& a) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":" << quoted(a.id) << ",";
    oss << "\"title\":" << quoted(a.title) << ",";
    oss << "\"description\":" << quoted(a.description) << ",";
    oss << "\"severity\":\"" << alert_severity_to_string(a.severity) << "\",";
    oss << "\"category\":" << quoted(a.category) << ",";
    oss << "\"source\":" << quoted(a.source) << ",";
    oss << "\"timestamp\":\"" << format_iso8601(a.timestamp) << "\",";
    oss << "\"resolved\":" << (a.resolved ? "true" : "false") << ",";
    oss << "\"escalated\":" << (a.escalated ? "true" : "false") << ",";
    oss << "\"metadata\":";
    write_string_map(oss, a.metadata);
    oss << "}";
    return oss.str();
}

std::string json_payload_builder::incident_summary_json(const incident& inc) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":" << quoted(inc.id) << ",";
    oss << "\"title\":" << quoted(inc.title) << ",";
    oss << "\"status\":\"" << incident_status_to_string(inc.status) << "\",";
    oss << "\"severity\":\"" << alert_severity_to_string(inc.severity) << "\",";
    oss << "\"alertCount\":" << inc.alerts.size();
    oss << "}";
    return oss.str();
}

std::string json_payload_builder::chat(const notification_channel& channel,
                                       const payload_context& ctx) {
    const auto& a = ctx.subject;
    std::ostringstream oss;
    oss << "{";
    oss << "\"channel\":" << quoted(channel.get("channel", "#alerts")) << ",";
    oss << "\"alertId\":" << quoted(a.id) << ",";
    oss << "\"attachments\":[{";
    oss << "\"color\":\"" << severity_color(a.severity) << "\",";
    oss << "\"title\":" << quoted("[" + upper(alert_severity_to_string(a.severity)) + "] " + a.title) << ",";
    oss << "\"text\":" << quoted(a.description) << ",";
    oss << "\"fields\":[";
    write_field(oss, "Service", ctx.service);
    oss << ",";
    write_field(oss, "Environment", ctx.environment);
    oss << ",";
    write_field(oss, "Category", a.category);
    oss << ",";
    write_field(oss, "Source", a.source);
    if (ctx.related_incident) {
        oss << ",";
        write_field(oss, "Incident", ctx.related_incident->id);
    }
    oss << "],";
    oss << "\"ts\":" << (to_epoch_ms(a.timestamp) / 1000);
    oss << "}],";
    oss << "\"timestamp\":\"" << format_iso8601(a.timestamp) << "\"";
    oss << "}";
    return oss.str();
}

std::string json_payload_builder::email_subject(const payload_context& ctx) {
    return "[" + upper(alert_severity_to_string(ctx.subject.severity)) + "] " + ctx.subject.title +
           " - " + ctx.service;
}

std::string json_payload_builder::email_body(const payload_context& ctx) {
    const auto& a = ctx.subject;
    std::ostringstream oss;
    oss << "Alert: " << a.title << "\n"
        << "Severity: " << upper(alert_severity_to_string(a.severity)) << "\n"
        << "\n"
        << "Description:\n"
        << a.description << "\n"
        << "\n"
        << "Details:\n"
        << "- Service: " << ctx.service << "\n"
        << "- Environment: " << ctx.environment << "\n"
        << "- Category: " << a.category << "\n"
        << "- Source: " << a.source << "\n"
        << "- Time: " << format_iso8601(a.timestamp) << "\n";
    if (ctx.related_incident) {
        oss << "- Incident: " << ctx.related_incident->id << " ("
            << incident_status_to_string(ctx.related_incident->status) << ")\n";
    }
    oss << "\nAlert ID: " << a.id;
    return oss.str();
}

std::string json_payload_builder::email(const notification_channel& channel,
                                        const payload_context& ctx) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"to\":[";
    std::istringstream recipients(channel.get("recipients"));
    std::string recipient;
    bool first = true;
    while (std::getline(recipients, recipient, ',')) {
        auto start = recipient.find_first_not_of(" \t");
        if (start == std::string::npos) {
            continue;
        }
        auto end = recipient.find_last_not_of(" \t");
        if (!first) oss << ",";
        oss << quoted(recipient.substr(start, end - start + 1));
        first = false;
    }
    oss << "],";
    oss << "\"subject\":" << quoted(email_subject(ctx)) << ",";
    oss << "\"body\":" << quoted(email_body(ctx)) << ",";
    oss << "\"alertId\":" << quoted(ctx.subject.id);
    oss << "}";
    return oss.str();
}

std::string json_payload_builder::webhook(const payload_context& ctx) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"alert\",";
    oss << "\"alert\":" << alert_json(ctx.subject) << ",";
    oss << "\"incident\":"
        << (ctx.related_incident ? incident_summary_json(*ctx.related_incident) : "null") << ",";
    oss << "\"service\":" << quoted(ctx.service) << ",";
    oss << "\"environment\":" << quoted(ctx.environment) << ",";
    oss << "\"timestamp\":\"" << format_iso8601(ctx.sent_at) << "\"";
    oss << "}";
    return oss.str();
}

std::string json_payload_builder::pagerduty(const notification_channel& channel,
                                            const payload_context& ctx) {
    const auto& a = ctx.subject;

    std::map<std::string, std::string> details = a.metadata;
    details["alert_id"] = a.id;
    details["environment"] = ctx.environment;
    details["timestamp"] = format_iso8601(ctx.sent_at);
    if (ctx.related_incident) {
        details["incident_id"] = ctx.related_incident->id;
    }

    std::ostringstream oss;
    oss << "{";
    oss << "\"routing_key\":" << quoted(channel.get("routing_key")) << ",";
    oss << "\"event_action\":\"trigger\",";
    oss << "\"dedup_key\":" << quoted(a.id) << ",";
    oss << "\"payload\":{";
    oss << "\"summary\":" << quoted(a.title + ": " + a.description) << ",";
    oss << "\"severity\":\"" << alert_severity_to_string(a.severity) << "\",";
    oss << "\"source\":" << quoted(ctx.service) << ",";
    oss << "\"component\":" << quoted(a.source) << ",";
    oss << "\"group\":" << quoted(a.category) << ",";
    oss << "\"class\":\"" << alert_severity_to_string(a.severity) << "\",";
    oss << "\"custom_details\":";
    write_string_map(oss, details);
    oss << "}}";
    return oss.str();
}

std::string json_payload_builder::escalation(const alert& a, time_point sent_at) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"alert_escalation\",";
    oss << "\"alert\":" << alert_json(a) << ",";
    oss << "\"timestamp\":\"" << format_iso8601(sent_at) << "\"";
    oss << "}";
    return oss.str();
}

std::string json_payload_builder::build(const notification_channel& channel,
                                        const payload_context& ctx) {
    switch (channel.type) {
        case channel_type::slack:     return chat(channel, ctx);
        case channel_type::email:     return email(channel, ctx);
        case channel_type::pagerduty: return pagerduty(channel, ctx);
        case channel_type::webhook:
        default:                      return webhook(ctx);
    }
}

} // namespace watchtower
