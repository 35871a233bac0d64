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

#pragma once

/**
 * @file notification_payloads.h
 * @brief JSON payloads sent to notification channels
 */

#include "alert_types.h"

#include <string>

namespace watchtower {

/**
 * @struct payload_context
 * @brief Everything a payload may reference
 */
struct payload_context {
    const alert& subject;
    const incident* related_incident = nullptr;
    std::string service;
    std::string environment;
    time_point sent_at;
};

/**
 * @class json_payload_builder
 * @brief Renders channel-specific JSON documents
 *
 * - chat (slack): channel, colour-coded attachment with title, text and
 *   Service/Environment/Category/Source fields plus alert id and timestamp
 * - email: recipients, "[SEVERITY] title - service" subject, plain-text body
 * - webhook: {"type":"alert", alert, incident, service, environment, timestamp}
 * - pagerduty: Events v2 trigger with dedup_key = alert id
 * - escalation: {"type":"alert_escalation", alert, timestamp}
 */
class json_payload_builder {
public:
    static std::string build(const notification_channel& channel, const payload_context& ctx);

    static std::string chat(const notification_channel& channel, const payload_context& ctx);
    static std::string email(const notification_channel& channel, const payload_context& ctx);
    static std::string webhook(const payload_context& ctx);
    static std::string pagerduty(const notification_channel& channel, const payload_context& ctx);
    static std::string escalation(const alert& a, time_point sent_at);

    static std::string alert_json(const alert& a);
    static std::string incident_summary_json(const incident& inc);

    static std::string email_subject(const payload_context& ctx);
    static std::string email_body(const payload_context& ctx);

    static const char* severity_color(alert_severity severity);
    static std::string escape_json(const std::string& s);
};

} // namespace watchtower
