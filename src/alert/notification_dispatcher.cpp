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

#include "watchtower/alert/notification_dispatcher.h"
#include "watchtower/core/bounded_call.h"

#include <exception>
#include <future>
#include <stdexcept>
#include <system_error>

namespace watchtower {

notification_dispatcher::notification_dispatcher(const notification_dispatcher_config& config,
                                                 engine_logger logger)
    : config_(config), logger_(logger.for_component("notification_dispatcher")) {
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid notification_dispatcher configuration: " +
                                    validation.error().message);
    }
}

void notification_dispatcher::register_client(channel_type type,
                                              std::shared_ptr<channel_client> client) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    if (client) {
        clients_[type] = std::move(client);
    } else {
        clients_.erase(type);
    }
}

void notification_dispatcher::unregister_client(channel_type type) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.erase(type);
}

bool notification_dispatcher::has_client(channel_type type) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.find(type) != clients_.end();
}

std::shared_ptr<channel_client> notification_dispatcher::client_for(channel_type type) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = clients_.find(type);
    return it != clients_.end() ? it->second : nullptr;
}

std::vector<delivery_outcome> notification_dispatcher::dispatch(
    const alert& a,
    const std::vector<notification_channel>& channels,
    const incident* related_incident) {
    metrics_.dispatches.fetch_add(1);

    const auto now = std::chrono::system_clock::now();
    payload_context ctx{a, related_incident, config_.service_name, config_.environment, now};

    std::vector<notification_message> messages;
    for (const auto& channel : channels) {
        if (!channel.enabled) {
            continue;
        }
        notification_message message;
        message.channel = channel;
        message.kind = "alert";
        message.alert_id = a.id;
        message.payload = json_payload_builder::build(channel, ctx);
        messages.push_back(std::move(message));
    }

    return deliver_all(messages);
}

delivery_outcome notification_dispatcher::dispatch_escalation(const alert& a,
                                                              const notification_channel& channel) {
    notification_message message;
    message.channel = channel;
    message.kind = "escalation";
    message.alert_id = a.id;
    message.payload = json_payload_builder::escalation(a, std::chrono::system_clock::now());

    auto outcomes = deliver_all({message});
    return outcomes.front();
}

delivery_outcome notification_dispatcher::test_channel(const notification_channel& channel) {
    const auto now = std::chrono::system_clock::now();

    alert probe;
    probe.id = "test_" + std::to_string(to_epoch_ms(now));
    probe.title = "Test Alert";
    probe.description = "This is a test notification from the " + config_.service_name +
                        " alerting engine";
    probe.severity = alert_severity::info;
    probe.category = "system_health";
    probe.source = "NotificationDispatcher";
    probe.timestamp = now;
    probe.metadata["test"] = "true";

    payload_context ctx{probe, nullptr, config_.service_name, config_.environment, now};

    notification_message message;
    message.channel = channel;
    message.channel.enabled = true;
    message.kind = "test";
    message.alert_id = probe.id;
    message.payload = json_payload_builder::build(channel, ctx);

    auto outcome = deliver_all({message}).front();
    if (outcome.success) {
        logger_.info(std::string("Channel test successful: ") + channel_type_to_string(channel.type));
    }
    return outcome;
}

void notification_dispatcher::record(const delivery_outcome& outcome) {
    if (outcome.success) {
        metrics_.deliveries_succeeded.fetch_add(1);
        logger_.debug(std::string("Delivered ") + outcome.alert_id + " via " +
                      channel_type_to_string(outcome.type));
        return;
    }
    metrics_.deliveries_failed.fetch_add(1);
    if (outcome.timed_out) {
        metrics_.deliveries_timed_out.fetch_add(1);
    }
    logger_.error(std::string("Failed to deliver ") + outcome.alert_id + " via " +
                  channel_type_to_string(outcome.type) + ": " + outcome.error.value_or("unknown error"));
}

std::vector<delivery_outcome> notification_dispatcher::deliver_all(
    const std::vector<notification_message>& messages) {
    struct pending_delivery {
        delivery_outcome outcome;
        std::optional<std::future<common::VoidResult>> future;
    };

    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;

    std::vector<pending_delivery> pending;
    pending.reserve(messages.size());

    for (const auto& message : messages) {
        pending_delivery delivery;
        delivery.outcome.type = message.channel.type;
        delivery.outcome.alert_id = message.alert_id;

        auto client = client_for(message.channel.type);
        if (!client) {
            delivery.outcome.error = std::string("No client registered for ") +
                                     channel_type_to_string(message.channel.type) + " channel";
        } else {
            try {
                delivery.future = launch_detached([client, message]() {
                    return client->send(message);
                });
            } catch (const std::system_error& e) {
                delivery.outcome.error = std::string("Could not start delivery: ") + e.what();
            }
        }
        pending.push_back(std::move(delivery));
    }

    std::vector<delivery_outcome> outcomes;
    outcomes.reserve(pending.size());

    for (auto& delivery : pending) {
        auto& outcome = delivery.outcome;
        if (delivery.future) {
            if (!ready_before(*delivery.future, deadline)) {
                outcome.timed_out = true;
                outcome.error = "Delivery timed out";
            } else {
                try {
                    auto result = delivery.future->get();
                    if (result.is_ok()) {
                        outcome.success = true;
                    } else {
                        outcome.error = result.error().message;
                    }
                } catch (const std::exception& e) {
                    outcome.error = std::string("Client threw: ") + e.what();
                } catch (...) {
                    outcome.error = "Client threw a non-standard exception";
                }
            }
        }
        record(outcome);
        outcomes.push_back(std::move(outcome));
    }

    return outcomes;
}

} // namespace watchtower
