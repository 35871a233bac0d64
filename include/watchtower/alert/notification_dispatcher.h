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
 * @file notification_dispatcher.h
 * @brief Concurrent, failure-isolated delivery of alert notifications
 */

#include "alert_types.h"
#include "notification_payloads.h"
#include "../core/engine_logger.h"
#include "../core/result_types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace watchtower {

/**
 * @struct notification_message
 * @brief A rendered notification ready for a transport
 */
struct notification_message {
    notification_channel channel;
    std::string kind{"alert"};          // "alert", "escalation" or "test"
    std::string alert_id;
    std::string payload;                // JSON document
    std::unordered_map<std::string, std::string> headers;
};

/**
 * @class channel_client
 * @brief Transport for one channel type
 *
 * Implementations may block or throw; the dispatcher isolates both.
 */
class channel_client {
public:
    virtual ~channel_client() = default;

    virtual std::string name() const = 0;

    virtual common::VoidResult send(const notification_message& message) = 0;
};

/**
 * @class http_channel_client
 * @brief Posts notification payloads through an injected HTTP sender
 *
 * The target URL is the channel's "url" config entry, falling back to the
 * endpoint given at construction.
 *
 * @code
 * auto client = std::make_shared<http_channel_client>(
 *     "https://events.pagerduty.com/v2/enqueue",
 *     [](const std::string& url, const auto& headers, const std::string& body) {
 *         return http.post(url, headers, body);
 *     });
 * dispatcher.register_client(channel_type::pagerduty, client);
 * @endcode
 */
class http_channel_client : public channel_client {
public:
    using http_sender_func = std::function<common::VoidResult(
        const std::string& url,
        const std::unordered_map<std::string, std::string>& headers,
        const std::string& body)>;

    http_channel_client(std::string default_endpoint, http_sender_func sender)
        : default_endpoint_(std::move(default_endpoint)), sender_(std::move(sender)) {}

    std::string name() const override { return "http:" + default_endpoint_; }

    common::VoidResult send(const notification_message& message) override {
        if (!sender_) {
            return make_void_error(error_code::delivery_failed, "No HTTP sender configured");
        }
        const auto url = message.channel.get("url", default_endpoint_);
        if (url.empty()) {
            return make_void_error(error_code::invalid_configuration,
                                   std::string("No endpoint configured for ") +
                                       channel_type_to_string(message.channel.type) + " channel");
        }

        auto headers = message.headers;
        headers["Content-Type"] = "application/json";
        return sender_(url, headers, message.payload);
    }

private:
    std::string default_endpoint_;
    http_sender_func sender_;
};

/**
 * @class callback_channel_client
 * @brief Hands every message to a user callback
 */
class callback_channel_client : public channel_client {
public:
    using callback_func = std::function<common::VoidResult(const notification_message&)>;

    callback_channel_client(std::string client_name, callback_func callback)
        : name_(std::move(client_name)), callback_(std::move(callback)) {}

    std::string name() const override { return name_; }

    common::VoidResult send(const notification_message& message) override {
        if (!callback_) {
            return make_void_error(error_code::delivery_failed, "No callback configured");
        }
        return callback_(message);
    }

private:
    std::string name_;
    callback_func callback_;
};

/**
 * @struct delivery_outcome
 * @brief Result of delivering to one channel
 */
struct delivery_outcome {
    channel_type type = channel_type::webhook;
    std::string alert_id;
    bool success = false;
    bool timed_out = false;
    std::optional<std::string> error;
};

/**
 * @struct notification_dispatcher_config
 */
struct notification_dispatcher_config {
    std::string service_name{"watchtower"};
    std::string environment{"development"};
    std::chrono::milliseconds timeout{10000};   ///< Shared deadline for one dispatch

    result_void validate() const {
        if (timeout <= std::chrono::milliseconds::zero()) {
            return make_void_error(error_code::invalid_configuration,
                                   "Notification timeout must be positive");
        }
        return make_void_success();
    }
};

/**
 * @struct notification_dispatcher_metrics
 */
struct notification_dispatcher_metrics {
    std::atomic<uint64_t> dispatches{0};
    std::atomic<uint64_t> deliveries_succeeded{0};
    std::atomic<uint64_t> deliveries_failed{0};
    std::atomic<uint64_t> deliveries_timed_out{0};

    notification_dispatcher_metrics() = default;

    notification_dispatcher_metrics(const notification_dispatcher_metrics& other)
        : dispatches(other.dispatches.load())
        , deliveries_succeeded(other.deliveries_succeeded.load())
        , deliveries_failed(other.deliveries_failed.load())
        , deliveries_timed_out(other.deliveries_timed_out.load()) {}
};

/**
 * @class notification_dispatcher
 * @brief Sends one alert to many channels without letting any one fail the rest
 *
 * Every enabled channel is attempted concurrently through the client
 * registered for its type. The call returns once all deliveries settled or
 * the shared deadline passed; a delivery still running at the deadline is
 * reported as timed out and left to finish on its own thread. Failures are
 * logged per channel and never propagate. There are no retries.
 */
class notification_dispatcher {
public:
    explicit notification_dispatcher(const notification_dispatcher_config& config = {},
                                     engine_logger logger = {});

    void register_client(channel_type type, std::shared_ptr<channel_client> client);
    void unregister_client(channel_type type);
    bool has_client(channel_type type) const;

    /**
     * @brief Deliver an alert to every enabled channel
     * @param related_incident Incident context included in payloads, may be null
     * @return One outcome per enabled channel, in channel order
     */
    std::vector<delivery_outcome> dispatch(const alert& a,
                                           const std::vector<notification_channel>& channels,
                                           const incident* related_incident = nullptr);

    /**
     * @brief Send the escalation payload for an alert to one channel
     */
    delivery_outcome dispatch_escalation(const alert& a, const notification_channel& channel);

    /**
     * @brief Send a synthetic info alert to verify a channel end to end
     */
    delivery_outcome test_channel(const notification_channel& channel);

    const notification_dispatcher_config& config() const { return config_; }
    notification_dispatcher_metrics get_metrics() const { return metrics_; }

private:
    std::vector<delivery_outcome> deliver_all(const std::vector<notification_message>& messages);
    std::shared_ptr<channel_client> client_for(channel_type type) const;
    void record(const delivery_outcome& outcome);

    notification_dispatcher_config config_;
    engine_logger logger_;
    notification_dispatcher_metrics metrics_;

    mutable std::mutex clients_mutex_;
    std::unordered_map<channel_type, std::shared_ptr<channel_client>> clients_;
};

} // namespace watchtower
