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
 * @file escalation_scheduler.h
 * @brief Cancellable one-shot escalation checks
 */

#include "../core/engine_logger.h"
#include "../core/result_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace watchtower {

/**
 * @class escalation_scheduler
 * @brief Runs the escalation handler for an alert once its delay elapsed
 *
 * Each alert can have at most one pending check. Resolving an alert
 * cancels its check so nothing fires later. The handler is invoked on the
 * scheduler's worker thread, outside of the scheduler lock.
 *
 * Delays are measured on the steady clock.
 */
class escalation_scheduler {
public:
    using steady_clock = std::chrono::steady_clock;
    using escalation_handler = std::function<void(const std::string& alert_id)>;

    explicit escalation_scheduler(escalation_handler handler, engine_logger logger = {});
    ~escalation_scheduler();

    escalation_scheduler(const escalation_scheduler&) = delete;
    escalation_scheduler& operator=(const escalation_scheduler&) = delete;

    result_void start();
    result_void stop();
    bool is_running() const { return running_.load(); }

    /**
     * @brief Schedule an escalation check
     * @return already_armed when the alert already has a pending check,
     *         invalid_argument for an empty id or non-positive delay
     */
    result_void arm(const std::string& alert_id, std::chrono::milliseconds delay);

    /**
     * @brief Cancel a pending check
     * @return true if a check was pending
     */
    bool cancel(const std::string& alert_id);

    bool is_armed(const std::string& alert_id) const;
    std::size_t pending_count() const;

    /**
     * @brief Run every check due at or before now
     * @return Number of handler invocations
     */
    std::size_t run_due(steady_clock::time_point now);

private:
    using queue_type = std::multimap<steady_clock::time_point, std::string>;

    void run_loop();

    escalation_handler handler_;
    engine_logger logger_;

    std::atomic<bool> running_{false};
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    queue_type queue_;
    std::unordered_map<std::string, queue_type::iterator> index_;
};

} // namespace watchtower
