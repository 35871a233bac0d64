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

#include "watchtower/alert/escalation_scheduler.h"

#include <exception>
#include <stdexcept>
#include <vector>

namespace watchtower {

escalation_scheduler::escalation_scheduler(escalation_handler handler, engine_logger logger)
    : handler_(std::move(handler)), logger_(logger.for_component("escalation_scheduler")) {
    if (!handler_) {
        throw std::invalid_argument("escalation_scheduler requires a handler");
    }
}

escalation_scheduler::~escalation_scheduler() {
    if (running_.load()) {
        stop();
    }
}

result_void escalation_scheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load()) {
        return make_void_error(error_code::already_started,
                               "Escalation scheduler is already running");
    }
    running_.store(true);
    worker_ = std::thread(&escalation_scheduler::run_loop, this);
    return make_void_success();
}

result_void escalation_scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return make_void_success();
        }
        running_.store(false);
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    return make_void_success();
}

result_void escalation_scheduler::arm(const std::string& alert_id,
                                      std::chrono::milliseconds delay) {
    if (alert_id.empty()) {
        return make_void_error(error_code::invalid_argument, "Alert id cannot be empty");
    }
    if (delay <= std::chrono::milliseconds::zero()) {
        return make_void_error(error_code::invalid_argument,
                               "Escalation delay must be positive");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index_.find(alert_id) != index_.end()) {
            return make_void_error(error_code::already_armed,
                                   "Escalation already armed for alert " + alert_id);
        }
        auto it = queue_.emplace(steady_clock::now() + delay, alert_id);
        index_.emplace(alert_id, it);
    }
    cv_.notify_all();
    return make_void_success();
}

bool escalation_scheduler::cancel(const std::string& alert_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(alert_id);
    if (it == index_.end()) {
        return false;
    }
    queue_.erase(it->second);
    index_.erase(it);
    return true;
}

bool escalation_scheduler::is_armed(const std::string& alert_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(alert_id) != index_.end();
}

std::size_t escalation_scheduler::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t escalation_scheduler::run_due(steady_clock::time_point now) {
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!queue_.empty() && queue_.begin()->first <= now) {
            due.push_back(queue_.begin()->second);
            index_.erase(queue_.begin()->second);
            queue_.erase(queue_.begin());
        }
    }

    for (const auto& alert_id : due) {
        try {
            handler_(alert_id);
        } catch (const std::exception& e) {
            logger_.error("Escalation handler failed for alert " + alert_id + ": " + e.what());
        }
    }
    return due.size();
}

void escalation_scheduler::run_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
            } else {
                auto next_due = queue_.begin()->first;
                cv_.wait_until(lock, next_due, [this, next_due] {
                    return !running_.load() || queue_.empty() ||
                           queue_.begin()->first < next_due;
                });
            }
        }

        if (!running_.load()) {
            break;
        }
        run_due(steady_clock::now());
    }
}

} // namespace watchtower
