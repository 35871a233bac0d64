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

#include "watchtower/core/periodic_task.h"

#include <exception>
#include <stdexcept>

namespace watchtower {

periodic_task::periodic_task(std::string name,
                             std::chrono::milliseconds interval,
                             task_body body,
                             engine_logger logger)
    : name_(std::move(name))
    , interval_(interval)
    , body_(std::move(body))
    , logger_(std::move(logger)) {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("periodic_task '" + name_ + "' requires a positive interval");
    }
    if (!body_) {
        throw std::invalid_argument("periodic_task '" + name_ + "' requires a body");
    }
}

periodic_task::~periodic_task() {
    if (running_.load()) {
        stop();
    }
}

result_void periodic_task::start() {
    if (running_.exchange(true)) {
        return make_void_error(error_code::already_started,
                               "Task '" + name_ + "' is already running");
    }
    worker_ = std::thread(&periodic_task::run_loop, this);
    return make_void_success();
}

result_void periodic_task::stop() {
    if (!running_.load()) {
        return make_void_success();
    }

    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    return make_void_success();
}

void periodic_task::run_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
        }

        if (!running_.load()) {
            break;
        }

        try {
            body_();
        } catch (const std::exception& e) {
            logger_.error("Task '" + name_ + "' failed: " + e.what());
        }
        run_count_.fetch_add(1);
    }
}

} // namespace watchtower
