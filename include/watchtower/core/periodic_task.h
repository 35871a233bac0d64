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
 * @file periodic_task.h
 * @brief Background task that runs a body at a fixed interval
 */

#include "engine_logger.h"
#include "result_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace watchtower {

/**
 * @class periodic_task
 * @brief Worker thread woken by a condition variable every interval
 *
 * The body first runs one full interval after start(). stop() wakes the
 * worker immediately and joins it. Exceptions thrown by the body are
 * logged and the schedule continues.
 */
class periodic_task {
public:
    using task_body = std::function<void()>;

    periodic_task(std::string name,
                  std::chrono::milliseconds interval,
                  task_body body,
                  engine_logger logger = {});

    ~periodic_task();

    periodic_task(const periodic_task&) = delete;
    periodic_task& operator=(const periodic_task&) = delete;

    result_void start();
    result_void stop();
    bool is_running() const { return running_.load(); }

    const std::string& name() const { return name_; }
    std::chrono::milliseconds interval() const { return interval_; }

    /**
     * @brief Number of completed body executions
     */
    std::size_t run_count() const { return run_count_.load(); }

private:
    void run_loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    task_body body_;
    engine_logger logger_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> run_count_{0};
    std::thread worker_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
};

} // namespace watchtower
