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
 * @file bounded_call.h
 * @brief Run a callable on its own thread and wait for it with a deadline
 *
 * Unlike std::async, the returned future never blocks in its destructor,
 * so a caller that gives up at the deadline is not held hostage by a hung
 * transport or probe. The callable must own everything it touches.
 */

#include <chrono>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace watchtower {

/**
 * @brief Launch a callable on a detached thread
 * @return Future for the callable's result; exceptions surface through get()
 * @throws std::system_error if the thread cannot be created
 */
template <typename Fn>
auto launch_detached(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using return_type = std::invoke_result_t<std::decay_t<Fn>>;

    std::packaged_task<return_type()> task(std::forward<Fn>(fn));
    auto future = task.get_future();
    std::thread(std::move(task)).detach();
    return future;
}

/**
 * @brief Whether a future became ready before the deadline
 */
template <typename T>
bool ready_before(std::future<T>& future, std::chrono::steady_clock::time_point deadline) {
    return future.wait_until(deadline) == std::future_status::ready;
}

} // namespace watchtower
