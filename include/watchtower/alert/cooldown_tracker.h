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
 * @file cooldown_tracker.h
 * @brief Last-fire bookkeeping that suppresses repeated alerts per rule
 */

#include "../utils/time_format.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace watchtower {

/**
 * @class cooldown_tracker
 * @brief Remembers when each rule last fired
 *
 * A rule is suppressed while now - last_fire < cooldown. The boundary is
 * exclusive: exactly one cooldown after a fire the rule may fire again.
 */
class cooldown_tracker {
public:
    bool is_suppressed(const std::string& rule_id,
                       std::chrono::milliseconds cooldown,
                       time_point now) const;

    void record_fire(const std::string& rule_id, time_point when);

    std::optional<time_point> last_fire(const std::string& rule_id) const;

    /**
     * @brief Forget a rule's last fire so it may fire immediately
     * @return true if the rule had a recorded fire
     */
    bool clear(const std::string& rule_id);

    void clear_all();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, time_point> last_fire_;
};

} // namespace watchtower
