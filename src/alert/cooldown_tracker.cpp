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

#include "watchtower/alert/cooldown_tracker.h"

namespace watchtower {

bool cooldown_tracker::is_suppressed(const std::string& rule_id,
                                     std::chrono::milliseconds cooldown,
                                     time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_fire_.find(rule_id);
    if (it == last_fire_.end()) {
        return false;
    }
    return now - it->second < cooldown;
}

void cooldown_tracker::record_fire(const std::string& rule_id, time_point when) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_fire_[rule_id] = when;
}

std::optional<time_point> cooldown_tracker::last_fire(const std::string& rule_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_fire_.find(rule_id);
    if (it == last_fire_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool cooldown_tracker::clear(const std::string& rule_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_fire_.erase(rule_id) > 0;
}

void cooldown_tracker::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_fire_.clear();
}

} // namespace watchtower
