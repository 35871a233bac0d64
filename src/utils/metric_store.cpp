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

#include "watchtower/utils/metric_store.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace watchtower {

// ========== metric_history ==========

metric_history::metric_history(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("metric_history capacity must be positive");
    }
    buffer_.resize(capacity);
}

void metric_history::push(const metric_sample& sample) noexcept {
    buffer_[head_] = sample;
    head_ = (head_ + 1) % buffer_.size();
    if (count_ < buffer_.size()) {
        ++count_;
    }
}

const metric_sample& metric_history::at(std::size_t logical_index) const noexcept {
    if (count_ < buffer_.size()) {
        return buffer_[logical_index];
    }
    return buffer_[(head_ + logical_index) % buffer_.size()];
}

std::vector<metric_sample> metric_history::suffix_since(
    std::chrono::system_clock::time_point since) const {
    std::size_t first = count_;
    while (first > 0 && at(first - 1).timestamp >= since) {
        --first;
    }

    std::vector<metric_sample> result;
    result.reserve(count_ - first);
    for (std::size_t i = first; i < count_; ++i) {
        result.push_back(at(i));
    }
    return result;
}

std::vector<metric_sample> metric_history::all() const {
    std::vector<metric_sample> result;
    result.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        result.push_back(at(i));
    }
    return result;
}

std::optional<metric_sample> metric_history::latest() const {
    if (count_ == 0) {
        return std::nullopt;
    }
    return at(count_ - 1);
}

// ========== metric_store ==========

metric_store::metric_store(const metric_store_config& config) : config_(config) {
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid metric_store configuration: " +
                                    validation.error().message);
    }
}

void metric_store::record_sample(const std::string& metric,
                                 double value,
                                 std::chrono::system_clock::time_point timestamp) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = histories_.find(metric);
        if (it == histories_.end()) {
            it = histories_.emplace(
                metric, std::make_unique<metric_history>(config_.max_samples_per_metric)).first;
        }
        it->second->push(metric_sample{metric, value, timestamp});
    } catch (const std::exception&) {
        // Allocation or locking failed: the sample is dropped, history stays consistent.
    }
}

std::vector<metric_sample> metric_store::samples_in_window(
    const std::string& metric,
    std::chrono::system_clock::time_point since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(metric);
    if (it == histories_.end()) {
        return {};
    }
    return it->second->suffix_since(since);
}

std::vector<metric_sample> metric_store::history(const std::string& metric) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(metric);
    if (it == histories_.end()) {
        return {};
    }
    return it->second->all();
}

result<metric_sample> metric_store::latest(const std::string& metric) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(metric);
    if (it == histories_.end()) {
        return make_error<metric_sample>(error_code::invalid_argument,
                                         "No samples recorded for metric '" + metric + "'");
    }
    auto sample = it->second->latest();
    if (!sample) {
        return make_error<metric_sample>(error_code::invalid_argument,
                                         "No samples recorded for metric '" + metric + "'");
    }
    return make_success(*sample);
}

std::size_t metric_store::history_size(const std::string& metric) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(metric);
    return it == histories_.end() ? 0 : it->second->size();
}

std::vector<std::string> metric_store::metric_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(histories_.size());
    for (const auto& [name, history] : histories_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void metric_store::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    histories_.clear();
}

} // namespace watchtower
