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
 * @file metric_store.h
 * @brief Bounded per-metric sample history
 *
 * Each metric owns a ring buffer of the most recent samples in insertion
 * order. Rule evaluation reads windows of this history; it is never
 * re-sorted by timestamp.
 */

#include "../core/result_types.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace watchtower {

/**
 * @struct metric_sample
 * @brief One recorded observation of a named metric
 */
struct metric_sample {
    std::string metric;
    double value = 0.0;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct metric_store_config
 * @brief Configuration for the metric store
 */
struct metric_store_config {
    std::size_t max_samples_per_metric = 1000;

    result_void validate() const {
        if (max_samples_per_metric == 0) {
            return make_void_error(error_code::invalid_configuration,
                                   "Max samples per metric must be positive");
        }
        return make_void_success();
    }
};

/**
 * @class metric_history
 * @brief Fixed-capacity ring buffer holding one metric's samples
 *
 * Not synchronized; metric_store guards every instance.
 */
class metric_history {
public:
    explicit metric_history(std::size_t capacity);

    /**
     * @brief Append a sample, overwriting the oldest one when full
     */
    void push(const metric_sample& sample) noexcept;

    /**
     * @brief Longest suffix whose timestamps are all >= since, oldest first
     */
    std::vector<metric_sample> suffix_since(std::chrono::system_clock::time_point since) const;

    std::vector<metric_sample> all() const;
    std::optional<metric_sample> latest() const;

    std::size_t size() const noexcept { return count_; }
    std::size_t capacity() const noexcept { return buffer_.size(); }

private:
    const metric_sample& at(std::size_t logical_index) const noexcept;

    std::vector<metric_sample> buffer_;
    std::size_t head_ = 0;
    std::size_t count_ = 0;
};

/**
 * @class metric_store
 * @brief Thread-safe map from metric name to its bounded history
 */
class metric_store {
public:
    explicit metric_store(const metric_store_config& config = {});

    metric_store(const metric_store&) = delete;
    metric_store& operator=(const metric_store&) = delete;

    /**
     * @brief Append a sample; evicts the oldest sample past capacity
     */
    void record_sample(const std::string& metric,
                       double value,
                       std::chrono::system_clock::time_point timestamp) noexcept;

    /**
     * @brief Samples recorded for metric, newest suffix with timestamp >= since
     *
     * The scan walks backward from the newest sample and stops at the first
     * older one, so the cost is proportional to the window size.
     */
    std::vector<metric_sample> samples_in_window(
        const std::string& metric,
        std::chrono::system_clock::time_point since) const;

    std::vector<metric_sample> history(const std::string& metric) const;
    result<metric_sample> latest(const std::string& metric) const;
    std::size_t history_size(const std::string& metric) const;
    std::vector<std::string> metric_names() const;

    std::size_t capacity() const { return config_.max_samples_per_metric; }
    void clear();

private:
    metric_store_config config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<metric_history>> histories_;
};

} // namespace watchtower
