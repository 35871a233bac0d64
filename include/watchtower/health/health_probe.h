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
 * @file health_probe.h
 * @brief Periodic self-check that feeds health samples back into the engine
 *
 * The probe calls a user-supplied check under a timeout and converts the
 * outcome into metric samples: on success the measured latency, database
 * health and optional AI success rate; on failure a sentinel latency and
 * an unhealthy database reading, so that the regular rules fire.
 */

#include "../core/engine_logger.h"
#include "../core/periodic_task.h"
#include "../core/result_types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace watchtower {

/**
 * @struct health_signal
 * @brief What a successful probe reports
 */
struct health_signal {
    bool database_healthy = true;
    std::optional<double> ai_success_rate;
};

/**
 * @struct health_probe_config
 */
struct health_probe_config {
    std::chrono::milliseconds interval{std::chrono::minutes(1)};
    std::chrono::milliseconds timeout{10000};
    double failure_latency_ms = 30000.0;

    result_void validate() const {
        if (interval <= std::chrono::milliseconds::zero()) {
            return make_void_error(error_code::invalid_configuration,
                                   "Health check interval must be positive");
        }
        if (timeout <= std::chrono::milliseconds::zero()) {
            return make_void_error(error_code::invalid_configuration,
                                   "Health probe timeout must be positive");
        }
        return make_void_success();
    }
};

/**
 * @struct probe_report
 * @brief Outcome of one probe run and the samples it produced
 */
struct probe_report {
    bool success = false;
    std::chrono::milliseconds latency{0};
    std::optional<std::string> error;
    std::vector<std::pair<std::string, double>> samples;
};

/**
 * @class health_probe
 * @brief Runs the probe function and records the resulting samples
 */
class health_probe {
public:
    using probe_function = std::function<common::Result<health_signal>()>;
    using metric_sink = std::function<void(const std::string& metric, double value)>;

    static constexpr const char* latency_metric = "api_response_time";
    static constexpr const char* database_metric = "database_health";
    static constexpr const char* ai_success_metric = "ai_success_rate";

    health_probe(probe_function probe,
                 metric_sink sink,
                 const health_probe_config& config = {},
                 engine_logger logger = {});

    /**
     * @brief Probe once; never throws
     */
    probe_report run_once();

    result_void start();
    result_void stop();
    bool is_running() const;

    std::uint64_t failure_count() const { return failures_.load(); }
    std::uint64_t run_count() const { return runs_.load(); }

private:
    probe_function probe_;
    metric_sink sink_;
    health_probe_config config_;
    engine_logger logger_;

    std::atomic<std::uint64_t> runs_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::unique_ptr<periodic_task> task_;
};

} // namespace watchtower
