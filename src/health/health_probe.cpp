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

#include "watchtower/health/health_probe.h"
#include "watchtower/core/bounded_call.h"

#include <exception>
#include <future>
#include <stdexcept>
#include <system_error>

namespace watchtower {

health_probe::health_probe(probe_function probe,
                           metric_sink sink,
                           const health_probe_config& config,
                           engine_logger logger)
    : probe_(std::move(probe))
    , sink_(std::move(sink))
    , config_(config)
    , logger_(logger.for_component("health_probe")) {
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid health_probe configuration: " +
                                    validation.error().message);
    }
    if (!sink_) {
        throw std::invalid_argument("health_probe requires a metric sink");
    }
    task_ = std::make_unique<periodic_task>(
        "health_probe", config_.interval, [this] { run_once(); }, logger_);
}

probe_report health_probe::run_once() {
    runs_.fetch_add(1);
    probe_report report;

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + config_.timeout;

    if (!probe_) {
        report.error = error_code_to_string(error_code::probe_not_configured);
    } else {
        try {
            auto probe = probe_;
            auto future = launch_detached([probe]() { return probe(); });
            if (!ready_before(future, deadline)) {
                report.error = "Health probe timed out after " +
                               std::to_string(config_.timeout.count()) + "ms";
            } else {
                auto result = future.get();
                report.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                if (result.is_err()) {
                    report.error = result.error().message;
                } else {
                    const auto& signal = result.value();
                    report.success = true;
                    report.samples.emplace_back(latency_metric,
                                                static_cast<double>(report.latency.count()));
                    report.samples.emplace_back(database_metric,
                                                signal.database_healthy ? 1.0 : 0.0);
                    if (signal.ai_success_rate) {
                        report.samples.emplace_back(ai_success_metric, *signal.ai_success_rate);
                    }
                }
            }
        } catch (const std::exception& e) {
            report.error = std::string("Health probe threw: ") + e.what();
        } catch (...) {
            report.error = "Health probe threw a non-standard exception";
        }
    }

    if (!report.success) {
        failures_.fetch_add(1);
        logger_.error("Health check failed: " + report.error.value_or("unknown error"));
        report.samples.clear();
        report.samples.emplace_back(latency_metric, config_.failure_latency_ms);
        report.samples.emplace_back(database_metric, 0.0);
    }

    for (const auto& [metric, value] : report.samples) {
        sink_(metric, value);
    }
    return report;
}

result_void health_probe::start() {
    return task_->start();
}

result_void health_probe::stop() {
    return task_->stop();
}

bool health_probe::is_running() const {
    return task_->is_running();
}

} // namespace watchtower
