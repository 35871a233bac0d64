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
 * @file engine_logger.h
 * @brief Component-scoped logging over common_system's ILogger
 *
 * Watchtower never depends on a concrete logger implementation. Any
 * common::interfaces::ILogger can be injected; a null logger disables
 * logging entirely.
 */

#include "result_types.h"
#include <kcenon/common/interfaces/logger_interface.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace watchtower {

using log_level = common::interfaces::log_level;

/**
 * @class engine_logger
 * @brief Prefixes messages with a component name and forwards them to ILogger
 *
 * Copies share the underlying logger. A failed log call is reported on
 * std::cerr and otherwise ignored so that logging never affects alerting.
 */
class engine_logger {
public:
    engine_logger() = default;

    engine_logger(std::shared_ptr<common::interfaces::ILogger> logger,
                  std::string component)
        : logger_(std::move(logger)), component_(std::move(component)) {}

    /**
     * @brief Derive a logger for another component sharing the same sink
     */
    engine_logger for_component(std::string component) const {
        return engine_logger(logger_, std::move(component));
    }

    bool is_available() const { return logger_ != nullptr; }

    const std::string& component() const { return component_; }

    void debug(const std::string& message) const { write(log_level::debug, message); }
    void info(const std::string& message) const { write(log_level::info, message); }
    void warning(const std::string& message) const { write(log_level::warning, message); }
    void error(const std::string& message) const { write(log_level::error, message); }

private:
    void write(log_level level, const std::string& message) const {
        if (!logger_ || !logger_->is_enabled(level)) {
            return;
        }
        auto result = logger_->log(level, "[" + component_ + "] " + message);
        if (result.is_err()) {
            std::cerr << "[watchtower] logger rejected message from " << component_
                      << ": " << result.error().message << std::endl;
        }
    }

    std::shared_ptr<common::interfaces::ILogger> logger_;
    std::string component_{"watchtower"};
};

} // namespace watchtower
