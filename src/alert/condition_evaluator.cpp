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

#include "watchtower/alert/condition_evaluator.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace watchtower {

std::string format_metric_value(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == 0.0) {
        return "0";
    }

    char buffer[64];
    if (std::trunc(value) == value && std::fabs(value) < 1e21) {
        std::snprintf(buffer, sizeof(buffer), "%.0f", value);
        return buffer;
    }

    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

std::string format_threshold(const condition_threshold& threshold) {
    if (const auto* number = std::get_if<double>(&threshold)) {
        return format_metric_value(*number);
    }
    return std::get<std::string>(threshold);
}

result<bool> condition_evaluator::compare(const alert_condition& condition, double value) {
    if (is_categorical(condition.op)) {
        const auto haystack = format_metric_value(value);
        const auto needle = format_threshold(condition.threshold);
        const bool found = haystack.find(needle) != std::string::npos;
        return make_success(condition.op == condition_operator::contains ? found : !found);
    }

    const auto* threshold = std::get_if<double>(&condition.threshold);
    if (threshold == nullptr) {
        return make_error<bool>(
            error_code::evaluation_failed,
            std::string("Operator '") + condition_operator_to_string(condition.op) +
                "' cannot compare against non-numeric threshold '" +
                std::get<std::string>(condition.threshold) + "'");
    }

    switch (condition.op) {
        case condition_operator::gt:  return make_success(value > *threshold);
        case condition_operator::lt:  return make_success(value < *threshold);
        case condition_operator::gte: return make_success(value >= *threshold);
        case condition_operator::lte: return make_success(value <= *threshold);
        case condition_operator::eq:  return make_success(value == *threshold);
        default:
            return make_error<bool>(error_code::unknown_operator,
                                    "Unsupported condition operator");
    }
}

result<bool> condition_evaluator::evaluate(const alert_condition& condition,
                                           double latest_value,
                                           time_point latest_timestamp) const {
    auto window = store_.samples_in_window(condition.metric,
                                           latest_timestamp - condition.time_window);
    if (window.empty()) {
        return make_success(false);
    }

    auto latest_check = compare(condition, latest_value);
    if (latest_check.is_err() || !latest_check.value()) {
        return latest_check;
    }

    if (!condition.consecutive_failures || *condition.consecutive_failures <= 1) {
        return make_success(true);
    }

    const auto required = static_cast<std::size_t>(*condition.consecutive_failures);
    if (window.size() < required) {
        return make_success(false);
    }

    for (auto it = window.end() - static_cast<std::ptrdiff_t>(required); it != window.end(); ++it) {
        auto check = compare(condition, it->value);
        if (check.is_err() || !check.value()) {
            return check;
        }
    }
    return make_success(true);
}

} // namespace watchtower
