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
 * @file condition_evaluator.h
 * @brief Decide whether an alert condition holds for the latest sample
 */

#include "alert_rule.h"
#include "../utils/metric_store.h"
#include "../utils/time_format.h"

#include <string>

namespace watchtower {

/**
 * @brief Canonical string form of a metric value
 *
 * Integral values print without a fraction ("42"), others use the
 * shortest representation that reads back to the same double ("0.1").
 * Non-finite values print as "NaN", "Infinity" and "-Infinity".
 */
std::string format_metric_value(double value);

/**
 * @brief String form of a threshold; numeric thresholds use format_metric_value
 */
std::string format_threshold(const condition_threshold& threshold);

/**
 * @class condition_evaluator
 * @brief Applies a condition to the latest sample and its metric history
 *
 * The evaluator reads history from the metric store but never writes it.
 * Evaluation steps:
 * 1. The window is the history suffix with timestamp >= latest - time_window.
 *    An empty window fails.
 * 2. The comparison must hold for the latest value.
 * 3. With consecutive_failures N > 1, the last N window samples must all
 *    satisfy the comparison; fewer than N samples fails.
 */
class condition_evaluator {
public:
    explicit condition_evaluator(const metric_store& store) : store_(store) {}

    /**
     * @brief Evaluate condition for a freshly recorded sample
     * @return true when the condition passes; an error when the condition
     *         cannot be evaluated (numeric operator with string threshold)
     */
    result<bool> evaluate(const alert_condition& condition,
                          double latest_value,
                          time_point latest_timestamp) const;

    /**
     * @brief Apply the condition's operator to a single value
     */
    static result<bool> compare(const alert_condition& condition, double value);

private:
    const metric_store& store_;
};

} // namespace watchtower
