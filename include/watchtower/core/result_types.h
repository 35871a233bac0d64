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
 * @file result_types.h
 * @brief Result pattern helpers built on common_system's Result
 *
 * Every fallible watchtower operation returns common::Result<T> or
 * common::VoidResult. The helpers below attach a watchtower error_code
 * and the "watchtower" module tag.
 */

#include "error_codes.h"
#include <kcenon/common/patterns/result.h>

#include <optional>
#include <string>
#include <utility>

namespace watchtower {

namespace common = kcenon::common;

/**
 * @struct error_info
 * @brief Watchtower error with optional context
 */
struct error_info {
    error_code code;
    std::string message;
    std::optional<std::string> context{std::nullopt};

    error_info(error_code c,
               const std::string& msg = "",
               const std::optional<std::string>& ctx = std::nullopt)
        : code(c)
        , message(msg.empty() ? error_code_to_string(c) : msg)
        , context(ctx) {}

    std::string to_string() const {
        std::string result = "[" + error_code_to_string(code) + "] " + message;
        if (context.has_value()) {
            result += " Context: " + context.value();
        }
        return result;
    }

    /**
     * @brief Convert to common_system error_info
     */
    common::error_info to_common_error() const {
        common::error_info info(static_cast<int>(code), message, "watchtower");
        if (context) {
            info.details = context;
        }
        return info;
    }

    static error_info from_common_error(const common::error_info& common_err) {
        error_info info(static_cast<error_code>(common_err.code), common_err.message);
        if (common_err.details) {
            info.context = common_err.details;
        }
        return info;
    }
};

template<typename T>
using result = common::Result<T>;

using result_void = common::VoidResult;

template<typename T>
common::Result<std::decay_t<T>> make_success(T&& value) {
    return common::ok<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
common::Result<T> make_error(error_code code, const std::string& message = "") {
    error_info err(code, message);
    return common::Result<T>::err(err.to_common_error());
}

template<typename T>
common::Result<T> make_error_with_context(error_code code,
                                          const std::string& message,
                                          const std::string& context) {
    error_info err(code, message, context);
    return common::Result<T>::err(err.to_common_error());
}

inline common::VoidResult make_void_error(error_code code,
                                          const std::string& message = "") {
    error_info err(code, message);
    return common::VoidResult::err(err.to_common_error());
}

inline common::VoidResult make_void_success() {
    return common::VoidResult(std::monostate{});
}

/**
 * @brief Recover the watchtower error code carried by a common error
 */
inline error_code code_of(const common::error_info& err) {
    return static_cast<error_code>(err.code);
}

} // namespace watchtower
