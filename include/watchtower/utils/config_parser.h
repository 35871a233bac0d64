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
 * @file config_parser.h
 * @brief Typed access to string key/value configuration
 *
 * @code
 * config_map config = {{"enabled", "true"}, {"stale_alert_threshold", "24h"}};
 *
 * bool enabled = config_parser::get<bool>(config, "enabled", true);
 * auto stale = config_parser::get_duration(config, "stale_alert_threshold",
 *                                          std::chrono::milliseconds(0));
 * @endcode
 */

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace watchtower {

using config_map = std::unordered_map<std::string, std::string>;

/**
 * @class config_parser
 * @brief Parses configuration values with default fallback
 *
 * Unparseable values fall back to the default instead of failing, so a
 * typo in one optional key never prevents start-up. Callers that need
 * strict parsing use get_optional and report the missing value.
 */
class config_parser {
   public:
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        return parse_value_optional<T>(it->second).value_or(default_value);
    }

    template <typename T>
    static std::optional<T> get_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_value_optional<T>(it->second);
    }

    static bool has_key(const config_map& config, const std::string& key) {
        return config.find(key) != config.end();
    }

    /**
     * @brief Get a value clamped to [min_value, max_value]
     */
    template <typename T>
    static T get_clamped(const config_map& config, const std::string& key, const T& default_value,
                         const T& min_value, const T& max_value) {
        static_assert(std::is_arithmetic_v<T>, "get_clamped requires arithmetic type");
        T value = get<T>(config, key, default_value);
        if (value < min_value) return min_value;
        if (value > max_value) return max_value;
        return value;
    }

    /**
     * @brief Get a duration
     *
     * Supported formats:
     * - Plain number: interpreted as the Duration's unit
     * - With suffix: 100ms, 5s, 2m, 1h, 7d
     */
    template <typename Duration>
    static Duration get_duration(const config_map& config, const std::string& key,
                                 const Duration& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        return parse_duration<Duration>(it->second).value_or(default_value);
    }

    /**
     * @brief Get a list from a comma-separated value
     */
    template <typename T>
    static std::vector<T> get_list(const config_map& config, const std::string& key,
                                   const std::vector<T>& default_values) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_values;
        }
        auto parsed = parse_list<T>(it->second);
        return parsed.empty() ? default_values : parsed;
    }

    /**
     * @brief Parse a duration string
     * @return nullopt when the string is empty or malformed
     */
    template <typename Duration>
    static std::optional<Duration> parse_duration(const std::string& str) {
        if (str.empty()) {
            return std::nullopt;
        }

        size_t suffix_start = str.find_first_not_of("0123456789-");
        long long value = 0;
        try {
            value = std::stoll(str.substr(0, suffix_start));
        } catch (const std::logic_error&) {
            return std::nullopt;
        }

        if (suffix_start == std::string::npos) {
            return Duration(value);
        }

        std::string suffix = str.substr(suffix_start);
        while (!suffix.empty() && std::isspace(static_cast<unsigned char>(suffix.front()))) {
            suffix.erase(0, 1);
        }
        for (auto& c : suffix) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (suffix == "ms" || suffix == "millisecond" || suffix == "milliseconds") {
            return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(value));
        } else if (suffix == "s" || suffix == "sec" || suffix == "second" || suffix == "seconds") {
            return std::chrono::duration_cast<Duration>(std::chrono::seconds(value));
        } else if (suffix == "m" || suffix == "min" || suffix == "minute" || suffix == "minutes") {
            return std::chrono::duration_cast<Duration>(std::chrono::minutes(value));
        } else if (suffix == "h" || suffix == "hr" || suffix == "hour" || suffix == "hours") {
            return std::chrono::duration_cast<Duration>(std::chrono::hours(value));
        } else if (suffix == "d" || suffix == "day" || suffix == "days") {
            return std::chrono::duration_cast<Duration>(std::chrono::hours(24 * value));
        }
        return std::nullopt;
    }

   private:
    template <typename T>
    static std::optional<T> parse_value_optional(const std::string& str) {
        try {
            if constexpr (std::is_same_v<T, bool>) {
                return parse_bool(str);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return str;
            } else if constexpr (std::is_integral_v<T>) {
                return parse_integral<T>(str);
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(str));
            } else {
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }

    /**
     * @brief "true", "1", "yes", "on" (any case) are true; "false", "0", "no", "off" false
     * @throws std::invalid_argument for anything else
     */
    static bool parse_bool(const std::string& str) {
        std::string lower = str;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        throw std::invalid_argument("Not a boolean: " + str);
    }

    template <typename T>
    static T parse_integral(const std::string& str) {
        static_assert(std::is_integral_v<T>, "parse_integral requires integral type");
        if constexpr (std::is_signed_v<T>) {
            return static_cast<T>(std::stoll(str));
        } else {
            if (!str.empty() && str.front() == '-') {
                throw std::out_of_range("Negative value for unsigned key: " + str);
            }
            return static_cast<T>(std::stoull(str));
        }
    }

    template <typename T>
    static std::vector<T> parse_list(const std::string& str) {
        std::vector<T> result;
        std::string current;

        auto flush = [&result, &current]() {
            size_t start = current.find_first_not_of(" \t");
            size_t end = current.find_last_not_of(" \t");
            if (start != std::string::npos) {
                auto parsed = parse_value_optional<T>(current.substr(start, end - start + 1));
                if (parsed) {
                    result.push_back(*parsed);
                }
            }
            current.clear();
        };

        for (char c : str) {
            if (c == ',') {
                flush();
            } else {
                current += c;
            }
        }
        flush();
        return result;
    }
};

}  // namespace watchtower
