// Copyright 2024 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_CONTENTGIT_LOGGING_LOG_LEVEL_HPP
#define INCLUDED_SRC_CONTENTGIT_LOGGING_LOG_LEVEL_HPP

#include <algorithm>
#include <optional>
#include <string>
#include <type_traits>

#include "gsl/gsl"

enum class LogLevel {
    Error,    ///< Error messages, failed operations
    Warning,  ///< Warning messages, degraded but valid situations
    Info,     ///< Informative messages, such as reporting status
    Debug,    ///< Debug messages, such as git sub-operations being run
    Trace     ///< Trace messages, verbose details such as libgit2 lookups
};

constexpr auto kFirstLogLevel = LogLevel::Error;
constexpr auto kLastLogLevel = LogLevel::Trace;
constexpr auto kDefaultLogLevel = LogLevel::Info;

[[nodiscard]] static inline auto ToLogLevel(
    std::underlying_type_t<LogLevel> level) -> LogLevel {
    return std::min(std::max(static_cast<LogLevel>(level), kFirstLogLevel),
                    kLastLogLevel);
}

/// \brief Parse a log level from its printed name (case-sensitive).
[[nodiscard]] static inline auto LogLevelFromString(std::string const& name)
    -> std::optional<LogLevel> {
    if (name == "ERROR") {
        return LogLevel::Error;
    }
    if (name == "WARN") {
        return LogLevel::Warning;
    }
    if (name == "INFO") {
        return LogLevel::Info;
    }
    if (name == "DEBUG") {
        return LogLevel::Debug;
    }
    if (name == "TRACE") {
        return LogLevel::Trace;
    }
    return std::nullopt;
}

[[nodiscard]] static inline auto LogLevelToString(LogLevel level)
    -> std::string {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    Ensures(false);  // unreachable
}

#endif  // INCLUDED_SRC_CONTENTGIT_LOGGING_LOG_LEVEL_HPP
