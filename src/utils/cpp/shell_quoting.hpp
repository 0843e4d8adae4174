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

#ifndef INCLUDED_SRC_UTILS_CPP_SHELL_QUOTING_HPP
#define INCLUDED_SRC_UTILS_CPP_SHELL_QUOTING_HPP

#include <algorithm>
#include <string>

/// \brief Quote a string for a POSIX shell. Every ' char is replaced by '\''
/// and the result is put inside a pair of ' chars.
[[nodiscard]] static inline auto QuoteForShell(std::string const& input)
    -> std::string {
    auto output = std::string(R"(')");
    auto start = input.begin();
    auto pos = input.find('\'');
    while (pos != std::string::npos) {
        output.append(
            start,
            input.begin() + static_cast<std::string::difference_type>(pos + 1));
        output += R"(\'')";
        start = input.begin() + static_cast<std::string::difference_type>(pos + 1);
        pos = input.find('\'', pos + 1);
    }
    output.append(start, input.end());
    output += R"(')";
    return output;
}

/// \brief Quote only if the string contains characters the shell would
/// interpret. Plain words are returned unchanged.
[[nodiscard]] static inline auto QuoteForShellIfNeeded(
    std::string const& input) -> std::string {
    auto is_plain = [](char c) {
        return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or
               (c >= '0' and c <= '9') or c == '/' or c == '.' or c == '_' or
               c == '-' or c == '=' or c == ':' or c == '@' or c == '+' or
               c == ',';
    };
    if (not input.empty() and std::all_of(input.begin(), input.end(), is_plain)) {
        return input;
    }
    return QuoteForShell(input);
}

#endif  // INCLUDED_SRC_UTILS_CPP_SHELL_QUOTING_HPP
