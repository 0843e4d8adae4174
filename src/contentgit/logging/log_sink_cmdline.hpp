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

#ifndef INCLUDED_SRC_CONTENTGIT_LOGGING_LOG_SINK_CMDLINE_HPP
#define INCLUDED_SRC_CONTENTGIT_LOGGING_LOG_SINK_CMDLINE_HPP

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "fmt/color.h"
#include "fmt/core.h"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/log_sink.hpp"
#include "src/contentgit/logging/logger.hpp"

/// \brief Sink writing to stderr, one prefixed line per message line.
class LogSinkCmdLine final : public ILogSink {
  public:
    static auto CreateFactory(bool colored = true) -> LogSinkFactory {
        return [=]() { return std::make_shared<LogSinkCmdLine>(colored); };
    }

    explicit LogSinkCmdLine(bool colored) noexcept : colored_{colored} {}
    ~LogSinkCmdLine() noexcept final = default;
    LogSinkCmdLine(LogSinkCmdLine const&) noexcept = delete;
    LogSinkCmdLine(LogSinkCmdLine&&) noexcept = delete;
    auto operator=(LogSinkCmdLine const&) noexcept -> LogSinkCmdLine& = delete;
    auto operator=(LogSinkCmdLine&&) noexcept -> LogSinkCmdLine& = delete;

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        static std::mutex mutex{};

        auto prefix = LogLevelToString(level);
        if (logger != nullptr) {
            prefix = fmt::format("{} ({})", prefix, logger->Name());
        }
        prefix = prefix + ":";
        auto cont_prefix = std::string(prefix.size(), ' ');
        prefix = FormatPrefix(level, prefix);

        {
            std::lock_guard lock{mutex};
            using it = std::istream_iterator<ILogSink::Line>;
            std::istringstream iss{msg};
            std::for_each(it{iss}, it{}, [&](auto const& line) {
                fmt::print(stderr, "{} {}\n", prefix, line);
                prefix = cont_prefix;
            });
            std::fflush(stderr);
        }
    }

  private:
    bool colored_{};

    [[nodiscard]] auto FormatPrefix(LogLevel level, std::string const& prefix)
        const noexcept -> std::string {
        fmt::text_style style{};
        if (colored_) {
            switch (level) {
                case LogLevel::Error:
                    style = fg(fmt::color::red);
                    break;
                case LogLevel::Warning:
                    style = fg(fmt::color::orange);
                    break;
                case LogLevel::Info:
                    style = fg(fmt::color::lime_green);
                    break;
                case LogLevel::Debug:
                    style = fg(fmt::color::sky_blue);
                    break;
                case LogLevel::Trace:
                    style = fg(fmt::color::deep_sky_blue);
                    break;
            }
        }
        try {
            return fmt::format(style, "{}", prefix);
        } catch (...) {
            return prefix;
        }
    }
};

#endif  // INCLUDED_SRC_CONTENTGIT_LOGGING_LOG_SINK_CMDLINE_HPP
