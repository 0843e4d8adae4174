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

#ifndef INCLUDED_SRC_TEST_UTILS_LOGGING_LOG_CAPTURE_HPP
#define INCLUDED_SRC_TEST_UTILS_LOGGING_LOG_CAPTURE_HPP

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "src/contentgit/logging/log_config.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/log_sink.hpp"
#include "src/contentgit/logging/logger.hpp"
#include "test/utils/logging/log_config.hpp"

/// \brief Messages emitted to any LogSinkCapture instance.
class CapturedLogs {
  public:
    struct Entry {
        std::string logger;
        LogLevel level;
        std::string message;
    };

    static void Add(Entry entry) noexcept {
        std::lock_guard lock{Data().mutex};
        Data().entries.emplace_back(std::move(entry));
    }

    [[nodiscard]] static auto All() noexcept -> std::vector<Entry> {
        std::lock_guard lock{Data().mutex};
        return Data().entries;
    }

    [[nodiscard]] static auto Count(LogLevel level) noexcept -> std::size_t {
        std::lock_guard lock{Data().mutex};
        return static_cast<std::size_t>(std::count_if(
            Data().entries.begin(),
            Data().entries.end(),
            [level](auto const& entry) { return entry.level == level; }));
    }

    /// \brief Whether any captured message contains the given text.
    [[nodiscard]] static auto Contains(std::string const& text) noexcept
        -> bool {
        std::lock_guard lock{Data().mutex};
        return std::any_of(Data().entries.begin(),
                           Data().entries.end(),
                           [&text](auto const& entry) {
                               return entry.message.find(text) !=
                                      std::string::npos;
                           });
    }

    static void Clear() noexcept {
        std::lock_guard lock{Data().mutex};
        Data().entries.clear();
    }

  private:
    struct Store {
        std::mutex mutex;
        std::vector<Entry> entries;
    };

    [[nodiscard]] static auto Data() noexcept -> Store& {
        static Store instance{};
        return instance;
    }
};

class LogSinkCapture final : public ILogSink {
  public:
    static auto CreateFactory() -> LogSinkFactory {
        return [] { return std::make_shared<LogSinkCapture>(); };
    }

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        CapturedLogs::Add({.logger = logger != nullptr ? logger->Name() : "",
                           .level = level,
                           .message = msg});
    }
};

/// \brief Route all logging into CapturedLogs for the lifetime of the
/// fixture. Named loggers pick up their sinks on construction, so objects
/// under test have to be created after the fixture.
class LogCaptureFixture {
  public:
    LogCaptureFixture() {
        CapturedLogs::Clear();
        LogConfig::SetLogLimit(LogLevel::Trace);
        LogConfig::SetSinks({LogSinkCapture::CreateFactory()});
    }
    ~LogCaptureFixture() noexcept { ConfigureLogging(); }
    LogCaptureFixture(LogCaptureFixture const&) = delete;
    LogCaptureFixture(LogCaptureFixture&&) = delete;
    auto operator=(LogCaptureFixture const&) -> LogCaptureFixture& = delete;
    auto operator=(LogCaptureFixture&&) -> LogCaptureFixture& = delete;
};

#endif  // INCLUDED_SRC_TEST_UTILS_LOGGING_LOG_CAPTURE_HPP
