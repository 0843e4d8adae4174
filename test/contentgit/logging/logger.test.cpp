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

#include "src/contentgit/logging/logger.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/contentgit/logging/log_config.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/log_sink.hpp"

// Stores prints from test sink instances
class TestPrints {
    struct PrintData {
        std::atomic<int> counter{};
        std::unordered_map<int, std::vector<std::string>> prints{};
    };

  public:
    static void Print(int sink_id, std::string const& print) noexcept {
        Data().prints[sink_id].push_back(print);
    }
    [[nodiscard]] static auto Read(int sink_id) noexcept
        -> std::vector<std::string> {
        return Data().prints[sink_id];
    }

    static void Clear() noexcept {
        Data().prints.clear();
        Data().counter = 0;
    }

    static auto GetId() noexcept -> int { return Data().counter++; }

  private:
    [[nodiscard]] static auto Data() noexcept -> PrintData& {
        static PrintData instance{};
        return instance;
    }
};

// Test sink, prints to TestPrints depending on its own instance id.
class LogSinkTest : public ILogSink {
  public:
    static auto CreateFactory() -> LogSinkFactory {
        return [] { return std::make_shared<LogSinkTest>(); };
    }

    LogSinkTest() noexcept { id_ = TestPrints::GetId(); }

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        auto prefix = LogLevelToString(level);

        if (logger != nullptr) {
            prefix += " (" + logger->Name() + ")";
        }

        TestPrints::Print(id_, prefix + ": " + msg);
    }

  private:
    int id_{};
};

class OneGlobalSinkFixture {
  public:
    OneGlobalSinkFixture() {
        TestPrints::Clear();
        LogConfig::SetLogLimit(LogLevel::Info);
        LogConfig::SetSinks({LogSinkTest::CreateFactory()});
    }
};

class TwoGlobalSinksFixture : public OneGlobalSinkFixture {
  public:
    TwoGlobalSinksFixture() {
        LogConfig::AddSink(LogSinkTest::CreateFactory());
    }
};

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Global static logger with one sink",
                 "[logger]") {
    // logs should be forwarded to sink instance: 0
    int instance = 0;

    // create log outside of log limit
    Logger::Log(LogLevel::Trace, "first");
    CHECK(TestPrints::Read(instance).empty());

    SECTION("create log within log limit") {
        Logger::Log(LogLevel::Info, "second {}", 2);
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] == "INFO: second 2");

        SECTION("increase log limit and log via lambda function") {
            LogConfig::SetLogLimit(LogLevel::Trace);
            Logger::Log(LogLevel::Trace, [] { return std::string{"third"}; });
            auto prints = TestPrints::Read(instance);
            REQUIRE(prints.size() == 2);
            CHECK(prints[1] == "TRACE: third");
        }
    }
}

TEST_CASE_METHOD(TwoGlobalSinksFixture,
                 "Local named logger using two global sinks",
                 "[logger]") {
    // create logger with sink instances from global LogConfig
    Logger logger("ContentRepository");

    // logs should be forwarded to same sink instances: 0 and 1
    int instance1 = 0;
    int instance2 = 1;

    logger.Emit(LogLevel::Debug, "first");
    CHECK(TestPrints::Read(instance1).empty());
    CHECK(TestPrints::Read(instance2).empty());

    logger.Emit(LogLevel::Warning, "No origin remote on the given repo");
    auto prints1 = TestPrints::Read(instance1);
    auto prints2 = TestPrints::Read(instance2);
    REQUIRE(prints1.size() == 1);
    REQUIRE(prints2.size() == 1);
    CHECK(prints1[0] ==
          "WARN (ContentRepository): No origin remote on the given repo");
    CHECK(prints2[0] == prints1[0]);

    SECTION("local log limit is independent of the global one") {
        logger.SetLogLimit(LogLevel::Trace);
        logger.Emit(LogLevel::Trace, "second");
        Logger::Log(LogLevel::Trace, "not shown");
        auto prints = TestPrints::Read(instance1);
        REQUIRE(prints.size() == 2);
        CHECK(prints[1] == "TRACE (ContentRepository): second");
    }
}

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Local named logger with its own sink instance",
                 "[logger]") {
    // create logger with separate sink instance
    Logger logger("OwnSinkLogger", {LogSinkTest::CreateFactory()});

    // logs should be forwarded to new sink instance: 1
    int instance = 1;

    logger.Emit(LogLevel::Error, "failed with {}", "reason");
    CHECK(TestPrints::Read(0).empty());
    auto prints = TestPrints::Read(instance);
    REQUIRE(prints.size() == 1);
    CHECK(prints[0] == "ERROR (OwnSinkLogger): failed with reason");
}

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Malformed format string is reported, not thrown",
                 "[logger]") {
    Logger::Log(LogLevel::Error, "value {:d}", std::string{"text"});
    auto prints = TestPrints::Read(0);
    REQUIRE(prints.size() == 1);
    CHECK(prints[0].find("log format error") != std::string::npos);
}

TEST_CASE("Log level names round trip", "[logger]") {
    for (auto level : {LogLevel::Error,
                       LogLevel::Warning,
                       LogLevel::Info,
                       LogLevel::Debug,
                       LogLevel::Trace}) {
        auto parsed = LogLevelFromString(LogLevelToString(level));
        REQUIRE(parsed);
        CHECK(*parsed == level);
    }
    CHECK_FALSE(LogLevelFromString("VERBOSE"));
    CHECK(ToLogLevel(42) == kLastLogLevel);
}
