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

#include "src/contentgit/logging/log_sink_file.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_all.hpp"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_config.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/log_sink_cmdline.hpp"
#include "src/contentgit/logging/logger.hpp"

namespace {

[[nodiscard]] auto GetLines(std::filesystem::path const& file_path)
    -> std::vector<std::string> {
    std::ifstream file(file_path);
    std::string line{};
    std::vector<std::string> lines{};
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

[[nodiscard]] auto LogDir() -> std::filesystem::path {
    auto* tmp_dir = std::getenv("TEST_TMPDIR");
    REQUIRE(tmp_dir != nullptr);
    return std::filesystem::path{tmp_dir} / "logs";
}

}  // namespace

TEST_CASE("LogSinkFile", "[logging]") {
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory(false /*no color*/)});

    SECTION("Overwrite mode") {
        auto const filename = LogDir() / "overwrite.log";
        REQUIRE(FileSystemManager::WriteFile("somecontent\n", filename));

        LogSinkFile sink{filename, LogSinkFile::Mode::Overwrite};
        sink.Emit(nullptr, LogLevel::Info, "first");
        sink.Emit(nullptr, LogLevel::Info, "second");
        sink.Emit(nullptr, LogLevel::Info, "third");

        auto lines = GetLines(filename);
        REQUIRE(lines.size() == 3);
        CHECK_THAT(lines[0], Catch::Matchers::EndsWith("INFO: first"));
        CHECK_THAT(lines[2], Catch::Matchers::EndsWith("INFO: third"));
    }

    SECTION("Append mode") {
        auto const filename = LogDir() / "append.log";
        REQUIRE(FileSystemManager::WriteFile("somecontent\n", filename));

        LogSinkFile sink{filename, LogSinkFile::Mode::Append};
        sink.Emit(nullptr, LogLevel::Info, "first");
        sink.Emit(nullptr, LogLevel::Info, "second");
        sink.Emit(nullptr, LogLevel::Info, "third");

        CHECK(GetLines(filename).size() == 4);
    }

    SECTION("Multi-line messages and logger names") {
        auto const filename = LogDir() / "multiline.log";
        REQUIRE(FileSystemManager::CreateDirectory(LogDir()));
        REQUIRE(FileSystemManager::RemoveFile(filename));

        LogConfig::AddSink(LogSinkFile::CreateFactory(filename));
        Logger logger{"SessionFactory"};
        logger.Emit(LogLevel::Warning, "line one\nline two");

        auto lines = GetLines(filename);
        REQUIRE(lines.size() == 2);
        CHECK_THAT(lines[0],
                   Catch::Matchers::EndsWith(
                       "WARN (SessionFactory): line one"));
        CHECK(lines[1] == "   line two");
    }

    SECTION("Thread-safety") {
        auto const filename = LogDir() / "threads.log";
        REQUIRE(FileSystemManager::WriteFile("somecontent\n", filename));

        int const num_threads = 20;
        LogSinkFile sink{filename, LogSinkFile::Mode::Append};

        // start threads, each emitting a log message
        std::vector<std::thread> threads{};
        threads.reserve(num_threads);
        for (int id{}; id < num_threads; ++id) {
            threads.emplace_back(
                [&](int tid) {
                    sink.Emit(nullptr,
                              LogLevel::Info,
                              "this is thread " + std::to_string(tid));
                },
                id);
        }

        // wait for threads to finish
        for (auto& thread : threads) {
            thread.join();
        }

        // read file and check line numbers
        auto lines = GetLines(filename);
        CHECK(lines.size() == num_threads + 1);

        // check for corrupted content
        for (auto const& line : lines) {
            CHECK_THAT(
                line,
                Catch::Matchers::ContainsSubstring("somecontent") ||
                    Catch::Matchers::ContainsSubstring("this is thread"));
        }
    }
}
