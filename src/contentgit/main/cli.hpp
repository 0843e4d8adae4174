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

#ifndef INCLUDED_SRC_CONTENTGIT_MAIN_CLI_HPP
#define INCLUDED_SRC_CONTENTGIT_MAIN_CLI_HPP

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "CLI/CLI.hpp"
#include "fmt/core.h"
#include "gsl/gsl"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/repository/git_ops_types.hpp"

constexpr auto kDefaultGitPath = "git";

struct CommonArguments {
    std::optional<std::filesystem::path> repository_root{std::nullopt};
    std::optional<std::filesystem::path> content_dir{std::nullopt};
    std::optional<std::filesystem::path> rc_path{std::nullopt};
    std::optional<std::string> git_path{std::nullopt};
    std::optional<std::filesystem::path> tmp_root{std::nullopt};
    std::optional<std::chrono::milliseconds> network_timeout{std::nullopt};
    std::optional<CommitterIdentity> committer{std::nullopt};
    bool norc{false};
};

struct LogArguments {
    std::vector<std::filesystem::path> log_files;
    std::optional<LogLevel> log_limit;
    bool plain_log{false};
    bool log_append{false};
};

struct CommitArguments {
    std::string message;
    std::optional<std::string> author_name{std::nullopt};
    std::optional<std::string> author_email{std::nullopt};
    bool push{false};
    std::vector<std::filesystem::path> files;
};

struct ResetArguments {
    bool all{false};
    std::vector<std::filesystem::path> files;
};

struct ShowArguments {
    std::filesystem::path path;
};

struct SetOriginArguments {
    std::string remote;
};

enum class SubCommand : std::uint8_t {
    kUnknown,
    kVersion,
    kCommit,
    kPush,
    kReset,
    kShow,
    kOrigin,
    kSetOrigin,
    kProvisionKey
};

struct CommandLineArguments {
    SubCommand cmd{SubCommand::kUnknown};
    CommonArguments common;
    LogArguments log;
    CommitArguments commit;
    ResetArguments reset;
    ShowArguments show;
    SetOriginArguments set_origin;
};

/// \brief Convert a timeout given in (possibly fractional) seconds.
[[nodiscard]] static inline auto SecondsToTimeout(double seconds)
    -> std::optional<std::chrono::milliseconds> {
    if (not(seconds > 0)) {
        return std::nullopt;
    }
    constexpr double kMillisPerSecond = 1000.0;
    return std::chrono::milliseconds{
        std::llround(seconds * kMillisPerSecond)};
}

static inline void SetupCommonArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommonArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "-C,--repository-root",
           [clargs](auto const& root_raw) {
               clargs->repository_root = std::filesystem::weakly_canonical(
                   std::filesystem::absolute(root_raw));
           },
           "Root of the working copy to operate on (Default: current "
           "directory).")
        ->type_name("PATH");
    app->add_option("--content-dir",
                    clargs->content_dir,
                    "Subdirectory of the repository root holding the content; "
                    "file arguments are relative to it.")
        ->type_name("PATH");
    app->add_option_function<std::string>(
           "--rc",
           [clargs](auto const& rc_path_raw) {
               clargs->rc_path = std::filesystem::weakly_canonical(
                   std::filesystem::absolute(rc_path_raw));
           },
           "Use contentgit rc file from custom path.")
        ->type_name("RCFILE");
    app->add_flag("--norc", clargs->norc, "Do not use any rc file.");
    app->add_option("--git",
                    clargs->git_path,
                    fmt::format("Path to the git binary. (Default: {})",
                                kDefaultGitPath))
        ->type_name("PATH");
    app->add_option_function<double>(
           "--network-timeout",
           [clargs](auto const& seconds) {
               clargs->network_timeout = SecondsToTimeout(seconds);
           },
           "Time limit in seconds for operations contacting a remote. A "
           "non-positive value disables the limit (Default: no limit).")
        ->type_name("NUM");
    app->add_option_function<std::string>(
           "--tmp-root",
           [clargs](auto const& tmp_root_raw) {
               clargs->tmp_root = std::filesystem::weakly_canonical(
                   std::filesystem::absolute(tmp_root_raw));
           },
           "Directory for capturing the output of git invocations.")
        ->type_name("PATH");
}

static inline void SetupLogArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<LogArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "-f,--log-file",
           [clargs](auto const& log_file_) {
               clargs->log_files.emplace_back(log_file_);
           },
           "Path to local log file.")
        ->type_name("PATH")
        ->trigger_on_parse();  // run callback on all instances while parsing,
                               // not after all parsing is done
    app->add_option_function<std::underlying_type_t<LogLevel>>(
           "--log-limit",
           [clargs](auto const& limit) {
               clargs->log_limit = ToLogLevel(limit);
           },
           fmt::format("Log limit (higher is more verbose) in interval [{},{}] "
                       "(Default: {}).",
                       static_cast<int>(kFirstLogLevel),
                       static_cast<int>(kLastLogLevel),
                       static_cast<int>(kDefaultLogLevel)))
        ->type_name("NUM");
    app->add_flag("--plain-log",
                  clargs->plain_log,
                  "Do not use ANSI escape sequences to highlight messages.");
    app->add_flag(
        "--log-append",
        clargs->log_append,
        "Append messages to log file instead of overwriting existing.");
}

static inline void SetupCommitArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommitArguments*> const& clargs) {
    app->add_option("-m,--message", clargs->message, "Commit message.")
        ->type_name("MSG")
        ->required();
    app->add_option("--author-name",
                    clargs->author_name,
                    "Author name; only used together with --author-email.")
        ->type_name("NAME");
    app->add_option(
           "--author-email", clargs->author_email, "Override commit author.")
        ->type_name("EMAIL");
    app->add_flag("--push",
                  clargs->push,
                  "Push the current branch to origin and track it upstream.");
    app->add_option("files", clargs->files, "Files to commit.")
        ->type_name("FILE")
        ->required();
}

static inline void SetupResetArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<ResetArguments*> const& clargs) {
    app->add_flag("--all",
                  clargs->all,
                  "Reset all given files, not only the first one.");
    app->add_option("files", clargs->files, "Files to reset.")
        ->type_name("FILE")
        ->required();
}

static inline void SetupShowArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<ShowArguments*> const& clargs) {
    app->add_option("path", clargs->path, "File to print.")
        ->type_name("FILE")
        ->required();
}

static inline void SetupSetOriginArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<SetOriginArguments*> const& clargs) {
    app->add_option("remote", clargs->remote, "Remote URL of the content.")
        ->type_name("URL")
        ->required();
}

#endif  // INCLUDED_SRC_CONTENTGIT_MAIN_CLI_HPP
