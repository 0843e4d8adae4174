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

#include "src/contentgit/main/rc.hpp"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <optional>
#include <utility>  // std::move

#include "fmt/core.h"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"
#include "src/contentgit/main/exit_codes.hpp"

namespace {

[[nodiscard]] auto ReadPath(nlohmann::json const& rc,
                            std::string const& key,
                            std::filesystem::path const& rc_dir)
    -> expected<std::optional<std::filesystem::path>, std::string> {
    auto it = rc.find(key);
    if (it == rc.end() or it->is_null()) {
        return std::optional<std::filesystem::path>{};
    }
    if (not it->is_string()) {
        return unexpected{fmt::format(
            "Configuration-file provided \"{}\" has to be a string, but found "
            "{}",
            key,
            it->dump())};
    }
    std::filesystem::path path{it->get<std::string>()};
    if (path.is_relative()) {
        path = rc_dir / path;
    }
    return std::optional{std::filesystem::weakly_canonical(path)};
}

[[nodiscard]] auto ReadString(nlohmann::json const& rc, std::string const& key)
    -> expected<std::optional<std::string>, std::string> {
    auto it = rc.find(key);
    if (it == rc.end() or it->is_null()) {
        return std::optional<std::string>{};
    }
    if (not it->is_string()) {
        return unexpected{fmt::format(
            "Configuration-file provided \"{}\" has to be a string, but found "
            "{}",
            key,
            it->dump())};
    }
    return std::optional{it->get<std::string>()};
}

[[nodiscard]] auto ReadCommitter(nlohmann::json const& committer)
    -> expected<CommitterIdentity, std::string> {
    if (not committer.is_object()) {
        return unexpected{fmt::format(
            "Configuration-file provided \"committer\" has to be a map, but "
            "found {}",
            committer.dump())};
    }
    CommitterIdentity identity{};
    auto name = ReadString(committer, "name");
    if (not name) {
        return unexpected{name.error()};
    }
    if (*name) {
        identity.name = **name;
    }
    auto email = ReadString(committer, "email");
    if (not email) {
        return unexpected{email.error()};
    }
    if (*email) {
        identity.email = **email;
    }
    return identity;
}

}  // namespace

auto DefaultRCPath() -> std::filesystem::path {
    return FileSystemManager::GetUserHome() / ".contentgit.rc";
}

auto ApplyRCConfig(nlohmann::json const& rc,
                   std::filesystem::path const& rc_dir,
                   gsl::not_null<CommandLineArguments*> const& clargs)
    -> expected<std::monostate, std::string> {
    if (not rc.is_object()) {
        return unexpected{
            fmt::format("expected an object but found:\n{}", rc.dump())};
    }
    try {
        // read repository root; overwritten if user provided it already
        if (not clargs->common.repository_root) {
            auto root = ReadPath(rc, "repository root", rc_dir);
            if (not root) {
                return unexpected{root.error()};
            }
            clargs->common.repository_root = *root;
        }
        // the content directory stays relative to the repository root
        if (not clargs->common.content_dir) {
            auto content_dir = ReadString(rc, "content directory");
            if (not content_dir) {
                return unexpected{content_dir.error()};
            }
            if (*content_dir) {
                clargs->common.content_dir = **content_dir;
            }
        }
        // a git binary is looked up in PATH unless given as a path
        if (not clargs->common.git_path) {
            auto git = ReadString(rc, "git");
            if (not git) {
                return unexpected{git.error()};
            }
            if (*git) {
                auto git_path = std::filesystem::path{**git};
                if (git_path.has_parent_path() and git_path.is_relative()) {
                    git_path = rc_dir / git_path;
                }
                clargs->common.git_path = git_path.string();
            }
        }
        if (not clargs->common.tmp_root) {
            auto tmp_root = ReadPath(rc, "tmp root", rc_dir);
            if (not tmp_root) {
                return unexpected{tmp_root.error()};
            }
            clargs->common.tmp_root = *tmp_root;
        }
        if (not clargs->common.network_timeout) {
            auto it = rc.find("network timeout");
            if (it != rc.end() and not it->is_null()) {
                if (not it->is_number()) {
                    return unexpected{fmt::format(
                        "Configuration-file provided \"network timeout\" has "
                        "to be a number, but found {}",
                        it->dump())};
                }
                clargs->common.network_timeout =
                    SecondsToTimeout(it->get<double>());
            }
        }
        if (auto it = rc.find("committer"); it != rc.end()) {
            auto committer = ReadCommitter(*it);
            if (not committer) {
                return unexpected{committer.error()};
            }
            clargs->common.committer = *std::move(committer);
        }
        // read log limit; overwritten if user provided it already
        if (not clargs->log.log_limit) {
            auto it = rc.find("log limit");
            if (it != rc.end() and not it->is_null()) {
                if (not it->is_number_integer()) {
                    return unexpected{fmt::format(
                        "Configuration-file specified log-limit has to be an "
                        "integer, but found {}",
                        it->dump())};
                }
                clargs->log.log_limit = ToLogLevel(it->get<int>());
            }
        }
        // read log files; user can append, but does not overwrite
        if (auto it = rc.find("log files"); it != rc.end()) {
            if (not it->is_array()) {
                return unexpected{fmt::format(
                    "Configuration-provided log files have to be a list of "
                    "strings, but found {}",
                    it->dump())};
            }
            for (auto const& entry : *it) {
                if (not entry.is_string()) {
                    return unexpected{fmt::format(
                        "Configuration-provided log files have to be a list "
                        "of strings, but found entry {}",
                        entry.dump())};
                }
                std::filesystem::path log_file{entry.get<std::string>()};
                if (log_file.is_relative()) {
                    log_file = rc_dir / log_file;
                }
                clargs->log.log_files.emplace_back(std::move(log_file));
            }
        }
        if (auto it = rc.find("plain log"); it != rc.end()) {
            if (not it->is_boolean()) {
                return unexpected{fmt::format(
                    "Configuration-file provided \"plain log\" has to be a "
                    "boolean, but found {}",
                    it->dump())};
            }
            clargs->log.plain_log = clargs->log.plain_log or it->get<bool>();
        }
    } catch (std::exception const& ex) {
        return unexpected{std::string{ex.what()}};
    }
    return std::monostate{};
}

void ReadContentGitRC(gsl::not_null<CommandLineArguments*> const& clargs) {
    if (clargs->common.norc) {
        return;
    }
    auto rc_path = clargs->common.rc_path;
    // set default if rcpath not given
    if (not rc_path) {
        rc_path = DefaultRCPath();
        if (not FileSystemManager::IsFile(*rc_path)) {
            return;
        }
    }
    else if (not FileSystemManager::IsFile(*rc_path)) {
        Logger::Log(
            LogLevel::Error, "Cannot read RC file {}.", rc_path->string());
        std::exit(kExitConfigError);
    }
    nlohmann::json rc{};
    // json::parse may throw
    try {
        std::ifstream fs(*rc_path);
        rc = nlohmann::json::parse(fs);
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "Parsing RC file {} as JSON failed with error:\n{}",
                    rc_path->string(),
                    e.what());
        std::exit(kExitConfigError);
    }
    auto applied = ApplyRCConfig(
        rc,
        std::filesystem::absolute(*rc_path).parent_path(),
        clargs);
    if (not applied) {
        Logger::Log(LogLevel::Error,
                    "In RC file {}: {}",
                    rc_path->string(),
                    applied.error());
        std::exit(kExitConfigError);
    }
}
