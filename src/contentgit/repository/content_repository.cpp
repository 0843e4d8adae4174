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

#include "src/contentgit/repository/content_repository.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "fmt/core.h"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/remote/git_url.hpp"
#include "src/contentgit/repository/ssh_credential.hpp"

auto ContentRepository::ToRootRelative(
    std::vector<std::filesystem::path> const& files) const
    -> expected<std::vector<std::filesystem::path>, std::string> {
    std::vector<std::filesystem::path> rel_files{};
    rel_files.reserve(files.size());
    for (auto const& file : files) {
        auto rel = layout_.ToRootRelative(file);
        if (not rel) {
            return unexpected{std::move(rel).error()};
        }
        rel_files.emplace_back(*std::move(rel));
    }
    return rel_files;
}

auto ContentRepository::Commit(CommitRequest const& request) const noexcept
    -> expected<CommitResult, std::string> {
    try {
        if (request.files.empty()) {
            return unexpected<std::string>{"no files given to commit"};
        }
        auto files = ToRootRelative(request.files);
        if (not files) {
            return unexpected{std::move(files).error()};
        }

        auto const session = factory_->Open(layout_);
        auto branch = session.CurrentBranch();
        if (not branch) {
            return unexpected{fmt::format(
                "determining current branch failed:\n{}", branch.error())};
        }
        if (auto added = session.Add(*files); not added) {
            return unexpected{std::move(added).error()};
        }
        auto summary =
            session.Commit(request.message, *files, request.AuthorOverride());
        if (not summary) {
            return unexpected{std::move(summary).error()};
        }
        logger_.Emit(LogLevel::Debug,
                     "Committed {} file(s) on branch {}",
                     files->size(),
                     *branch);

        auto result = CommitResult{.branch = *branch,
                                   .summary = *std::move(summary),
                                   .pushed = false};
        if (request.push) {
            auto pushed = session.PushUpstream(result.branch);
            if (not pushed) {
                return unexpected{std::move(pushed).error()};
            }
            result.pushed = true;
        }
        return result;
    } catch (std::exception const& ex) {
        return unexpected{fmt::format("commit failed with:\n{}", ex.what())};
    }
}

auto ContentRepository::Push() const noexcept
    -> expected<std::string, std::string> {
    try {
        return factory_->Open(layout_).Push();
    } catch (std::exception const& ex) {
        return unexpected{fmt::format("push failed with:\n{}", ex.what())};
    }
}

auto ContentRepository::ResetFile(
    std::vector<std::filesystem::path> const& files) const noexcept
    -> expected<std::monostate, std::string> {
    try {
        if (files.empty()) {
            return unexpected<std::string>{"no file given to reset"};
        }
        if (files.size() > 1) {
            logger_.Emit(LogLevel::Debug,
                         "Resetting only {}, ignoring {} further file(s)",
                         files.front().string(),
                         files.size() - 1);
        }
        return ResetFiles({files.front()});
    } catch (std::exception const& ex) {
        return unexpected{fmt::format("reset failed with:\n{}", ex.what())};
    }
}

auto ContentRepository::ResetFiles(
    std::vector<std::filesystem::path> const& files) const noexcept
    -> expected<std::monostate, std::string> {
    try {
        if (files.empty()) {
            return unexpected<std::string>{"no file given to reset"};
        }
        auto rel_files = ToRootRelative(files);
        if (not rel_files) {
            return unexpected{std::move(rel_files).error()};
        }
        return factory_->Open(layout_).Checkout(*rel_files);
    } catch (std::exception const& ex) {
        return unexpected{fmt::format("reset failed with:\n{}", ex.what())};
    }
}

auto ContentRepository::ReadFileAtHead(std::filesystem::path const& file)
    const noexcept -> expected<std::string, std::string> {
    try {
        auto rel = layout_.ToRootRelative(file);
        if (not rel) {
            return unexpected{std::move(rel).error()};
        }
        if (auto content = factory_->Open(layout_).ShowAtHead(*rel)) {
            return *std::move(content);
        }
        logger_.Emit(LogLevel::Debug,
                     "{} not found at HEAD, reading working copy",
                     file.string());
        if (auto content = FileSystemManager::ReadFile(layout_.Root() / *rel)) {
            return *std::move(content);
        }
        return unexpected{fmt::format("could not read file {}",
                                      (layout_.Root() / *rel).string())};
    } catch (std::exception const& ex) {
        return unexpected{fmt::format(
            "reading {} failed with:\n{}", file.string(), ex.what())};
    }
}

auto ContentRepository::GetOrigin() const noexcept
    -> expected<std::optional<std::string>, std::string> {
    try {
        auto remotes = factory_->Open(layout_).ListRemotes();
        if (not remotes) {
            return unexpected{std::move(remotes).error()};
        }
        auto it = std::find_if(
            remotes->begin(), remotes->end(), [](auto const& remote) {
                return remote.name == kOriginRemote;
            });
        if (it == remotes->end()) {
            logger_.Emit(LogLevel::Warning,
                         "No origin remote on the given repo");
            return std::optional<std::string>{};
        }
        return std::optional<std::string>{it->push_url};
    } catch (std::exception const& ex) {
        return unexpected{
            fmt::format("reading origin failed with:\n{}", ex.what())};
    }
}

auto ContentRepository::UpdateOrigin(std::string const& remote) const noexcept
    -> expected<std::string, std::string> {
    try {
        auto url = NormalizeToSshUrl(remote);
        if (not url) {
            return unexpected{std::move(url).error()};
        }
        auto const session = factory_->Open(layout_);
        auto remotes = session.ListRemotes();
        if (not remotes) {
            return unexpected{std::move(remotes).error()};
        }
        auto const has_origin = std::any_of(
            remotes->begin(), remotes->end(), [](auto const& entry) {
                return entry.name == kOriginRemote;
            });
        if (has_origin) {
            logger_.Emit(
                LogLevel::Warning, "Changing remote origin to {}", *url);
            if (auto removed = session.RemoveRemote(kOriginRemote);
                not removed) {
                return unexpected{std::move(removed).error()};
            }
        }
        if (auto added = session.AddRemote(kOriginRemote, *url); not added) {
            return unexpected{std::move(added).error()};
        }
        return *std::move(url);
    } catch (std::exception const& ex) {
        return unexpected{
            fmt::format("updating origin failed with:\n{}", ex.what())};
    }
}

auto ContentRepository::ProvisionSshKey(std::string const& base64_key)
    const noexcept -> expected<std::monostate, std::string> {
    try {
        auto credential = SshCredential::FromBase64(base64_key);
        if (not credential) {
            return unexpected{std::move(credential).error()};
        }
        auto const key_path = layout_.SshKeyPath();
        if (not credential->Materialize(key_path)) {
            return unexpected{fmt::format("writing SSH key to {} failed",
                                          key_path.string())};
        }
        logger_.Emit(LogLevel::Info, "Provisioned SSH key");
        return std::monostate{};
    } catch (std::exception const& ex) {
        return unexpected{
            fmt::format("provisioning SSH key failed with:\n{}", ex.what())};
    }
}
