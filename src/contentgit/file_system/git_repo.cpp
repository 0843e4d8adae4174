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

#include "src/contentgit/file_system/git_repo.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/contentgit/file_system/git_context.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"

extern "C" {
#include <git2.h>
}

namespace {

constexpr std::string_view kBranchRefPrefix{"refs/heads/"};

[[nodiscard]] auto GitLastError() noexcept -> std::string {
    git_error const* const err = git_error_last();
    if (err != nullptr and err->message != nullptr) {
        return fmt::format("error code {}: {}", err->klass, err->message);
    }
    return "<unknown error>";
}

void repository_closer(gsl::owner<git_repository*> repository) {
    git_repository_free(repository);
}

void object_closer(gsl::owner<git_object*> object) {
    git_object_free(object);
}

void reference_closer(gsl::owner<git_reference*> reference) {
    git_reference_free(reference);
}

void remote_closer(gsl::owner<git_remote*> remote) {
    git_remote_free(remote);
}

/// \brief Strip "refs/heads/" from a full reference name, if present.
[[nodiscard]] auto ToShortBranchName(std::string_view ref_name) noexcept
    -> std::string {
    if (ref_name.starts_with(kBranchRefPrefix)) {
        ref_name.remove_prefix(kBranchRefPrefix.size());
    }
    return std::string{ref_name};
}

}  // namespace

auto GitRepo::Open(std::filesystem::path const& repo_path) noexcept
    -> std::optional<GitRepo> {
    try {
        if (not GitContext::Create()) {  // initialize libgit2
            return std::nullopt;
        }

        git_repository* repo_ptr{nullptr};
        if (git_repository_open_ext(&repo_ptr,
                                    repo_path.c_str(),
                                    GIT_REPOSITORY_OPEN_NO_SEARCH,
                                    nullptr) != 0 or
            repo_ptr == nullptr) {
            Logger::Log(LogLevel::Debug,
                        "Opening git repository {} failed with:\n{}",
                        repo_path.string(),
                        GitLastError());
            git_repository_free(repo_ptr);
            return std::nullopt;
        }
        return GitRepo(repo_path,
                       std::shared_ptr<git_repository>(repo_ptr,
                                                       repository_closer));
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "Opening git repository {} failed with:\n{}",
                    repo_path.string(),
                    ex.what());
        return std::nullopt;
    }
}

auto GitRepo::GetCurrentBranch(anon_logger_ptr const& logger) const noexcept
    -> std::optional<std::string> {
    try {
        git_reference* head_ptr{nullptr};
        auto const res = git_repository_head(&head_ptr, repo_.get());
        auto head = std::unique_ptr<git_reference, decltype(&reference_closer)>(
            head_ptr, reference_closer);
        if (res == 0) {
            if (git_repository_head_detached(repo_.get()) == 1) {
                return std::string{"HEAD"};
            }
            return std::string{git_reference_shorthand(head.get())};
        }
        if (res != GIT_EUNBORNBRANCH and res != GIT_ENOTFOUND) {
            (*logger)(fmt::format("retrieving HEAD of git repository {} "
                                  "failed with:\n{}",
                                  repo_path_.string(),
                                  GitLastError()),
                      /*fatal=*/true);
            return std::nullopt;
        }

        // unborn branch: HEAD is symbolic, but its target does not exist yet
        git_reference* symbolic_ptr{nullptr};
        if (git_reference_lookup(&symbolic_ptr, repo_.get(), "HEAD") != 0) {
            (*logger)(fmt::format("looking up HEAD of git repository {} "
                                  "failed with:\n{}",
                                  repo_path_.string(),
                                  GitLastError()),
                      /*fatal=*/true);
            return std::nullopt;
        }
        auto symbolic =
            std::unique_ptr<git_reference, decltype(&reference_closer)>(
                symbolic_ptr, reference_closer);
        auto const* target = git_reference_symbolic_target(symbolic.get());
        if (target == nullptr) {
            (*logger)(fmt::format("HEAD of git repository {} is neither a "
                                  "branch nor a commit",
                                  repo_path_.string()),
                      /*fatal=*/true);
            return std::nullopt;
        }
        return ToShortBranchName(target);
    } catch (std::exception const& ex) {
        (*logger)(
            fmt::format("get current branch failed with:\n{}", ex.what()),
            /*fatal=*/true);
        return std::nullopt;
    }
}

auto GitRepo::ReadBlobAtHead(std::filesystem::path const& path,
                             anon_logger_ptr const& logger) const noexcept
    -> std::optional<std::string> {
    try {
        auto const spec = fmt::format("HEAD:{}", path.generic_string());
        git_object* obj_ptr{nullptr};
        if (git_revparse_single(&obj_ptr, repo_.get(), spec.c_str()) != 0) {
            (*logger)(fmt::format("resolving {} in git repository {} failed "
                                  "with:\n{}",
                                  spec,
                                  repo_path_.string(),
                                  GitLastError()),
                      /*fatal=*/false);
            git_object_free(obj_ptr);
            return std::nullopt;
        }
        auto obj = std::unique_ptr<git_object, decltype(&object_closer)>(
            obj_ptr, object_closer);
        if (git_object_type(obj.get()) != GIT_OBJECT_BLOB) {
            (*logger)(fmt::format("{} in git repository {} is not a file",
                                  spec,
                                  repo_path_.string()),
                      /*fatal=*/false);
            return std::nullopt;
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        auto const* blob = reinterpret_cast<git_blob const*>(obj.get());
        auto const size = gsl::narrow<std::size_t>(git_blob_rawsize(blob));
        return std::string(static_cast<char const*>(git_blob_rawcontent(blob)),
                           size);
    } catch (std::exception const& ex) {
        (*logger)(fmt::format("reading {} at HEAD failed with:\n{}",
                              path.string(),
                              ex.what()),
                  /*fatal=*/false);
        return std::nullopt;
    }
}

auto GitRepo::GetRemotes(anon_logger_ptr const& logger) const noexcept
    -> std::optional<std::vector<RemoteEntry>> {
    try {
        git_strarray names{};
        if (git_remote_list(&names, repo_.get()) != 0) {
            (*logger)(fmt::format("listing remotes of git repository {} "
                                  "failed with:\n{}",
                                  repo_path_.string(),
                                  GitLastError()),
                      /*fatal=*/true);
            return std::nullopt;
        }
        auto const names_cleanup =
            gsl::finally([&names]() { git_strarray_dispose(&names); });

        std::vector<RemoteEntry> remotes{};
        remotes.reserve(names.count);
        for (std::size_t i = 0; i < names.count; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            char const* name = names.strings[i];
            git_remote* remote_ptr{nullptr};
            if (git_remote_lookup(&remote_ptr, repo_.get(), name) != 0) {
                (*logger)(fmt::format("looking up remote {} of git "
                                      "repository {} failed with:\n{}",
                                      name,
                                      repo_path_.string(),
                                      GitLastError()),
                          /*fatal=*/true);
                return std::nullopt;
            }
            auto remote =
                std::unique_ptr<git_remote, decltype(&remote_closer)>(
                    remote_ptr, remote_closer);
            auto const* url = git_remote_url(remote.get());
            auto const* push_url = git_remote_pushurl(remote.get());
            auto entry = RemoteEntry{.name = name,
                                     .url = url != nullptr ? url : "",
                                     .push_url = {}};
            entry.push_url = push_url != nullptr ? std::string{push_url}
                                                 : entry.url;
            remotes.emplace_back(std::move(entry));
        }
        return remotes;
    } catch (std::exception const& ex) {
        (*logger)(fmt::format("listing remotes failed with:\n{}", ex.what()),
                  /*fatal=*/true);
        return std::nullopt;
    }
}
