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

#ifndef INCLUDED_SRC_CONTENTGIT_FILE_SYSTEM_GIT_REPO_HPP
#define INCLUDED_SRC_CONTENTGIT_FILE_SYSTEM_GIT_REPO_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

extern "C" {
struct git_repository;
}

/// \brief Read-only access to a local working copy through libgit2.
/// Every instance owns its own libgit2 repository handle; instances are
/// cheap and meant to be opened per query.
class GitRepo {
  public:
    /// \brief A configured remote as stored in the repository config.
    struct RemoteEntry {
        std::string name;
        std::string url;
        /// \brief The push URL; equal to url if no pushurl is configured.
        std::string push_url;
    };

    // Callback receiving failure messages; the flag tells whether the failure
    // is fatal for the calling operation.
    using anon_logger_t = std::function<void(std::string const&, bool)>;
    using anon_logger_ptr = std::shared_ptr<anon_logger_t>;

    GitRepo() = delete;  // no default ctor
    ~GitRepo() noexcept = default;

    // allow only move, no copy
    GitRepo(GitRepo const&) = delete;
    GitRepo(GitRepo&&) noexcept = default;
    auto operator=(GitRepo const&) = delete;
    auto operator=(GitRepo&& other) noexcept -> GitRepo& = default;

    /// \brief Factory to open an existing repository at given location.
    /// The location must be the working-copy root; no upwards search is done.
    [[nodiscard]] static auto Open(
        std::filesystem::path const& repo_path) noexcept
        -> std::optional<GitRepo>;

    [[nodiscard]] auto GetPath() const& noexcept
        -> std::filesystem::path const& {
        return repo_path_;
    }

    /// \brief Short name of the checked-out branch.
    /// On an unborn branch the name is taken from the symbolic HEAD target.
    /// A detached HEAD yields "HEAD".
    /// \returns nullopt on failure, with the reason passed to logger.
    [[nodiscard]] auto GetCurrentBranch(
        anon_logger_ptr const& logger) const noexcept
        -> std::optional<std::string>;

    /// \brief Read content of a blob at HEAD:<path>.
    /// \param path  Path relative to the working-copy root.
    /// \returns nullopt if HEAD does not exist, the path is not tracked at
    /// HEAD, or it names no blob. The reason is passed to logger as
    /// non-fatal.
    [[nodiscard]] auto ReadBlobAtHead(
        std::filesystem::path const& path,
        anon_logger_ptr const& logger) const noexcept
        -> std::optional<std::string>;

    /// \brief List configured remotes in config order.
    [[nodiscard]] auto GetRemotes(anon_logger_ptr const& logger) const noexcept
        -> std::optional<std::vector<RemoteEntry>>;

  private:
    std::filesystem::path repo_path_;
    std::shared_ptr<git_repository> repo_;

    GitRepo(std::filesystem::path repo_path,
            std::shared_ptr<git_repository> repo) noexcept
        : repo_path_{std::move(repo_path)}, repo_{std::move(repo)} {}
};

#endif  // INCLUDED_SRC_CONTENTGIT_FILE_SYSTEM_GIT_REPO_HPP
