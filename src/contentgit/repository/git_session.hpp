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

#ifndef INCLUDED_SRC_CONTENTGIT_REPOSITORY_GIT_SESSION_HPP
#define INCLUDED_SRC_CONTENTGIT_REPOSITORY_GIT_SESSION_HPP

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "gsl/gsl"
#include "src/contentgit/file_system/git_repo.hpp"
#include "src/contentgit/logging/logger.hpp"
#include "src/contentgit/repository/git_ops_types.hpp"
#include "src/contentgit/repository/repository_layout.hpp"
#include "src/contentgit/repository/session_environment.hpp"
#include "src/utils/cpp/expected.hpp"

class SessionFactory;

/// \brief Handle to one working copy with a fixed environment.
/// Mutating and network operations run the git binary with the session
/// environment; read-only queries go through libgit2. Error messages never
/// contain the SSH key path or the SSH command.
class GitSession {
    friend class SessionFactory;

  public:
    [[nodiscard]] auto Layout() const& noexcept -> RepositoryLayout const& {
        return layout_;
    }

    [[nodiscard]] auto Environment() const& noexcept
        -> SessionEnvironment const& {
        return env_;
    }

    /// \brief Short name of the checked-out branch.
    [[nodiscard]] auto CurrentBranch() const noexcept
        -> expected<std::string, std::string>;

    /// \brief Stage the given root-relative paths.
    [[nodiscard]] auto Add(std::vector<std::filesystem::path> const& files)
        const noexcept -> expected<std::monostate, std::string>;

    /// \brief Commit exactly the given root-relative paths.
    /// \returns git's summary of the new commit.
    [[nodiscard]] auto Commit(std::string const& message,
                              std::vector<std::filesystem::path> const& files,
                              std::optional<std::string> const& author)
        const noexcept -> expected<std::string, std::string>;

    /// \brief Push the branch to origin and set it as upstream.
    [[nodiscard]] auto PushUpstream(std::string const& branch) const noexcept
        -> expected<std::string, std::string>;

    /// \brief Push using the configured upstream of the current branch.
    [[nodiscard]] auto Push() const noexcept
        -> expected<std::string, std::string>;

    /// \brief Discard working-copy modifications of the given paths.
    [[nodiscard]] auto Checkout(std::vector<std::filesystem::path> const& files)
        const noexcept -> expected<std::monostate, std::string>;

    /// \brief Content of a root-relative path at HEAD, if it is tracked there.
    [[nodiscard]] auto ShowAtHead(std::filesystem::path const& file)
        const noexcept -> std::optional<std::string>;

    [[nodiscard]] auto ListRemotes() const noexcept
        -> expected<std::vector<GitRepo::RemoteEntry>, std::string>;

    [[nodiscard]] auto RemoveRemote(std::string const& name) const noexcept
        -> expected<std::monostate, std::string>;

    [[nodiscard]] auto AddRemote(std::string const& name,
                                 std::string const& url) const noexcept
        -> expected<std::monostate, std::string>;

  private:
    gsl::not_null<SessionFactory const*> factory_;
    RepositoryLayout layout_;
    SessionEnvironment env_;

    GitSession(gsl::not_null<SessionFactory const*> const& factory,
               RepositoryLayout layout,
               SessionEnvironment env) noexcept
        : factory_{factory},
          layout_{std::move(layout)},
          env_{std::move(env)} {}

    /// \brief Run git with the session environment in the working copy.
    /// \param network  Whether the factory's network timeout applies.
    /// \returns stdout of git, or an error carrying its scrubbed stderr.
    [[nodiscard]] auto RunGit(std::vector<std::string> const& args,
                              bool network = false) const noexcept
        -> expected<std::string, std::string>;

    [[nodiscard]] auto OpenRepo() const noexcept
        -> expected<GitRepo, std::string>;

    /// \brief Replace credential material in engine output.
    [[nodiscard]] auto Scrub(std::string text) const -> std::string;
};

/// \brief Creates git sessions bound to a working copy.
/// Each session recomputes the SSH transport and environment, so key files
/// provisioned in between are picked up.
class SessionFactory {
  public:
    struct Config {
        std::string git_binary{"git"};
        /// \brief Directory for capturing output of git invocations.
        std::filesystem::path tmp_root{};
        /// \brief Limit for network operations (push); unbounded if unset.
        std::optional<std::chrono::milliseconds> network_timeout{};
        CommitterIdentity committer{};
    };

    SessionFactory(Config config, BaseEnvironment base) noexcept
        : config_{std::move(config)}, base_{std::move(base)} {}

    [[nodiscard]] auto GetConfig() const& noexcept -> Config const& {
        return config_;
    }

    /// \brief Open a session on the given working copy.
    /// A missing SSH key is reported as a warning, not an error, once per
    /// key path.
    [[nodiscard]] auto Open(RepositoryLayout const& layout) const
        -> GitSession;

  private:
    Config config_;
    BaseEnvironment base_;
    Logger logger_{"SessionFactory"};
    mutable std::mutex warned_mutex_;
    mutable std::set<std::filesystem::path> warned_missing_key_;
};

#endif  // INCLUDED_SRC_CONTENTGIT_REPOSITORY_GIT_SESSION_HPP
