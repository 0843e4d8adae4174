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

#ifndef INCLUDED_SRC_CONTENTGIT_REPOSITORY_CONTENT_REPOSITORY_HPP
#define INCLUDED_SRC_CONTENTGIT_REPOSITORY_CONTENT_REPOSITORY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "gsl/gsl"
#include "src/contentgit/logging/logger.hpp"
#include "src/contentgit/repository/git_ops_types.hpp"
#include "src/contentgit/repository/git_session.hpp"
#include "src/contentgit/repository/repository_layout.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Content-level operations on a managed working copy.
///
/// All file paths are relative to the content root. Every operation opens a
/// fresh session from the factory; no state is kept between calls apart from
/// the layout. Operations on the same working copy must be serialized by the
/// caller, as git's index lock is the only coordination.
class ContentRepository {
  public:
    static constexpr auto kOriginRemote = "origin";

    ContentRepository(RepositoryLayout layout,
                      gsl::not_null<SessionFactory const*> const& factory)
        : layout_{std::move(layout)}, factory_{factory} {}

    [[nodiscard]] auto Layout() const& noexcept -> RepositoryLayout const& {
        return layout_;
    }

    [[nodiscard]] auto ContentRoot() const -> std::filesystem::path {
        return layout_.ContentRoot();
    }

    [[nodiscard]] auto TmpDir() const -> std::filesystem::path {
        return layout_.TmpDir();
    }

    [[nodiscard]] auto SshKeyPath() const -> std::filesystem::path {
        return layout_.SshKeyPath();
    }

    [[nodiscard]] auto FileAbsolutePath(std::filesystem::path const& file) const
        -> expected<std::filesystem::path, std::string> {
        return layout_.FileAbsolutePath(file);
    }

    /// \brief Stage and commit exactly the requested files, then optionally
    /// push the current branch to origin with upstream tracking.
    [[nodiscard]] auto Commit(CommitRequest const& request) const noexcept
        -> expected<CommitResult, std::string>;

    /// \brief Push the current branch to its configured upstream.
    [[nodiscard]] auto Push() const noexcept
        -> expected<std::string, std::string>;

    /// \brief Discard local modifications of the first listed file only.
    /// Further entries are ignored; use ResetFiles to reset all of them.
    [[nodiscard]] auto ResetFile(std::vector<std::filesystem::path> const&
                                     files) const noexcept
        -> expected<std::monostate, std::string>;

    /// \brief Discard local modifications of all listed files.
    [[nodiscard]] auto ResetFiles(std::vector<std::filesystem::path> const&
                                      files) const noexcept
        -> expected<std::monostate, std::string>;

    /// \brief Content of a file at HEAD, falling back to the working copy.
    /// Only failure of the fallback is reported.
    [[nodiscard]] auto ReadFileAtHead(std::filesystem::path const& file)
        const noexcept -> expected<std::string, std::string>;

    /// \brief Push URL of origin; nullopt, with a warning, if there is none.
    [[nodiscard]] auto GetOrigin() const noexcept
        -> expected<std::optional<std::string>, std::string>;

    /// \brief Point origin to the SSH form of the given remote.
    /// An existing origin is removed first, which is not atomic: if adding
    /// the new remote fails, the repository is left without origin.
    /// \returns The URL origin now points to.
    [[nodiscard]] auto UpdateOrigin(std::string const& remote) const noexcept
        -> expected<std::string, std::string>;

    /// \brief Decode a base64 private key and store it at SshKeyPath() with
    /// mode 0600, overwriting any previous key.
    [[nodiscard]] auto ProvisionSshKey(std::string const& base64_key)
        const noexcept -> expected<std::monostate, std::string>;

  private:
    RepositoryLayout layout_;
    gsl::not_null<SessionFactory const*> factory_;
    Logger logger_{"ContentRepository"};

    [[nodiscard]] auto ToRootRelative(
        std::vector<std::filesystem::path> const& files) const
        -> expected<std::vector<std::filesystem::path>, std::string>;
};

#endif  // INCLUDED_SRC_CONTENTGIT_REPOSITORY_CONTENT_REPOSITORY_HPP
