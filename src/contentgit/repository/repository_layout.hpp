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

#ifndef INCLUDED_SRC_CONTENTGIT_REPOSITORY_REPOSITORY_LAYOUT_HPP
#define INCLUDED_SRC_CONTENTGIT_REPOSITORY_REPOSITORY_LAYOUT_HPP

#include <filesystem>
#include <string>
#include <utility>

#include "src/utils/cpp/expected.hpp"

/// \brief On-disk layout of a managed working copy.
/// The working-copy root is absolute; the content directory is a non-upwards
/// path relative to it. The SSH key always lives at <root>/.ssh/id_rsa, and
/// no content path may resolve into <root>/.ssh.
class RepositoryLayout {
  public:
    static constexpr auto kSshKeyRelativePath = ".ssh/id_rsa";
    static constexpr auto kTmpDirName = "tmp";

    /// \brief Validate and normalize a layout.
    /// \param root         Absolute path of the working copy.
    /// \param content_dir  Relative content subdirectory, may be empty.
    [[nodiscard]] static auto Create(
        std::filesystem::path const& root,
        std::filesystem::path const& content_dir = {}) noexcept
        -> expected<RepositoryLayout, std::string>;

    [[nodiscard]] auto Root() const& noexcept -> std::filesystem::path const& {
        return root_;
    }

    /// \brief The content subdirectory, empty if content lives at the root.
    [[nodiscard]] auto ContentDirectory() const& noexcept
        -> std::filesystem::path const& {
        return content_dir_;
    }

    [[nodiscard]] auto ContentRoot() const -> std::filesystem::path {
        return content_dir_.empty() ? root_ : root_ / content_dir_;
    }

    /// \brief Scratch directory below the content root. Referenced only;
    /// nothing in this library writes into it.
    [[nodiscard]] auto TmpDir() const -> std::filesystem::path {
        return ContentRoot() / kTmpDirName;
    }

    [[nodiscard]] auto SshKeyPath() const -> std::filesystem::path {
        return root_ / kSshKeyRelativePath;
    }

    /// \brief Map a path relative to the content root to one relative to the
    /// working-copy root.
    /// Fails for absolute or upwards paths, paths naming the content root
    /// itself, and paths into the credential directory.
    [[nodiscard]] auto ToRootRelative(std::filesystem::path const& file) const
        -> expected<std::filesystem::path, std::string>;

    /// \brief Absolute location of a content-relative file.
    [[nodiscard]] auto FileAbsolutePath(std::filesystem::path const& file) const
        -> expected<std::filesystem::path, std::string>;

  private:
    std::filesystem::path root_;
    std::filesystem::path content_dir_;

    RepositoryLayout(std::filesystem::path root,
                     std::filesystem::path content_dir) noexcept
        : root_{std::move(root)}, content_dir_{std::move(content_dir)} {}
};

#endif  // INCLUDED_SRC_CONTENTGIT_REPOSITORY_REPOSITORY_LAYOUT_HPP
