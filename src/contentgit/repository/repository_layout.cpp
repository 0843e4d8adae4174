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

#include "src/contentgit/repository/repository_layout.hpp"

#include <exception>

#include "fmt/core.h"
#include "src/utils/cpp/path.hpp"

namespace {

/// \brief Directory holding the SSH identity, relative to the root.
[[nodiscard]] auto CredentialDirectory() -> std::filesystem::path {
    return std::filesystem::path{RepositoryLayout::kSshKeyRelativePath}
        .parent_path();
}

}  // namespace

auto RepositoryLayout::Create(std::filesystem::path const& root,
                              std::filesystem::path const& content_dir) noexcept
    -> expected<RepositoryLayout, std::string> {
    try {
        if (root.empty() or not root.is_absolute()) {
            return unexpected{fmt::format(
                "repository root {} is not an absolute path", root.string())};
        }
        auto normal_content = std::filesystem::path{};
        if (not content_dir.empty()) {
            if (not PathIsNonUpwards(content_dir)) {
                return unexpected{
                    fmt::format("content directory {} must be a relative "
                                "path inside the repository",
                                content_dir.string())};
            }
            normal_content = ToNormalPath(content_dir);
            if (normal_content == ".") {
                normal_content.clear();
            }
            else if (PathIsUnder(normal_content, CredentialDirectory())) {
                return unexpected{fmt::format(
                    "content directory {} overlaps the credential directory",
                    content_dir.string())};
            }
        }
        return RepositoryLayout{ToNormalPath(root), std::move(normal_content)};
    } catch (std::exception const& ex) {
        return unexpected{fmt::format(
            "creating repository layout failed with:\n{}", ex.what())};
    }
}

auto RepositoryLayout::ToRootRelative(std::filesystem::path const& file) const
    -> expected<std::filesystem::path, std::string> {
    if (file.empty() or not PathIsNonUpwards(file)) {
        return unexpected{fmt::format(
            "file path '{}' must be relative to the content root and must not "
            "leave it",
            file.string())};
    }
    auto rel = ToNormalPath(content_dir_ / file);
    if (rel == ToNormalPath(content_dir_)) {
        return unexpected{
            fmt::format("file path '{}' names no file", file.string())};
    }
    if (PathIsUnder(rel, CredentialDirectory())) {
        return unexpected{
            fmt::format("file path '{}' refers to the credential directory",
                        file.string())};
    }
    return rel;
}

auto RepositoryLayout::FileAbsolutePath(std::filesystem::path const& file) const
    -> expected<std::filesystem::path, std::string> {
    auto rel = ToRootRelative(file);
    if (not rel) {
        return unexpected{std::move(rel).error()};
    }
    return root_ / *rel;
}
