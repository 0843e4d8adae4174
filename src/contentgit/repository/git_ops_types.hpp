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

#ifndef INCLUDED_SRC_CONTENTGIT_REPOSITORY_GIT_OPS_TYPES_HPP
#define INCLUDED_SRC_CONTENTGIT_REPOSITORY_GIT_OPS_TYPES_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "fmt/core.h"

/// \brief Fallback committer, used unless the environment names one.
struct CommitterIdentity {
    static constexpr auto kDefaultName = "TinaCMS";
    static constexpr auto kDefaultEmail = "tina@tinacms.org";

    std::string name{kDefaultName};
    std::string email{kDefaultEmail};
};

/// \brief Files to stage and commit, relative to the content root.
struct CommitRequest {
    std::vector<std::filesystem::path> files{};
    std::string message{};
    std::optional<std::string> author_name{std::nullopt};
    std::optional<std::string> author_email{std::nullopt};
    bool push{false};

    /// \brief Author override in git's "Name <email>" form.
    /// Only set if a non-empty email is given; the name falls back to the
    /// email.
    [[nodiscard]] auto AuthorOverride() const -> std::optional<std::string> {
        if (not author_email or author_email->empty()) {
            return std::nullopt;
        }
        auto const& name =
            (author_name and not author_name->empty()) ? *author_name
                                                       : *author_email;
        return fmt::format("{} <{}>", name, *author_email);
    }
};

struct CommitResult {
    std::string branch{};
    /// \brief Summary printed by git for the new commit.
    std::string summary{};
    bool pushed{false};
};

#endif  // INCLUDED_SRC_CONTENTGIT_REPOSITORY_GIT_OPS_TYPES_HPP
