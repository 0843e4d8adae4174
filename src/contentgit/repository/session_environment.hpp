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

#ifndef INCLUDED_SRC_CONTENTGIT_REPOSITORY_SESSION_ENVIRONMENT_HPP
#define INCLUDED_SRC_CONTENTGIT_REPOSITORY_SESSION_ENVIRONMENT_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>

#include "src/contentgit/repository/git_ops_types.hpp"
#include "src/contentgit/repository/repository_layout.hpp"

/// \brief Snapshot of the environment all git invocations inherit.
/// Taken once at startup instead of reading the process environment on
/// every operation.
class BaseEnvironment {
  public:
    using Variables = std::map<std::string, std::string>;

    BaseEnvironment() noexcept = default;
    explicit BaseEnvironment(Variables vars) noexcept
        : vars_{std::move(vars)} {}

    /// \brief Snapshot of the current process environment.
    [[nodiscard]] static auto FromProcess() noexcept -> BaseEnvironment;

    [[nodiscard]] auto Get(std::string const& name) const noexcept
        -> std::optional<std::string>;

    [[nodiscard]] auto All() const& noexcept -> Variables const& {
        return vars_;
    }

  private:
    Variables vars_{};
};

/// \brief Environment and SSH transport of a single git session.
struct SessionEnvironment {
    static constexpr auto kSshCommandVar = "GIT_SSH_COMMAND";
    static constexpr auto kCommitterNameVar = "GIT_COMMITTER_NAME";
    static constexpr auto kCommitterEmailVar = "GIT_COMMITTER_EMAIL";

    /// \brief Value of GIT_SSH_COMMAND, git evaluates it through a shell.
    std::string ssh_command{};
    /// \brief Complete environment for the git child process.
    BaseEnvironment::Variables variables{};
    /// \brief Whether an identity file was found and pinned.
    bool has_identity{false};

    /// \brief Compute the session environment for a working copy.
    /// Host-key verification is disabled. If a key file exists at the
    /// layout's SSH key path, ssh is restricted to exactly that identity.
    /// Precedence of variables: fallback committer < base environment <
    /// GIT_SSH_COMMAND.
    [[nodiscard]] static auto Compute(BaseEnvironment const& base,
                                      RepositoryLayout const& layout,
                                      CommitterIdentity const& committer)
        -> SessionEnvironment;
};

#endif  // INCLUDED_SRC_CONTENTGIT_REPOSITORY_SESSION_ENVIRONMENT_HPP
