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

#include "src/contentgit/repository/session_environment.hpp"

#include <exception>
#include <string_view>
#include <vector>

#ifdef __unix__
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "fmt/core.h"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"
#include "src/utils/cpp/shell_quoting.hpp"

extern char** environ;  // NOLINT

namespace {

[[nodiscard]] auto JoinOptions(std::vector<std::string> const& options)
    -> std::string {
    std::string joined{"ssh"};
    for (auto const& opt : options) {
        joined += ' ';
        joined += opt;
    }
    return joined;
}

}  // namespace

auto BaseEnvironment::FromProcess() noexcept -> BaseEnvironment {
    Variables vars{};
    try {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        for (char** entry = environ; entry != nullptr and *entry != nullptr;
             ++entry) {
            auto const var = std::string_view{*entry};
            auto const pos = var.find('=');
            if (pos == std::string_view::npos or pos == 0) {
                continue;
            }
            vars.emplace(std::string{var.substr(0, pos)},
                         std::string{var.substr(pos + 1)});
        }
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "Reading process environment failed with:\n{}",
                    ex.what());
    }
    return BaseEnvironment{std::move(vars)};
}

auto BaseEnvironment::Get(std::string const& name) const noexcept
    -> std::optional<std::string> {
    auto it = vars_.find(name);
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto SessionEnvironment::Compute(BaseEnvironment const& base,
                                 RepositoryLayout const& layout,
                                 CommitterIdentity const& committer)
    -> SessionEnvironment {
    std::vector<std::string> options{"-o UserKnownHostsFile=/dev/null",
                                     "-o StrictHostKeyChecking=no"};
    auto const key_path = layout.SshKeyPath();
    bool const has_identity = FileSystemManager::Exists(key_path);
    if (has_identity) {
        options.emplace_back("-o IdentitiesOnly=yes");
        options.emplace_back(
            fmt::format("-i {}", QuoteForShellIfNeeded(key_path.string())));
        options.emplace_back("-F /dev/null");
    }

    SessionEnvironment env{};
    env.ssh_command = JoinOptions(options);
    env.has_identity = has_identity;
    env.variables[kCommitterEmailVar] = committer.email;
    env.variables[kCommitterNameVar] = committer.name;
    for (auto const& [name, value] : base.All()) {
        env.variables[name] = value;
    }
    env.variables[kSshCommandVar] = env.ssh_command;
    return env;
}
