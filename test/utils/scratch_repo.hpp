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

#ifndef INCLUDED_SRC_TEST_UTILS_SCRATCH_REPO_HPP
#define INCLUDED_SRC_TEST_UTILS_SCRATCH_REPO_HPP

#include <array>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include <unistd.h>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/utils/cpp/shell_quoting.hpp"

/// \brief Scratch git working copies below TEST_TMPDIR, set up with the git
/// binary.
class ScratchRepo {
  public:
    [[nodiscard]] static auto GetTestDir() -> std::filesystem::path {
        auto* tmp_dir = std::getenv("TEST_TMPDIR");
        if (tmp_dir != nullptr) {
            return std::filesystem::absolute(tmp_dir);
        }
        return FileSystemManager::GetCurrentDirectory() / "test/contentgit";
    }

    /// \brief Fresh, not yet existing path.
    [[nodiscard]] static auto GetUniquePath(std::string const& name)
        -> std::filesystem::path {
        return GetTestDir() / "scratch" /
               fmt::format("{}-{}-{}", name, ::getpid(), counter++);
    }

    /// \brief Initialize a non-bare repository on branch main with a local
    /// user identity and no commits.
    [[nodiscard]] static auto CreateEmpty(std::string const& name = "repo")
        -> std::optional<std::filesystem::path> {
        auto path = GetUniquePath(name);
        if (not FileSystemManager::CreateDirectory(path)) {
            return std::nullopt;
        }
        if (not Git(path, "init -q") or
            not Git(path, "symbolic-ref HEAD refs/heads/main") or
            not Git(path, "config user.name 'Test User'") or
            not Git(path, "config user.email test@example.org")) {
            return std::nullopt;
        }
        return path;
    }

    /// \brief Repository with an initial commit containing the given file.
    [[nodiscard]] static auto CreateWithCommit(
        std::filesystem::path const& file,
        std::string const& content,
        std::string const& name = "repo")
        -> std::optional<std::filesystem::path> {
        auto path = CreateEmpty(name);
        if (not path or
            not FileSystemManager::WriteFile(content, *path / file) or
            not Git(*path, fmt::format("add -- {}", Quote(file))) or
            not Git(*path, "commit -q -m initial")) {
            return std::nullopt;
        }
        return path;
    }

    /// \brief Initialize a bare repository, e.g., to push to.
    [[nodiscard]] static auto CreateBare(std::string const& name = "remote")
        -> std::optional<std::filesystem::path> {
        auto path = GetUniquePath(name);
        if (not FileSystemManager::CreateDirectory(path) or
            not Git(path, "init -q --bare")) {
            return std::nullopt;
        }
        return path;
    }

    /// \brief Run a git command in the given working copy.
    [[nodiscard]] static auto Git(std::filesystem::path const& repo,
                                  std::string const& args) -> bool {
        auto cmd = fmt::format(
            "git -C {} {} >/dev/null 2>&1", Quote(repo), args);
        return std::system(cmd.c_str()) == 0;
    }

    /// \brief Run a git command and capture its stdout, without the trailing
    /// newline.
    [[nodiscard]] static auto GitOutput(std::filesystem::path const& repo,
                                        std::string const& args)
        -> std::optional<std::string> {
        auto cmd = fmt::format("git -C {} {} 2>/dev/null", Quote(repo), args);
        gsl::owner<FILE*> pipe = ::popen(cmd.c_str(), "r");
        if (pipe == nullptr) {
            return std::nullopt;
        }
        std::string output{};
        std::array<char, 256> buffer{};
        while (auto n = std::fread(buffer.data(), 1, buffer.size(), pipe)) {
            output.append(buffer.data(), n);
        }
        if (::pclose(pipe) != 0) {
            return std::nullopt;
        }
        while (not output.empty() and output.back() == '\n') {
            output.pop_back();
        }
        return output;
    }

    [[nodiscard]] static auto Quote(std::filesystem::path const& path)
        -> std::string {
        return QuoteForShell(path.string());
    }

  private:
    static inline std::atomic<int> counter{};
};

#endif  // INCLUDED_SRC_TEST_UTILS_SCRATCH_REPO_HPP
