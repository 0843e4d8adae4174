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

#include "src/contentgit/repository/git_session.hpp"

#include <exception>
#include <memory>
#include <utility>

#include "fmt/core.h"
#include "fmt/ranges.h"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/system/system_command.hpp"
#include "src/utils/cpp/tmp_dir.hpp"

namespace {

constexpr auto kKeyPlaceholder = "<ssh key>";
constexpr auto kSshCommandPlaceholder = "<ssh command>";

void ReplaceAll(gsl::not_null<std::string*> const& text,
                std::string const& needle,
                std::string const& replacement) {
    if (needle.empty()) {
        return;
    }
    auto pos = text->find(needle);
    while (pos != std::string::npos) {
        text->replace(pos, needle.size(), replacement);
        pos = text->find(needle, pos + replacement.size());
    }
}

[[nodiscard]] auto AsArgs(std::vector<std::filesystem::path> const& files)
    -> std::vector<std::string> {
    std::vector<std::string> args{};
    args.reserve(files.size());
    for (auto const& file : files) {
        args.emplace_back(file.generic_string());
    }
    return args;
}

[[nodiscard]] auto TrimTrailingNewlines(std::string text) -> std::string {
    while (not text.empty() and (text.back() == '\n' or text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

auto SessionFactory::Open(RepositoryLayout const& layout) const -> GitSession {
    auto env = SessionEnvironment::Compute(base_, layout, config_.committer);
    if (not env.has_identity) {
        std::unique_lock lock{warned_mutex_};
        if (warned_missing_key_.insert(layout.SshKeyPath()).second) {
            lock.unlock();
            logger_.Emit(LogLevel::Warning, "No SSH key set.");
        }
    }
    logger_.Emit(LogLevel::Trace,
                 "Opened session on {} (identity pinned: {})",
                 layout.Root().string(),
                 env.has_identity);
    return GitSession{this, layout, std::move(env)};
}

auto GitSession::Scrub(std::string text) const -> std::string {
    ReplaceAll(&text, env_.ssh_command, kSshCommandPlaceholder);
    ReplaceAll(&text, layout_.SshKeyPath().string(), kKeyPlaceholder);
    return text;
}

auto GitSession::RunGit(std::vector<std::string> const& args,
                        bool network) const noexcept
    -> expected<std::string, std::string> {
    try {
        auto const& config = factory_->GetConfig();
        auto const subcommand = args.empty() ? std::string{} : args.front();
        auto tmp_dir = TmpDir::Create(config.tmp_root);
        if (tmp_dir == nullptr) {
            return unexpected{fmt::format(
                "could not create temporary directory for git {}", subcommand)};
        }

        std::vector<std::string> argv{config.git_binary};
        argv.insert(argv.end(), args.begin(), args.end());
        Logger::Log(LogLevel::Debug, [&argv]() {
            return fmt::format("Running {}", fmt::join(argv, " "));
        });

        auto const timeout =
            network ? config.network_timeout
                    : std::optional<std::chrono::milliseconds>{};
        auto const output = SystemCommand{"git"}.Execute(
            argv, env_.variables, layout_.Root(), tmp_dir->GetPath(), timeout);
        if (not output) {
            return unexpected{
                fmt::format("running git {} failed", subcommand)};
        }
        if (output->timed_out) {
            return unexpected{fmt::format("git {} did not finish within {}ms",
                                          subcommand,
                                          timeout->count())};
        }
        auto out = FileSystemManager::ReadFile(output->stdout_file);
        if (output->return_value != 0) {
            auto err = FileSystemManager::ReadFile(output->stderr_file)
                           .value_or(std::string{});
            if (err.empty()) {
                err = out.value_or(std::string{});
            }
            return unexpected{
                Scrub(fmt::format("git {} failed with exit code {}:\n{}",
                                  subcommand,
                                  output->return_value,
                                  TrimTrailingNewlines(std::move(err))))};
        }
        return Scrub(TrimTrailingNewlines(out.value_or(std::string{})));
    } catch (std::exception const& ex) {
        return unexpected{
            Scrub(fmt::format("running git failed with:\n{}", ex.what()))};
    }
}

auto GitSession::OpenRepo() const noexcept -> expected<GitRepo, std::string> {
    auto repo = GitRepo::Open(layout_.Root());
    if (not repo) {
        return unexpected{fmt::format("{} is not the root of a git repository",
                                      layout_.Root().string())};
    }
    return *std::move(repo);
}

auto GitSession::CurrentBranch() const noexcept
    -> expected<std::string, std::string> {
    auto repo = OpenRepo();
    if (not repo) {
        return unexpected{std::move(repo).error()};
    }
    std::string error{};
    auto logger = std::make_shared<GitRepo::anon_logger_t>(
        [&error](auto const& msg, bool /*fatal*/) { error = msg; });
    auto branch = repo->GetCurrentBranch(logger);
    if (not branch) {
        return unexpected{std::move(error)};
    }
    return *std::move(branch);
}

auto GitSession::Add(std::vector<std::filesystem::path> const& files)
    const noexcept -> expected<std::monostate, std::string> {
    std::vector<std::string> args{"add", "--"};
    auto paths = AsArgs(files);
    args.insert(args.end(), paths.begin(), paths.end());
    auto result = RunGit(args);
    if (not result) {
        return unexpected{std::move(result).error()};
    }
    return std::monostate{};
}

auto GitSession::Commit(std::string const& message,
                        std::vector<std::filesystem::path> const& files,
                        std::optional<std::string> const& author) const noexcept
    -> expected<std::string, std::string> {
    std::vector<std::string> args{"commit", "-m", message};
    if (author) {
        args.emplace_back(fmt::format("--author={}", *author));
    }
    args.emplace_back("--");
    auto paths = AsArgs(files);
    args.insert(args.end(), paths.begin(), paths.end());
    return RunGit(args);
}

auto GitSession::PushUpstream(std::string const& branch) const noexcept
    -> expected<std::string, std::string> {
    return RunGit({"push", "-u", "origin", branch}, /*network=*/true);
}

auto GitSession::Push() const noexcept -> expected<std::string, std::string> {
    return RunGit({"push"}, /*network=*/true);
}

auto GitSession::Checkout(std::vector<std::filesystem::path> const& files)
    const noexcept -> expected<std::monostate, std::string> {
    std::vector<std::string> args{"checkout", "--"};
    auto paths = AsArgs(files);
    args.insert(args.end(), paths.begin(), paths.end());
    auto result = RunGit(args);
    if (not result) {
        return unexpected{std::move(result).error()};
    }
    return std::monostate{};
}

auto GitSession::ShowAtHead(std::filesystem::path const& file) const noexcept
    -> std::optional<std::string> {
    auto repo = GitRepo::Open(layout_.Root());
    if (not repo) {
        return std::nullopt;
    }
    auto logger = std::make_shared<GitRepo::anon_logger_t>(
        [](auto const& msg, bool /*fatal*/) {
            Logger::Log(LogLevel::Debug, "{}", msg);
        });
    return repo->ReadBlobAtHead(file, logger);
}

auto GitSession::ListRemotes() const noexcept
    -> expected<std::vector<GitRepo::RemoteEntry>, std::string> {
    auto repo = OpenRepo();
    if (not repo) {
        return unexpected{std::move(repo).error()};
    }
    std::string error{};
    auto logger = std::make_shared<GitRepo::anon_logger_t>(
        [&error](auto const& msg, bool /*fatal*/) { error = msg; });
    auto remotes = repo->GetRemotes(logger);
    if (not remotes) {
        return unexpected{std::move(error)};
    }
    return *std::move(remotes);
}

auto GitSession::RemoveRemote(std::string const& name) const noexcept
    -> expected<std::monostate, std::string> {
    auto result = RunGit({"remote", "remove", name});
    if (not result) {
        return unexpected{std::move(result).error()};
    }
    return std::monostate{};
}

auto GitSession::AddRemote(std::string const& name,
                           std::string const& url) const noexcept
    -> expected<std::monostate, std::string> {
    auto result = RunGit({"remote", "add", name, url});
    if (not result) {
        return unexpected{std::move(result).error()};
    }
    return std::monostate{};
}
