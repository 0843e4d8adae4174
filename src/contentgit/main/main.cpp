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

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include "CLI/CLI.hpp"
#include "gsl/gsl"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/file_system/git_context.hpp"
#include "src/contentgit/logging/log_config.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/log_sink_cmdline.hpp"
#include "src/contentgit/logging/log_sink_file.hpp"
#include "src/contentgit/logging/logger.hpp"
#include "src/contentgit/main/cli.hpp"
#include "src/contentgit/main/exit_codes.hpp"
#include "src/contentgit/main/rc.hpp"
#include "src/contentgit/main/version.hpp"
#include "src/contentgit/repository/content_repository.hpp"
#include "src/contentgit/repository/git_ops_types.hpp"
#include "src/contentgit/repository/git_session.hpp"
#include "src/contentgit/repository/repository_layout.hpp"
#include "src/contentgit/repository/session_environment.hpp"

namespace {

[[nodiscard]] auto ParseCommandLineArguments(int argc, char const* const* argv)
    -> CommandLineArguments {
    CLI::App app(
        "contentgit, a tool for committing and publishing the content of a "
        "git working copy");
    app.option_defaults()->take_last();
    auto* cmd_version = app.add_subcommand(
        "version", "Print version information in JSON format of this tool.");
    auto* cmd_commit =
        app.add_subcommand("commit", "Stage and commit the given files.");
    auto* cmd_push = app.add_subcommand(
        "push", "Push the current branch to its upstream.");
    auto* cmd_reset = app.add_subcommand(
        "reset", "Discard local modifications of the first given file.");
    auto* cmd_show = app.add_subcommand(
        "show", "Print a file as of HEAD, or from the working copy.");
    auto* cmd_origin =
        app.add_subcommand("origin", "Print the push URL of origin.");
    auto* cmd_set_origin = app.add_subcommand(
        "set-origin", "Point origin to the SSH form of the given remote.");
    auto* cmd_provision_key = app.add_subcommand(
        "provision-key",
        "Store the base64-encoded SSH private key read from stdin.");
    app.require_subcommand(1);

    CommandLineArguments clargs;
    // first, set the common arguments for contentgit itself
    SetupCommonArguments(&app, &clargs.common);
    SetupLogArguments(&app, &clargs.log);
    // then, set the arguments for each subcommand
    SetupCommitArguments(cmd_commit, &clargs.commit);
    SetupResetArguments(cmd_reset, &clargs.reset);
    SetupShowArguments(cmd_show, &clargs.show);
    SetupSetOriginArguments(cmd_set_origin, &clargs.set_origin);

    try {
        app.parse(argc, argv);
    } catch (CLI::Error& e) {
        [[maybe_unused]] auto err = app.exit(e);
        std::exit(kExitClargsError);
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error, "Command line parse error: {}", ex.what());
        std::exit(kExitClargsError);
    }

    if (*cmd_version) {
        clargs.cmd = SubCommand::kVersion;
    }
    else if (*cmd_commit) {
        clargs.cmd = SubCommand::kCommit;
    }
    else if (*cmd_push) {
        clargs.cmd = SubCommand::kPush;
    }
    else if (*cmd_reset) {
        clargs.cmd = SubCommand::kReset;
    }
    else if (*cmd_show) {
        clargs.cmd = SubCommand::kShow;
    }
    else if (*cmd_origin) {
        clargs.cmd = SubCommand::kOrigin;
    }
    else if (*cmd_set_origin) {
        clargs.cmd = SubCommand::kSetOrigin;
    }
    else if (*cmd_provision_key) {
        clargs.cmd = SubCommand::kProvisionKey;
    }

    return clargs;
}

void SetupDefaultLogging() {
    LogConfig::SetLogLimit(kDefaultLogLevel);
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory()});
}

void SetupLogging(LogArguments const& clargs) {
    if (clargs.log_limit) {
        LogConfig::SetLogLimit(*clargs.log_limit);
    }
    else {
        LogConfig::SetLogLimit(kDefaultLogLevel);
    }
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory(not clargs.plain_log)});
    for (auto const& log_file : clargs.log_files) {
        LogConfig::AddSink(LogSinkFile::CreateFactory(
            log_file,
            clargs.log_append ? LogSinkFile::Mode::Append
                              : LogSinkFile::Mode::Overwrite));
    }
}

[[nodiscard]] auto CreateSessionFactory(CommonArguments const& common)
    -> SessionFactory {
    SessionFactory::Config config{};
    config.git_binary = common.git_path.value_or(kDefaultGitPath);
    config.tmp_root =
        common.tmp_root
            ? *common.tmp_root
            : std::filesystem::temp_directory_path() / "contentgit";
    config.network_timeout = common.network_timeout;
    if (common.committer) {
        config.committer = *common.committer;
    }
    return SessionFactory{std::move(config), BaseEnvironment::FromProcess()};
}

[[nodiscard]] auto RunCommit(ContentRepository const& repo,
                             CommitArguments const& clargs) -> int {
    auto result = repo.Commit(CommitRequest{.files = clargs.files,
                                            .message = clargs.message,
                                            .author_name = clargs.author_name,
                                            .author_email = clargs.author_email,
                                            .push = clargs.push});
    if (not result) {
        Logger::Log(LogLevel::Error, result.error());
        return kExitOperationError;
    }
    std::cout << result->summary << std::flush;
    if (result->pushed) {
        Logger::Log(LogLevel::Info,
                    "Pushed branch {} to {}",
                    result->branch,
                    ContentRepository::kOriginRemote);
    }
    return kExitSuccess;
}

[[nodiscard]] auto RunReset(ContentRepository const& repo,
                            ResetArguments const& clargs) -> int {
    auto result = clargs.all ? repo.ResetFiles(clargs.files)
                             : repo.ResetFile(clargs.files);
    if (not result) {
        Logger::Log(LogLevel::Error, result.error());
        return kExitOperationError;
    }
    return kExitSuccess;
}

[[nodiscard]] auto RunProvisionKey(ContentRepository const& repo) -> int {
    std::string encoded{std::istreambuf_iterator<char>{std::cin},
                        std::istreambuf_iterator<char>{}};
    auto result = repo.ProvisionSshKey(encoded);
    encoded.assign(encoded.size(), '\0');
    if (not result) {
        Logger::Log(LogLevel::Error, result.error());
        return kExitOperationError;
    }
    return kExitSuccess;
}

[[nodiscard]] auto Dispatch(CommandLineArguments const& arguments,
                            ContentRepository const& repo) -> int {
    switch (arguments.cmd) {
        case SubCommand::kCommit:
            return RunCommit(repo, arguments.commit);
        case SubCommand::kPush: {
            auto result = repo.Push();
            if (not result) {
                Logger::Log(LogLevel::Error, result.error());
                return kExitOperationError;
            }
            Logger::Log(LogLevel::Info, "Push completed");
            return kExitSuccess;
        }
        case SubCommand::kReset:
            return RunReset(repo, arguments.reset);
        case SubCommand::kShow: {
            auto content = repo.ReadFileAtHead(arguments.show.path);
            if (not content) {
                Logger::Log(LogLevel::Error, content.error());
                return kExitOperationError;
            }
            std::cout << *content << std::flush;
            return kExitSuccess;
        }
        case SubCommand::kOrigin: {
            auto origin = repo.GetOrigin();
            if (not origin) {
                Logger::Log(LogLevel::Error, origin.error());
                return kExitOperationError;
            }
            if (*origin) {
                std::cout << **origin << std::endl;
            }
            return kExitSuccess;
        }
        case SubCommand::kSetOrigin: {
            auto url = repo.UpdateOrigin(arguments.set_origin.remote);
            if (not url) {
                Logger::Log(LogLevel::Error, url.error());
                return kExitOperationError;
            }
            std::cout << *url << std::endl;
            return kExitSuccess;
        }
        case SubCommand::kProvisionKey:
            return RunProvisionKey(repo);
        case SubCommand::kVersion:
        case SubCommand::kUnknown:
            break;
    }
    // Unknown subcommand should fail
    Logger::Log(LogLevel::Error, "Unknown subcommand provided.");
    return kExitUnknownCommand;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    SetupDefaultLogging();
    try {
        // get the user-defined arguments
        auto arguments = ParseCommandLineArguments(argc, argv);

        if (arguments.cmd == SubCommand::kVersion) {
            std::cout << version() << std::endl;
            return kExitSuccess;
        }

        SetupLogging(arguments.log);
        ReadContentGitRC(&arguments);
        // As the rc file can contain logging parameters, reset the logging
        // configuration
        SetupLogging(arguments.log);

        if (not arguments.common.repository_root) {
            arguments.common.repository_root =
                FileSystemManager::GetCurrentDirectory();
        }
        auto layout = RepositoryLayout::Create(
            *arguments.common.repository_root,
            arguments.common.content_dir.value_or(std::filesystem::path{}));
        if (not layout) {
            Logger::Log(LogLevel::Error, layout.error());
            return kExitConfigError;
        }

        // libgit2 has to be initialized by the main thread before any
        // repository is opened
        if (not GitContext::Create()) {
            Logger::Log(LogLevel::Error, "Failed to initialize libgit2.");
            return kExitGenericFailure;
        }

        auto const factory = CreateSessionFactory(arguments.common);
        auto const repo = ContentRepository{*std::move(layout), &factory};
        return Dispatch(arguments, repo);
    } catch (std::exception const& ex) {
        Logger::Log(
            LogLevel::Error, "Caught exception with message: {}", ex.what());
    }
    return kExitGenericFailure;
}
