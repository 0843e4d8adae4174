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

#ifndef INCLUDED_SRC_CONTENTGIT_SYSTEM_SYSTEM_COMMAND_HPP
#define INCLUDED_SRC_CONTENTGIT_SYSTEM_SYSTEM_COMMAND_HPP

#include <algorithm>
#include <cerrno>  // for errno
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>  // for strerror()
#include <filesystem>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>  // std::move
#include <vector>

#ifdef __unix__
#include <sys/wait.h>
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "gsl/gsl"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"

/// \brief Execute system commands and obtain stdout, stderr and return value.
/// Subsequent commands are context free and are not affected by previous
/// commands. This class is not thread-safe.
class SystemCommand {
  public:
    struct ExecOutput {
        int return_value{};
        std::filesystem::path stdout_file{};
        std::filesystem::path stderr_file{};
        bool timed_out{false};
    };

    /// \brief Create execution system with name.
    explicit SystemCommand(std::string name) : logger_{std::move(name)} {}

    /// \brief Execute command and arguments.
    /// Stdout and stderr can be read from files named 'stdout' and 'stderr'
    /// created in `outdir`. Those files must not exist before the execution.
    /// \param argv     argv vector with the command to execute
    /// \param env      Environment variables set for execution.
    /// \param cwd      Working directory for execution.
    /// \param outdir   Directory for storing stdout/stderr files.
    /// \param timeout  Wall clock limit; the child's process group is killed
    ///                 once it is exceeded.
    /// \returns The command's output, or std::nullopt on execution error.
    [[nodiscard]] auto Execute(
        std::vector<std::string> argv,
        std::map<std::string, std::string> const& env,
        std::filesystem::path const& cwd,
        std::filesystem::path const& outdir,
        std::optional<std::chrono::milliseconds> timeout =
            std::nullopt) noexcept -> std::optional<ExecOutput> {
        if (not FileSystemManager::IsDirectory(outdir)) {
            logger_.Emit(LogLevel::Error,
                         "Output directory does not exist {}",
                         outdir.string());
            return std::nullopt;
        }

        if (argv.empty()) {
            logger_.Emit(LogLevel::Error, "Command cannot be empty.");
            return std::nullopt;
        }

        try {
            std::vector<char*> cmd = UnwrapStrings(&argv);

            std::vector<std::string> env_string{};
            env_string.reserve(env.size());
            std::transform(std::begin(env),
                           std::end(env),
                           std::back_inserter(env_string),
                           [](auto const& name_value) {
                               return name_value.first + "=" +
                                      name_value.second;
                           });
            std::vector<char*> envp = UnwrapStrings(&env_string);
            return ExecuteCommand(
                cmd.data(), envp.data(), cwd, outdir, timeout);
        } catch (std::exception const& ex) {
            logger_.Emit(LogLevel::Error,
                         "Preparing command {} failed with:\n{}",
                         argv.front(),
                         ex.what());
            return std::nullopt;
        }
    }

  private:
    static constexpr std::chrono::milliseconds kPollInterval{10};

    Logger logger_;

    /// \brief Open file exclusively as write-only.
    [[nodiscard]] static auto OpenFile(
        std::filesystem::path const& file_path) noexcept {
        static auto file_closer = [](gsl::owner<FILE*> f) {
            if (f != nullptr) {
                std::fclose(f);
            }
        };
        return std::unique_ptr<FILE, decltype(file_closer)>(
            std::fopen(file_path.c_str(), "wx"), file_closer);
    }

    /// \brief Execute command and arguments.
    /// \returns ExecOutput if command was successfully submitted to the system.
    /// \returns std::nullopt on internal failure.
    [[nodiscard]] auto ExecuteCommand(
        char* const* cmd,
        char* const* envp,
        std::filesystem::path const& cwd,
        std::filesystem::path const& outdir,
        std::optional<std::chrono::milliseconds> timeout) noexcept
        -> std::optional<ExecOutput> {
        auto stdout_file = outdir / "stdout";
        auto stderr_file = outdir / "stderr";
        if (auto const out = OpenFile(stdout_file)) {
            if (auto const err = OpenFile(stderr_file)) {
                bool timed_out{false};
                if (auto retval = ForkAndExecute(cmd,
                                                 envp,
                                                 cwd,
                                                 fileno(out.get()),
                                                 fileno(err.get()),
                                                 timeout,
                                                 &timed_out)) {
                    return ExecOutput{.return_value = *retval,
                                      .stdout_file = std::move(stdout_file),
                                      .stderr_file = std::move(stderr_file),
                                      .timed_out = timed_out};
                }
            }
            else {
                logger_.Emit(LogLevel::Error,
                             "Failed to open stderr file '{}' with error: {}",
                             stderr_file.string(),
                             strerror(errno));
            }
        }
        else {
            logger_.Emit(LogLevel::Error,
                         "Failed to open stdout file '{}' with error: {}",
                         stdout_file.string(),
                         strerror(errno));
        }

        return std::nullopt;
    }

    /// \brief Fork process and exec command.
    /// The child becomes leader of a new process group, so that on timeout
    /// its own children (e.g., ssh spawned by git) are killed as well.
    /// \returns return code if command was successfully submitted to system.
    /// \returns std::nullopt if fork or exec failed.
    [[nodiscard]] auto ForkAndExecute(
        char* const* cmd,
        char* const* envp,
        std::filesystem::path const& cwd,
        int out_fd,
        int err_fd,
        std::optional<std::chrono::milliseconds> timeout,
        gsl::not_null<bool*> const& timed_out) const noexcept
        -> std::optional<int> {
        auto const* cwd_cstr = cwd.c_str();

        // some executables require an open (possibly seekable) stdin, and
        // therefore, we use an open temporary file that does not appear on the
        // file system and will be removed automatically once the descriptor is
        // closed.
        gsl::owner<FILE*> in_file = std::tmpfile();
        if (in_file == nullptr) {
            logger_.Emit(LogLevel::Error,
                         "Failed to execute '{}': cannot create stdin file.",
                         *cmd);
            return std::nullopt;
        }
        auto in_fd = fileno(in_file);

        // fork child process
        pid_t pid = ::fork();
        if (-1 == pid) {
            std::fclose(in_file);
            logger_.Emit(LogLevel::Error,
                         "Failed to execute '{}': cannot fork a child process.",
                         *cmd);
            return std::nullopt;
        }

        // dispatch child/parent process
        if (pid == 0) {
            ::setpgid(0, 0);
            if (::chdir(cwd_cstr) != 0) {
                // NOLINTNEXTLINE
                dprintf(err_fd,
                        "Failed to change directory to '%s' with error: %s\n",
                        cwd_cstr,
                        strerror(errno));
                std::_Exit(EXIT_FAILURE);
            }

            // redirect and close fds
            ::dup2(in_fd, STDIN_FILENO);
            ::dup2(out_fd, STDOUT_FILENO);
            ::dup2(err_fd, STDERR_FILENO);
            ::close(in_fd);
            ::close(out_fd);
            ::close(err_fd);

            // execute command in child process and exit
            ::execvpe(*cmd, cmd, envp);

            // report error and terminate child process if ::execvp did not exit
            // NOLINTNEXTLINE
            fprintf(stderr,
                    "Failed to execute '%s' with error: %s\n",
                    *cmd,
                    strerror(errno));

            std::_Exit(EXIT_FAILURE);
        }

        std::fclose(in_file);

        auto const deadline =
            timeout ? std::optional{std::chrono::steady_clock::now() + *timeout}
                    : std::nullopt;

        // wait for child to finish and obtain return value
        int status{};
        std::optional<int> retval{std::nullopt};
        do {
            int const options = (deadline and not *timed_out) ? WNOHANG : 0;
            auto const waited = ::waitpid(pid, &status, options);
            if (waited == -1) {
                if (errno == EINTR) {
                    continue;
                }
                // this should never happen
                logger_.Emit(LogLevel::Error,
                             "Waiting for child failed with: {}",
                             strerror(errno));
                break;
            }

            if (waited == 0) {
                if (std::chrono::steady_clock::now() >= *deadline) {
                    logger_.Emit(LogLevel::Error,
                                 "Command '{}' did not finish within {}ms, "
                                 "killing it.",
                                 *cmd,
                                 timeout->count());
                    ::kill(-pid, SIGKILL);
                    *timed_out = true;
                }
                else {
                    std::this_thread::sleep_for(kPollInterval);
                }
                continue;
            }

            if (WIFEXITED(status)) {           // NOLINT(hicpp-signed-bitwise)
                retval = WEXITSTATUS(status);  // NOLINT(hicpp-signed-bitwise)
            }
            else if (WIFSIGNALED(status)) {  // NOLINT(hicpp-signed-bitwise)
                constexpr auto kSignalBit = 128;
                auto sig = WTERMSIG(status);  // NOLINT(hicpp-signed-bitwise)
                retval = kSignalBit + sig;
                logger_.Emit(
                    LogLevel::Debug, "Child got killed by signal {}", sig);
            }
            // continue waitpid() in case we got STOPSIG from child
        } while (not retval);

        return retval;
    }

    static auto UnwrapStrings(std::vector<std::string>* v) noexcept
        -> std::vector<char*> {
        std::vector<char*> raw{};
        std::transform(std::begin(*v),
                       std::end(*v),
                       std::back_inserter(raw),
                       [](auto& str) { return str.data(); });
        raw.push_back(nullptr);
        return raw;
    }
};

#endif  // INCLUDED_SRC_CONTENTGIT_SYSTEM_SYSTEM_COMMAND_HPP
