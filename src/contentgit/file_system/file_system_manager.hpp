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

#ifndef INCLUDED_SRC_CONTENTGIT_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
#define INCLUDED_SRC_CONTENTGIT_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP

#include <cerrno>  // for errno
#include <cstddef>
#include <cstdint>
#include <cstdlib>  // std::getenv
#include <cstring>  // for strerror()
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#ifdef __unix__
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "gsl/gsl"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"

/// \brief Implements primitive file system functionality.
/// Catches all exceptions for use with exception-free callers.
class FileSystemManager {
  public:
    [[nodiscard]] static auto GetCurrentDirectory() noexcept
        -> std::filesystem::path {
        try {
            return std::filesystem::current_path();
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error, e.what());
            return std::filesystem::path{};
        }
    }

    /// \brief Determine user home directory.
    /// \returns empty path if it cannot be determined.
    [[nodiscard]] static auto GetUserHome() noexcept -> std::filesystem::path {
        char const* root = std::getenv("HOME");
        if (root == nullptr) {
            if (auto const* pw = getpwuid(getuid())) {
                root = pw->pw_dir;
            }
        }
        if (root == nullptr) {
            Logger::Log(LogLevel::Error,
                        "Cannot determine user home directory.");
            return std::filesystem::path{};
        }
        return root;
    }

    /// \brief Returns true if the directory was created or existed before.
    [[nodiscard]] static auto CreateDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        return CreateDirectoryImpl(dir) != CreationStatus::Failed;
    }

    [[nodiscard]] static auto RemoveFile(
        std::filesystem::path const& file) noexcept -> bool {
        try {
            auto status = std::filesystem::symlink_status(file);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_regular_file(status) and
                not std::filesystem::is_symlink(status)) {
                return false;
            }
            return std::filesystem::remove(file);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing file from {}:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto RemoveDirectory(std::filesystem::path const& dir,
                                              bool recursively = false) noexcept
        -> bool {
        try {
            auto status = std::filesystem::symlink_status(dir);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_directory(status)) {
                return false;
            }
            if (recursively) {
                return (std::filesystem::remove_all(dir) !=
                        static_cast<std::uintmax_t>(-1));
            }
            return std::filesystem::remove(dir);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing directory {}:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto Exists(std::filesystem::path const& path) noexcept
        -> bool {
        try {
            auto const status = std::filesystem::symlink_status(path);
            return std::filesystem::exists(status);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking for existence of path {}:\n{}",
                        path.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Checks whether the path names a regular file. Symlinks are
    /// followed, so a link to a regular file counts as a file.
    [[nodiscard]] static auto IsFile(std::filesystem::path const& file) noexcept
        -> bool {
        try {
            return std::filesystem::is_regular_file(
                std::filesystem::status(file));
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking if path {} corresponds to a file:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto IsDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        try {
            auto const status = std::filesystem::symlink_status(dir);
            return std::filesystem::is_directory(status);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking if path {} corresponds to a directory:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto ReadFile(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::string> {
        if (not IsFile(file)) {
            Logger::Log(LogLevel::Debug,
                        "{} can not be read because it is not a file.",
                        file.string());
            return std::nullopt;
        }
        try {
            std::string chunk{};
            std::string content{};
            chunk.resize(kChunkSize);
            std::ifstream file_reader(file.string(), std::ios::binary);
            if (file_reader.is_open()) {
                auto ssize = gsl::narrow<std::streamsize>(chunk.size());
                do {
                    file_reader.read(chunk.data(), ssize);
                    auto count = file_reader.gcount();
                    if (count == ssize) {
                        content += chunk;
                    }
                    else {
                        content +=
                            chunk.substr(0, gsl::narrow<std::size_t>(count));
                    }
                } while (file_reader.good());
                file_reader.close();
                return content;
            }
            return std::nullopt;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "reading file {}:\n{}",
                        file.string(),
                        e.what());
            return std::nullopt;
        }
    }

    /// \brief Write file, creating missing parent directories.
    [[nodiscard]] static auto WriteFile(
        std::string const& content,
        std::filesystem::path const& file) noexcept -> bool {
        if (not CreateDirectory(file.parent_path())) {
            Logger::Log(LogLevel::Error,
                        "can not create directory {}",
                        file.parent_path().string());
            return false;
        }
        if (not FileSystemManager::RemoveFile(file)) {
            Logger::Log(
                LogLevel::Error, "can not remove file {}", file.string());
            return false;
        }
        try {
            std::ofstream writer{file, std::ios::binary};
            if (not writer.is_open()) {
                Logger::Log(
                    LogLevel::Error, "can not open file {}", file.string());
                return false;
            }
            writer << content;
            writer.close();
            return true;
        } catch (std::exception const& e) {
            Logger::Log(
                LogLevel::Error, "writing to {}:\n{}", file.string(), e.what());
            return false;
        }
    }

    /// \brief Write file readable and writable by the owner only (0600).
    /// The file is truncated if it exists and its mode is reset to 0600
    /// before any content is written. The content itself is never logged.
    [[nodiscard]] static auto WriteRestrictedFile(
        std::string_view content,
        std::filesystem::path const& file) noexcept -> bool {
        if (not CreateDirectory(file.parent_path())) {
            Logger::Log(LogLevel::Error,
                        "can not create directory {}",
                        file.parent_path().string());
            return false;
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
        int fd = ::open(file.c_str(),
                        O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,  // NOLINT
                        kRestrictedMode);
        if (fd == -1) {
            Logger::Log(LogLevel::Error,
                        "can not open file {} with error: {}",
                        file.string(),
                        strerror(errno));
            return false;
        }
        auto const closer = gsl::finally([fd]() { ::close(fd); });
        // umask might have narrowed the mode of a new file, and an existing
        // file keeps its old mode on open
        if (::fchmod(fd, kRestrictedMode) != 0) {
            Logger::Log(LogLevel::Error,
                        "can not set permissions of file {} with error: {}",
                        file.string(),
                        strerror(errno));
            return false;
        }
        std::size_t pos{};
        while (pos < content.size()) {
            auto written =
                ::write(fd, content.data() + pos, content.size() - pos);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                Logger::Log(LogLevel::Error,
                            "writing to {} failed with error: {}",
                            file.string(),
                            strerror(errno));
                return false;
            }
            pos += static_cast<std::size_t>(written);
        }
        return true;
    }

  private:
    enum class CreationStatus : std::uint8_t { Created, Exists, Failed };

    static constexpr std::size_t kChunkSize{256};
    static constexpr mode_t kRestrictedMode{S_IRUSR | S_IWUSR};

    /// \brief Race condition free directory creation.
    /// Solves the TOCTOU issue.
    [[nodiscard]] static auto CreateDirectoryImpl(
        std::filesystem::path const& dir) noexcept -> CreationStatus {
        try {
            if (dir.empty() or std::filesystem::is_directory(
                                   std::filesystem::symlink_status(dir))) {
                return CreationStatus::Exists;
            }
            if (std::filesystem::create_directories(dir)) {
                return CreationStatus::Created;
            }
            // It could be that another thread has created the directory right
            // after the current thread checked if it existed. For that reason,
            // we try to create it and check if it exists if create_directories
            // was not successful.
            if (std::filesystem::is_directory(
                    std::filesystem::symlink_status(dir))) {
                return CreationStatus::Exists;
            }

            return CreationStatus::Failed;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error, e.what());
            return CreationStatus::Failed;
        }
    }
};

#endif  // INCLUDED_SRC_CONTENTGIT_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
