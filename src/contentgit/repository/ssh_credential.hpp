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

#ifndef INCLUDED_SRC_CONTENTGIT_REPOSITORY_SSH_CREDENTIAL_HPP
#define INCLUDED_SRC_CONTENTGIT_REPOSITORY_SSH_CREDENTIAL_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "src/utils/cpp/expected.hpp"

/// \brief SSH private key material, held in memory only until it is written
/// to its file. The plain key is not accessible; the buffer is wiped on
/// destruction and is never logged or copied.
class SshCredential {
  public:
    SshCredential(SshCredential const&) = delete;
    auto operator=(SshCredential const&) -> SshCredential& = delete;
    SshCredential(SshCredential&& other) noexcept = default;
    auto operator=(SshCredential&& other) noexcept -> SshCredential&;
    ~SshCredential() noexcept;

    /// \brief Decode a base64-encoded private key.
    /// Whitespace is ignored and missing padding is tolerated. Error messages
    /// never contain any part of the input.
    [[nodiscard]] static auto FromBase64(std::string const& encoded) noexcept
        -> expected<SshCredential, std::string>;

    /// \brief Number of decoded bytes.
    [[nodiscard]] auto Size() const noexcept -> std::size_t {
        return key_.size();
    }

    /// \brief Write the key to the given path with mode 0600, replacing any
    /// previous file. Missing parent directories are created.
    [[nodiscard]] auto Materialize(
        std::filesystem::path const& key_path) const noexcept -> bool;

  private:
    std::vector<unsigned char> key_;

    explicit SshCredential(std::vector<unsigned char> key) noexcept
        : key_{std::move(key)} {}

    void Wipe() noexcept;
};

#endif  // INCLUDED_SRC_CONTENTGIT_REPOSITORY_SSH_CREDENTIAL_HPP
