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

#include "src/contentgit/repository/ssh_credential.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iterator>
#include <memory>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "openssl/crypto.h"
#include "openssl/evp.h"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"

namespace {

constexpr std::size_t kBase64BlockSize{4};

void encode_ctx_closer(gsl::owner<EVP_ENCODE_CTX*> ctx) {
    EVP_ENCODE_CTX_free(ctx);
}

/// \brief Drop whitespace and restore the padding atob(3) does not insist on.
[[nodiscard]] auto CanonicalBase64(std::string const& encoded)
    -> std::string {
    std::string canonical{};
    canonical.reserve(encoded.size() + kBase64BlockSize);
    std::copy_if(encoded.begin(),
                 encoded.end(),
                 std::back_inserter(canonical),
                 [](unsigned char c) { return std::isspace(c) == 0; });
    while (canonical.size() % kBase64BlockSize != 0) {
        canonical.push_back('=');
    }
    return canonical;
}

}  // namespace

auto SshCredential::operator=(SshCredential&& other) noexcept
    -> SshCredential& {
    if (this != &other) {
        Wipe();
        key_ = std::move(other.key_);
    }
    return *this;
}

SshCredential::~SshCredential() noexcept {
    Wipe();
}

void SshCredential::Wipe() noexcept {
    if (not key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

auto SshCredential::FromBase64(std::string const& encoded) noexcept
    -> expected<SshCredential, std::string> {
    try {
        auto canonical = CanonicalBase64(encoded);
        auto const cleanup = gsl::finally([&canonical]() {
            OPENSSL_cleanse(canonical.data(), canonical.size());
        });
        if (canonical.empty()) {
            return unexpected<std::string>{"SSH key must not be empty"};
        }

        auto ctx =
            std::unique_ptr<EVP_ENCODE_CTX, decltype(&encode_ctx_closer)>(
                EVP_ENCODE_CTX_new(), encode_ctx_closer);
        if (ctx == nullptr) {
            return unexpected<std::string>{
                "allocating base64 decoder for SSH key failed"};
        }
        EVP_DecodeInit(ctx.get());

        std::vector<unsigned char> decoded(
            (canonical.size() / kBase64BlockSize) * 3 + kBase64BlockSize);
        int out_len{};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        auto const* in = reinterpret_cast<unsigned char const*>(
            canonical.data());
        if (EVP_DecodeUpdate(ctx.get(),
                             decoded.data(),
                             &out_len,
                             in,
                             gsl::narrow<int>(canonical.size())) < 0) {
            OPENSSL_cleanse(decoded.data(), decoded.size());
            return unexpected<std::string>{"SSH key is not valid base64"};
        }
        int final_len{};
        if (EVP_DecodeFinal(ctx.get(),
                            decoded.data() + out_len,  // NOLINT
                            &final_len) < 0) {
            OPENSSL_cleanse(decoded.data(), decoded.size());
            return unexpected<std::string>{"SSH key is not valid base64"};
        }
        auto const total = gsl::narrow<std::size_t>(out_len + final_len);
        // wipe the slack before shrinking, resize does not clear it
        OPENSSL_cleanse(decoded.data() + total,  // NOLINT
                        decoded.size() - total);
        decoded.resize(total);
        if (decoded.empty()) {
            return unexpected<std::string>{"SSH key must not be empty"};
        }
        Logger::Log(LogLevel::Debug, "Decoded SSH key of {} bytes", total);
        return SshCredential{std::move(decoded)};
    } catch (std::exception const& ex) {
        return unexpected{
            fmt::format("decoding SSH key failed with:\n{}", ex.what())};
    }
}

auto SshCredential::Materialize(
    std::filesystem::path const& key_path) const noexcept -> bool {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto const content = std::string_view{
        reinterpret_cast<char const*>(key_.data()), key_.size()};
    return FileSystemManager::WriteRestrictedFile(content, key_path);
}
