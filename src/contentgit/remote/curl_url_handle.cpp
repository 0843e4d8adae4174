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

#include "src/contentgit/remote/curl_url_handle.hpp"

#include <cstdlib>
#include <exception>

#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"

extern "C" {
#include "curl/curl.h"
}

namespace {

/// \brief Initialize libcurl once per process; cleaned up at exit.
[[nodiscard]] auto EnsureCurlInitialized() noexcept -> bool {
    static bool const initialized = []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            Logger::Log(LogLevel::Error, "initializing libcurl failed");
            return false;
        }
        return std::atexit(curl_global_cleanup) == 0;
    }();
    return initialized;
}

}  // namespace

void curl_url_closer(gsl::owner<CURLU*> handle) {
    curl_url_cleanup(handle);
}

auto CurlURLHandle::CreatePermissive(std::string const& url,
                                     bool use_guess_scheme,
                                     bool use_default_scheme,
                                     bool use_non_support_scheme) noexcept
    -> std::optional<CurlURLHandlePtr> {
    if (not EnsureCurlInitialized()) {
        return std::nullopt;
    }
    try {
        auto url_h = std::make_shared<CurlURLHandle>();
        auto* handle = curl_url();
        if (handle == nullptr) {
            Logger::Log(LogLevel::Error,
                        "CurlURLHandle: allocating curl URL handle failed");
            return std::nullopt;
        }
        // set up flags
        // NOLINTNEXTLINE(hicpp-signed-bitwise)
        auto flags{use_guess_scheme ? CURLU_GUESS_SCHEME : 0U};
        if (use_default_scheme) {
            // NOLINTNEXTLINE(hicpp-signed-bitwise)
            flags |= CURLU_DEFAULT_SCHEME;
        }
        if (use_non_support_scheme) {
            // NOLINTNEXTLINE(hicpp-signed-bitwise)
            flags |= CURLU_NON_SUPPORT_SCHEME;
        }
        // try to parse the given url
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
        auto rc = curl_url_set(handle, CURLUPART_URL, url.c_str(), flags);
        if (rc != CURLUE_OK) {
            Logger::Log(LogLevel::Debug,
                        "CurlURLHandle: parsing URL failed with:\n{}",
                        curl_url_strerror(rc));
            curl_url_cleanup(handle);
            return nullptr;
        }
        url_h->handle_.reset(handle);
        return std::make_optional<CurlURLHandlePtr>(url_h);
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "CurlURLHandle: creating curl URL handle failed "
                    "unexpectedly with:\n{}",
                    ex.what());
        return std::nullopt;
    }
}

auto CurlURLHandle::GetScheme() noexcept -> std::optional<OptionalString> {
    return GetPart(CURLUPART_SCHEME, CURLUE_NO_SCHEME);
}

auto CurlURLHandle::GetUser() noexcept -> std::optional<OptionalString> {
    return GetPart(CURLUPART_USER, CURLUE_NO_USER);
}

auto CurlURLHandle::GetHost() noexcept -> std::optional<OptionalString> {
    return GetPart(CURLUPART_HOST, CURLUE_NO_HOST);
}

auto CurlURLHandle::GetPort() noexcept -> std::optional<OptionalString> {
    return GetPart(CURLUPART_PORT, CURLUE_NO_PORT);
}

auto CurlURLHandle::GetPath() noexcept -> std::optional<OptionalString> {
    // libcurl returns "/" for an empty path, so a path is never missing
    return GetPart(CURLUPART_PATH, CURLUE_OK);
}

auto CurlURLHandle::GetPart(int part, int missing_code) noexcept
    -> std::optional<OptionalString> {
    try {
        char* field = nullptr;
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
        auto rc = curl_url_get(
            handle_.get(), static_cast<CURLUPart>(part), &field, 0U);
        if (rc != CURLUE_OK) {
            if (rc == static_cast<CURLUcode>(missing_code)) {
                return OptionalString{std::nullopt};
            }
            Logger::Log(LogLevel::Error,
                        "CurlURLHandle: retrieving URL part failed with:\n{}",
                        curl_url_strerror(rc));
            return std::nullopt;
        }
        auto res = OptionalString{std::string{field}};
        // free memory
        curl_free(field);
        return res;
    } catch (std::exception const& ex) {
        Logger::Log(
            LogLevel::Error,
            "CurlURLHandle: retrieving URL part failed unexpectedly with:\n{}",
            ex.what());
        return std::nullopt;
    }
}
