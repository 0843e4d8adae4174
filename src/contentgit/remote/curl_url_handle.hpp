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

#ifndef INCLUDED_SRC_CONTENTGIT_REMOTE_CURL_URL_HANDLE_HPP
#define INCLUDED_SRC_CONTENTGIT_REMOTE_CURL_URL_HANDLE_HPP

#include <memory>
#include <optional>
#include <string>

#include "gsl/gsl"

extern "C" {
using CURLU = struct Curl_URL;
}

class CurlURLHandle;
using CurlURLHandlePtr = std::shared_ptr<CurlURLHandle>;

/// \brief Type describing a possibly missing string. Used to store a retrieved
/// field of a parsed URL.
using OptionalString = std::optional<std::string>;

void curl_url_closer(gsl::owner<CURLU*> handle);

/// \brief Class handling URLs using libcurl API.
/// As with libcurl, only limited checks are performed in order to parse the
/// required fields for a given URL string.
class CurlURLHandle {
  public:
    CurlURLHandle() noexcept = default;
    ~CurlURLHandle() noexcept = default;

    // prohibit moves & copies
    CurlURLHandle(CurlURLHandle const&) = delete;
    CurlURLHandle(CurlURLHandle&& other) = delete;
    auto operator=(CurlURLHandle const&) = delete;
    auto operator=(CurlURLHandle&& other) = delete;

    /// \brief Creates a CurlURLHandle object by parsing the given URL.
    /// The flags mirror those of the libcurl API (see libcurl docs for effects
    /// of each flag). Returns nullptr on failure to parse with given
    /// arguments, and nullopt if libcurl cannot be initialized or on an
    /// unexpected exception.
    [[nodiscard]] auto static CreatePermissive(
        std::string const& url,
        bool use_guess_scheme = false,
        bool use_default_scheme = false,
        bool use_non_support_scheme = false) noexcept
        -> std::optional<CurlURLHandlePtr>;

    /// \brief Gets the parsed scheme field.
    [[nodiscard]] auto GetScheme() noexcept -> std::optional<OptionalString>;

    /// \brief Gets the parsed user field. Password is never returned.
    [[nodiscard]] auto GetUser() noexcept -> std::optional<OptionalString>;

    [[nodiscard]] auto GetHost() noexcept -> std::optional<OptionalString>;

    /// \brief Gets the port only if it was explicitly part of the URL.
    [[nodiscard]] auto GetPort() noexcept -> std::optional<OptionalString>;

    /// \brief Gets the path; query and fragment are not included.
    [[nodiscard]] auto GetPath() noexcept -> std::optional<OptionalString>;

  private:
    std::unique_ptr<CURLU, decltype(&curl_url_closer)> handle_{nullptr,
                                                               curl_url_closer};

    /// \brief Retrieve a single URL part.
    /// \param part         The CURLUPart enumerator value.
    /// \param missing_code The CURLUcode libcurl reports for an absent part.
    [[nodiscard]] auto GetPart(int part, int missing_code) noexcept
        -> std::optional<OptionalString>;
};

#endif  // INCLUDED_SRC_CONTENTGIT_REMOTE_CURL_URL_HANDLE_HPP
