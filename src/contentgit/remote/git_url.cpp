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

#include "src/contentgit/remote/git_url.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>
#include <string_view>

#include "fmt/core.h"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"
#include "src/contentgit/remote/curl_url_handle.hpp"

namespace {

constexpr std::string_view kDefaultSshUser{"git"};
constexpr std::string_view kGitSuffix{".git"};
constexpr std::string_view kSchemeSeparator{"://"};

[[nodiscard]] auto Trim(std::string_view str) -> std::string_view {
    auto const is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

[[nodiscard]] auto StripSlashes(std::string_view path) -> std::string_view {
    while (not path.empty() and path.front() == '/') {
        path.remove_prefix(1);
    }
    while (not path.empty() and path.back() == '/') {
        path.remove_suffix(1);
    }
    return path;
}

/// \brief Recognize "[user@]host:path" where the colon precedes any slash.
/// A single letter before the colon is taken as a drive letter, not a host.
[[nodiscard]] auto IsScpLike(std::string_view url) -> bool {
    auto const colon = url.find(':');
    if (colon == std::string_view::npos or colon + 1 == url.size()) {
        return false;
    }
    auto const slash = url.find('/');
    if (slash != std::string_view::npos and slash < colon) {
        return false;
    }
    auto host = url.substr(0, colon);
    if (auto const at = host.rfind('@'); at != std::string_view::npos) {
        host = host.substr(at + 1);
    }
    return host.size() > 1;
}

/// \brief Recognize "host/owner/repo", a host name without scheme.
[[nodiscard]] auto IsSchemelessHostPath(std::string_view url) -> bool {
    if (url.empty() or url.front() == '/' or url.front() == '.' or
        url.front() == '~') {
        return false;
    }
    auto const slash = url.find('/');
    if (slash == std::string_view::npos) {
        return false;
    }
    return url.substr(0, slash).find('.') != std::string_view::npos and
           not StripSlashes(url.substr(slash)).empty();
}

[[nodiscard]] auto FromHttpLike(std::string const& host,
                                std::string_view path)
    -> expected<std::string, std::string> {
    auto repo = std::string{StripSlashes(path)};
    if (repo.empty()) {
        return unexpected{
            fmt::format("remote on host {} names no repository", host)};
    }
    if (not std::string_view{repo}.ends_with(kGitSuffix)) {
        repo += kGitSuffix;
    }
    return fmt::format("{}@{}:{}", kDefaultSshUser, host, repo);
}

[[nodiscard]] auto FromSsh(std::optional<std::string> const& user,
                           std::string const& host,
                           std::optional<std::string> const& port,
                           std::string_view path)
    -> expected<std::string, std::string> {
    auto const login = user.value_or(std::string{kDefaultSshUser});
    auto repo = StripSlashes(path);
    if (repo.empty()) {
        return unexpected{
            fmt::format("remote on host {} names no repository", host)};
    }
    if (port) {
        return fmt::format("ssh://{}@{}:{}/{}", login, host, *port, repo);
    }
    return fmt::format("{}@{}:{}", login, host, repo);
}

/// \brief Hide the password of a URL's userinfo for use in messages.
[[nodiscard]] auto Redacted(std::string_view url) -> std::string {
    auto const start = url.find(kSchemeSeparator);
    if (start == std::string_view::npos) {
        return std::string{url};
    }
    auto const authority_begin = start + kSchemeSeparator.size();
    auto const authority_end = url.find('/', authority_begin);
    auto const at = url.substr(0, authority_end).rfind('@');
    if (at == std::string_view::npos or at < authority_begin) {
        return std::string{url};
    }
    auto const colon = url.substr(0, at).find(':', authority_begin);
    if (colon == std::string_view::npos) {
        return std::string{url};
    }
    return fmt::format("{}:***{}", url.substr(0, colon), url.substr(at));
}

}  // namespace

auto NormalizeToSshUrl(std::string const& remote) noexcept
    -> expected<std::string, std::string> {
    try {
        auto const url = std::string{Trim(remote)};
        if (url.empty()) {
            return unexpected<std::string>{"remote must not be empty"};
        }

        auto const has_scheme =
            url.find(kSchemeSeparator) != std::string::npos;
        if (not has_scheme and IsScpLike(url)) {
            return url;
        }
        if (not has_scheme and not IsSchemelessHostPath(url)) {
            return unexpected{fmt::format(
                "remote {} is neither a URL nor of the form user@host:path",
                url)};
        }

        auto const parsed = CurlURLHandle::CreatePermissive(
            has_scheme ? url : fmt::format("https://{}", url),
            /*use_guess_scheme=*/false,
            /*use_default_scheme=*/false,
            /*use_non_support_scheme=*/true);
        if (not parsed) {
            return unexpected{fmt::format(
                "parsing remote {} failed unexpectedly", Redacted(url))};
        }
        if (*parsed == nullptr) {
            return unexpected{
                fmt::format("remote {} is not a valid URL", Redacted(url))};
        }
        auto const& handle = *parsed;

        auto scheme = handle->GetScheme();
        auto host = handle->GetHost();
        auto path = handle->GetPath();
        if (not scheme or not host or not path) {
            return unexpected{fmt::format(
                "reading components of remote {} failed", Redacted(url))};
        }
        if (not *scheme or not *host or host->value().empty()) {
            return unexpected{
                fmt::format("remote {} names no host", Redacted(url))};
        }
        auto const path_str = path->value_or(std::string{});

        auto scheme_str = scheme->value();
        std::transform(scheme_str.begin(),
                       scheme_str.end(),
                       scheme_str.begin(),
                       [](unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (scheme_str == "http" or scheme_str == "https" or
            scheme_str == "git") {
            Logger::Log(LogLevel::Debug,
                        "Converting {} remote {} to SSH form",
                        scheme_str,
                        Redacted(url));
            return FromHttpLike(host->value(), path_str);
        }
        if (scheme_str == "ssh" or scheme_str == "git+ssh" or
            scheme_str == "ssh+git") {
            auto user = handle->GetUser();
            auto port = handle->GetPort();
            if (not user or not port) {
                return unexpected{fmt::format(
                    "reading components of remote {} failed", Redacted(url))};
            }
            return FromSsh(*user, host->value(), *port, path_str);
        }
        return unexpected{fmt::format("remote {} uses unsupported scheme {}",
                                      Redacted(url),
                                      scheme_str)};
    } catch (std::exception const& ex) {
        return unexpected{fmt::format(
            "normalizing remote {} failed with:\n{}",
            Redacted(remote),
            ex.what())};
    }
}
