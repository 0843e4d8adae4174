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

#ifndef INCLUDED_SRC_CONTENTGIT_REMOTE_GIT_URL_HPP
#define INCLUDED_SRC_CONTENTGIT_REMOTE_GIT_URL_HPP

#include <string>

#include "src/utils/cpp/expected.hpp"

/// \brief Convert a caller-supplied remote identifier into the SSH form
/// registered as "origin".
///
/// Accepted inputs and their results:
///  - scp-like "user@host:path" is returned unchanged
///  - "ssh://[user@]host/path" becomes "user@host:path" (user defaults to
///    "git"); with an explicit port the ssh:// form is kept
///  - "http(s)://host/owner/repo[.git]", "git://..." and the schemeless
///    "host/owner/repo" become "git@host:owner/repo.git"; credentials, port,
///    query and fragment are dropped
///
/// Local paths, file:// URLs and other schemes are rejected.
/// \returns The SSH URL or an error message naming the rejected input.
[[nodiscard]] auto NormalizeToSshUrl(std::string const& remote) noexcept
    -> expected<std::string, std::string>;

#endif  // INCLUDED_SRC_CONTENTGIT_REMOTE_GIT_URL_HPP
