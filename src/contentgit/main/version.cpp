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

#include "src/contentgit/main/version.hpp"

#include <cstddef>

#include "git2.h"
#include "nlohmann/json.hpp"

auto version() -> std::string {
    std::size_t major = 1;
    std::size_t minor = 0;
    std::size_t revision = 0;
    std::string suffix = std::string{};
#ifdef VERSION_EXTRA_SUFFIX
    suffix += VERSION_EXTRA_SUFFIX;
#endif

    int git_major{};
    int git_minor{};
    int git_rev{};
    git_libgit2_version(&git_major, &git_minor, &git_rev);

    nlohmann::json version_info = {
        {"version", {major, minor, revision}},
        {"suffix", suffix},
        {"libgit2", {git_major, git_minor, git_rev}}};

#ifdef SOURCE_DATE_EPOCH
    version_info["SOURCE_DATE_EPOCH"] = (std::size_t)SOURCE_DATE_EPOCH;
#else
    version_info["SOURCE_DATE_EPOCH"] = nullptr;
#endif

    return version_info.dump();
}
