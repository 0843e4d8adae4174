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

#ifndef INCLUDED_SRC_CONTENTGIT_MAIN_RC_HPP
#define INCLUDED_SRC_CONTENTGIT_MAIN_RC_HPP

#include <filesystem>
#include <string>
#include <variant>

#include "gsl/gsl"
#include "nlohmann/json.hpp"
#include "src/contentgit/main/cli.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Default location of the rc file, in the user's home directory.
[[nodiscard]] auto DefaultRCPath() -> std::filesystem::path;

/// \brief Fill in the arguments not given on the command line from an rc
/// value. Relative paths are taken relative to rc_dir. Log files are
/// appended to the ones from the command line.
[[nodiscard]] auto ApplyRCConfig(
    nlohmann::json const& rc,
    std::filesystem::path const& rc_dir,
    gsl::not_null<CommandLineArguments*> const& clargs)
    -> expected<std::monostate, std::string>;

/// \brief Read the rc file selected by the command line (or the default one,
/// if present) and apply it. Exits with kExitConfigError on malformed input.
void ReadContentGitRC(gsl::not_null<CommandLineArguments*> const& clargs);

#endif  // INCLUDED_SRC_CONTENTGIT_MAIN_RC_HPP
