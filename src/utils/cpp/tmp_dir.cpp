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

#include "src/utils/cpp/tmp_dir.hpp"

#ifdef __unix__
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/logging/log_level.hpp"
#include "src/contentgit/logging/logger.hpp"

auto TmpDir::Create(std::filesystem::path const& prefix) noexcept -> Ptr {
    static constexpr std::string_view kDirTemplate = "tmp.XXXXXX";
    // make sure prefix folder exists
    if (not FileSystemManager::CreateDirectory(prefix)) {
        Logger::Log(LogLevel::Error,
                    "TmpDir: could not create prefix directory {}",
                    prefix.string());
        return nullptr;
    }

    std::string file_path;
    try {
        file_path = std::filesystem::weakly_canonical(prefix / kDirTemplate);
        // Create a temporary directory:
        if (mkdtemp(file_path.data()) == nullptr) {
            Logger::Log(LogLevel::Error,
                        "TmpDir: could not create directory in {}",
                        prefix.string());
            return nullptr;
        }
        return std::shared_ptr<TmpDir const>(new TmpDir(file_path));
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "TmpDir: creating directory in {} failed with:\n{}",
                    prefix.string(),
                    ex.what());
        if (not file_path.empty()) {
            rmdir(file_path.c_str());
        }
    }
    return nullptr;
}

TmpDir::~TmpDir() noexcept {
    // try to remove the tmp dir and all its content
    if (not FileSystemManager::RemoveDirectory(tmp_dir_,
                                               /*recursively=*/true)) {
        Logger::Log(LogLevel::Debug,
                    "TmpDir: could not remove {}",
                    tmp_dir_.string());
    }
}
