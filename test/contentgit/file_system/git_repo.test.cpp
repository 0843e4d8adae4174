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

#include "src/contentgit/file_system/git_repo.hpp"

#include <memory>
#include <optional>
#include <string>

#include "catch2/catch_test_macros.hpp"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "test/utils/scratch_repo.hpp"

namespace {

[[nodiscard]] auto MakeLogger(bool* fatal_seen) -> GitRepo::anon_logger_ptr {
    return std::make_shared<GitRepo::anon_logger_t>(
        [fatal_seen](auto const& /*msg*/, bool fatal) {
            if (fatal) {
                *fatal_seen = true;
            }
        });
}

}  // namespace

TEST_CASE("Open repository", "[git_repo]") {
    SECTION("working-copy root") {
        auto path = ScratchRepo::CreateEmpty();
        REQUIRE(path);
        auto repo = GitRepo::Open(*path);
        REQUIRE(repo);
        CHECK(repo->GetPath() == *path);
    }

    SECTION("no upwards search from subdirectory") {
        auto path = ScratchRepo::CreateEmpty();
        REQUIRE(path);
        REQUIRE(FileSystemManager::CreateDirectory(*path / "sub"));
        CHECK_FALSE(GitRepo::Open(*path / "sub"));
    }

    SECTION("plain directory") {
        auto path = ScratchRepo::GetUniquePath("plain");
        REQUIRE(FileSystemManager::CreateDirectory(path));
        CHECK_FALSE(GitRepo::Open(path));
    }
}

TEST_CASE("Current branch", "[git_repo]") {
    bool fatal{false};
    auto logger = MakeLogger(&fatal);

    SECTION("unborn branch") {
        auto path = ScratchRepo::CreateEmpty();
        REQUIRE(path);
        auto repo = GitRepo::Open(*path);
        REQUIRE(repo);
        auto branch = repo->GetCurrentBranch(logger);
        REQUIRE(branch);
        CHECK(*branch == "main");
    }

    SECTION("branch with commits") {
        auto path = ScratchRepo::CreateWithCommit("a.md", "a\n");
        REQUIRE(path);
        REQUIRE(ScratchRepo::Git(*path, "checkout -q -b feature/edit"));
        auto repo = GitRepo::Open(*path);
        REQUIRE(repo);
        auto branch = repo->GetCurrentBranch(logger);
        REQUIRE(branch);
        CHECK(*branch == "feature/edit");
    }

    SECTION("detached HEAD") {
        auto path = ScratchRepo::CreateWithCommit("a.md", "a\n");
        REQUIRE(path);
        REQUIRE(ScratchRepo::Git(*path, "checkout -q --detach"));
        auto repo = GitRepo::Open(*path);
        REQUIRE(repo);
        auto branch = repo->GetCurrentBranch(logger);
        REQUIRE(branch);
        CHECK(*branch == "HEAD");
    }
    CHECK_FALSE(fatal);
}

TEST_CASE("Read blob at HEAD", "[git_repo]") {
    bool fatal{false};
    auto logger = MakeLogger(&fatal);

    auto path = ScratchRepo::CreateWithCommit("content/post.md", "committed\n");
    REQUIRE(path);
    REQUIRE(FileSystemManager::WriteFile("modified\n",
                                         *path / "content/post.md"));
    REQUIRE(FileSystemManager::WriteFile("new\n", *path / "content/new.md"));
    auto repo = GitRepo::Open(*path);
    REQUIRE(repo);

    SECTION("tracked file yields committed content") {
        auto content = repo->ReadBlobAtHead("content/post.md", logger);
        REQUIRE(content);
        CHECK(*content == "committed\n");
    }

    SECTION("untracked file") {
        CHECK_FALSE(repo->ReadBlobAtHead("content/new.md", logger));
    }

    SECTION("directory is no blob") {
        CHECK_FALSE(repo->ReadBlobAtHead("content", logger));
    }
    CHECK_FALSE(fatal);

    SECTION("no HEAD yet") {
        auto empty = ScratchRepo::CreateEmpty();
        REQUIRE(empty);
        auto empty_repo = GitRepo::Open(*empty);
        REQUIRE(empty_repo);
        CHECK_FALSE(empty_repo->ReadBlobAtHead("content/post.md", logger));
    }
}

TEST_CASE("List remotes", "[git_repo]") {
    bool fatal{false};
    auto logger = MakeLogger(&fatal);

    auto path = ScratchRepo::CreateEmpty();
    REQUIRE(path);

    SECTION("no remotes") {
        auto repo = GitRepo::Open(*path);
        REQUIRE(repo);
        auto remotes = repo->GetRemotes(logger);
        REQUIRE(remotes);
        CHECK(remotes->empty());
    }

    SECTION("push URL falls back to URL") {
        REQUIRE(ScratchRepo::Git(
            *path, "remote add origin git@example.org:owner/site.git"));
        REQUIRE(ScratchRepo::Git(
            *path, "remote add mirror https://example.org/owner/site.git"));
        REQUIRE(ScratchRepo::Git(
            *path,
            "remote set-url --push mirror git@example.org:owner/mirror.git"));
        auto repo = GitRepo::Open(*path);
        REQUIRE(repo);
        auto remotes = repo->GetRemotes(logger);
        REQUIRE(remotes);
        REQUIRE(remotes->size() == 2);
        for (auto const& remote : *remotes) {
            if (remote.name == "origin") {
                CHECK(remote.url == "git@example.org:owner/site.git");
                CHECK(remote.push_url == remote.url);
            }
            else {
                CHECK(remote.name == "mirror");
                CHECK(remote.url == "https://example.org/owner/site.git");
                CHECK(remote.push_url == "git@example.org:owner/mirror.git");
            }
        }
    }
    CHECK_FALSE(fatal);
}
