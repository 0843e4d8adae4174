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

#include "src/contentgit/repository/repository_layout.hpp"

#include <filesystem>

#include "catch2/catch_test_macros.hpp"

TEST_CASE("Create layout", "[repository_layout]") {
    SECTION("content at the root") {
        auto layout = RepositoryLayout::Create("/srv/site/");
        REQUIRE(layout);
        CHECK(layout->Root() == "/srv/site");
        CHECK(layout->ContentDirectory().empty());
        CHECK(layout->ContentRoot() == "/srv/site");
        CHECK(layout->TmpDir() == "/srv/site/tmp");
        CHECK(layout->SshKeyPath() == "/srv/site/.ssh/id_rsa");
    }

    SECTION("content subdirectory") {
        auto layout = RepositoryLayout::Create("/srv/site", "content/./");
        REQUIRE(layout);
        CHECK(layout->ContentDirectory() == "content");
        CHECK(layout->ContentRoot() == "/srv/site/content");
        CHECK(layout->TmpDir() == "/srv/site/content/tmp");
        CHECK(layout->SshKeyPath() == "/srv/site/.ssh/id_rsa");
    }

    SECTION("dot content directory is the root") {
        auto layout = RepositoryLayout::Create("/srv/site", ".");
        REQUIRE(layout);
        CHECK(layout->ContentDirectory().empty());
    }

    SECTION("invalid layouts") {
        CHECK_FALSE(RepositoryLayout::Create(""));
        CHECK_FALSE(RepositoryLayout::Create("srv/site"));
        CHECK_FALSE(RepositoryLayout::Create("/srv/site", "/content"));
        CHECK_FALSE(RepositoryLayout::Create("/srv/site", "../content"));
        CHECK_FALSE(RepositoryLayout::Create("/srv/site", ".ssh"));
        CHECK_FALSE(RepositoryLayout::Create("/srv/site", ".ssh/keys"));
    }
}

TEST_CASE("Map content paths", "[repository_layout]") {
    auto layout = RepositoryLayout::Create("/srv/site", "content");
    REQUIRE(layout);

    SECTION("relative file") {
        auto rel = layout->ToRootRelative("posts/hello.md");
        REQUIRE(rel);
        CHECK(*rel == "content/posts/hello.md");
        auto abs = layout->FileAbsolutePath("posts/./hello.md");
        REQUIRE(abs);
        CHECK(*abs == "/srv/site/content/posts/hello.md");
    }

    SECTION("paths leaving the content root") {
        CHECK_FALSE(layout->ToRootRelative(""));
        CHECK_FALSE(layout->ToRootRelative("."));
        CHECK_FALSE(layout->ToRootRelative("/etc/passwd"));
        CHECK_FALSE(layout->ToRootRelative("../README.md"));
        CHECK_FALSE(layout->ToRootRelative("posts/../../README.md"));
        CHECK_FALSE(layout->FileAbsolutePath("../.ssh/id_rsa"));
    }

    SECTION("credential directory is never a content path") {
        auto root_layout = RepositoryLayout::Create("/srv/site");
        REQUIRE(root_layout);
        CHECK_FALSE(root_layout->ToRootRelative(".ssh/id_rsa"));
        CHECK_FALSE(root_layout->ToRootRelative(".ssh"));
        CHECK_FALSE(root_layout->ToRootRelative("posts/../.ssh/id_rsa"));
        CHECK(root_layout->ToRootRelative(".sshrc"));
    }
}
