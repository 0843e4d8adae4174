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

#include "src/contentgit/repository/session_environment.hpp"

#include <string>

#include "catch2/catch_test_macros.hpp"
#include "src/contentgit/file_system/file_system_manager.hpp"
#include "src/contentgit/repository/git_ops_types.hpp"
#include "src/contentgit/repository/repository_layout.hpp"
#include "test/utils/scratch_repo.hpp"

TEST_CASE("SSH command", "[session_environment]") {
    auto root = ScratchRepo::GetUniquePath("session");
    REQUIRE(FileSystemManager::CreateDirectory(root));
    auto layout = RepositoryLayout::Create(root);
    REQUIRE(layout);

    SECTION("without key file no identity is pinned") {
        auto env = SessionEnvironment::Compute(
            BaseEnvironment{}, *layout, CommitterIdentity{});
        CHECK_FALSE(env.has_identity);
        CHECK(env.ssh_command ==
              "ssh -o UserKnownHostsFile=/dev/null "
              "-o StrictHostKeyChecking=no");
        CHECK(env.ssh_command.find("-i ") == std::string::npos);
        CHECK(env.variables.at(SessionEnvironment::kSshCommandVar) ==
              env.ssh_command);
    }

    SECTION("with key file exactly that identity is used") {
        REQUIRE(FileSystemManager::WriteFile("key", layout->SshKeyPath()));
        auto env = SessionEnvironment::Compute(
            BaseEnvironment{}, *layout, CommitterIdentity{});
        CHECK(env.has_identity);
        CHECK(env.ssh_command.starts_with(
            "ssh -o UserKnownHostsFile=/dev/null "
            "-o StrictHostKeyChecking=no -o IdentitiesOnly=yes -i "));
        CHECK(env.ssh_command.find(layout->SshKeyPath().string()) !=
              std::string::npos);
        CHECK(env.ssh_command.ends_with(" -F /dev/null"));
    }

    SECTION("key path with spaces is quoted") {
        auto spaced_root = root / "with space";
        auto spaced = RepositoryLayout::Create(spaced_root);
        REQUIRE(spaced);
        REQUIRE(FileSystemManager::WriteFile("key", spaced->SshKeyPath()));
        auto env = SessionEnvironment::Compute(
            BaseEnvironment{}, *spaced, CommitterIdentity{});
        CHECK(env.ssh_command.find(
                  "-i '" + spaced->SshKeyPath().string() + "'") !=
              std::string::npos);
    }
}

TEST_CASE("Environment precedence", "[session_environment]") {
    auto root = ScratchRepo::GetUniquePath("session");
    REQUIRE(FileSystemManager::CreateDirectory(root));
    auto layout = RepositoryLayout::Create(root);
    REQUIRE(layout);

    SECTION("fallback committer is used if the environment names none") {
        auto env = SessionEnvironment::Compute(
            BaseEnvironment{
                BaseEnvironment::Variables{{"PATH", "/usr/bin"}}},
            *layout,
            CommitterIdentity{});
        CHECK(env.variables.at("PATH") == "/usr/bin");
        CHECK(env.variables.at(SessionEnvironment::kCommitterNameVar) ==
              "TinaCMS");
        CHECK(env.variables.at(SessionEnvironment::kCommitterEmailVar) ==
              "tina@tinacms.org");
    }

    SECTION("configured fallback committer") {
        auto env = SessionEnvironment::Compute(
            BaseEnvironment{},
            *layout,
            CommitterIdentity{.name = "Editor", .email = "editor@example.org"});
        CHECK(env.variables.at(SessionEnvironment::kCommitterNameVar) ==
              "Editor");
        CHECK(env.variables.at(SessionEnvironment::kCommitterEmailVar) ==
              "editor@example.org");
    }

    SECTION("ambient committer wins over the fallback") {
        auto env = SessionEnvironment::Compute(
            BaseEnvironment{BaseEnvironment::Variables{
                {"GIT_COMMITTER_NAME", "Operator"}}},
            *layout,
            CommitterIdentity{});
        CHECK(env.variables.at(SessionEnvironment::kCommitterNameVar) ==
              "Operator");
        CHECK(env.variables.at(SessionEnvironment::kCommitterEmailVar) ==
              "tina@tinacms.org");
    }

    SECTION("ambient SSH command never survives") {
        auto env = SessionEnvironment::Compute(
            BaseEnvironment{BaseEnvironment::Variables{
                {"GIT_SSH_COMMAND", "ssh -i /home/op/.ssh/key"}}},
            *layout,
            CommitterIdentity{});
        CHECK(env.variables.at(SessionEnvironment::kSshCommandVar) ==
              env.ssh_command);
        CHECK(env.ssh_command.find("/home/op") == std::string::npos);
    }
}

TEST_CASE("Base environment", "[session_environment]") {
    auto base = BaseEnvironment::FromProcess();
    CHECK(base.Get("TEST_TMPDIR"));
    CHECK_FALSE(base.Get("CONTENTGIT_SURELY_UNSET_VARIABLE"));

    auto explicit_base =
        BaseEnvironment{BaseEnvironment::Variables{{"A", "1"}}};
    CHECK(explicit_base.Get("A") == "1");
    CHECK(explicit_base.All().size() == 1);
}
