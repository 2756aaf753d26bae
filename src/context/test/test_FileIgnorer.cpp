/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <boost/filesystem.hpp>

#include "context/FileIgnorer.hpp"
#include "libshipyard/PathRAII.hpp"
#include "libshipyard/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace context {
namespace test {

TEST_GROUP(FileIgnorerTestGroup) {
    libshipyard::PathRAII project{ libshipyard::filesystem::makeUniquePathWithRandomSuffix("/tmp/shipyard-ignore") };
};

TEST(FileIgnorerTestGroup, ignoreFileTypes) {
    auto legacy = ArchiveMatchIgnorer{project.getPath(), IgnoreMode::Legacy};
    CHECK(legacy.getIgnoreFileType(".dockerignore") == IgnoreFileType::DockerIgnore);
    CHECK(legacy.getIgnoreFileType(".gitignore") == IgnoreFileType::GitIgnore);
    CHECK(legacy.getIgnoreFileType("sub/.gitignore") == IgnoreFileType::GitIgnore);
    CHECK(legacy.getIgnoreFileType("sub/.dockerignore") == IgnoreFileType::None);
    CHECK(legacy.getIgnoreFileType("Dockerfile") == IgnoreFileType::None);

    auto dockerignoreOnly = ArchiveMatchIgnorer{project.getPath(), IgnoreMode::DockerIgnoreOnly};
    CHECK(dockerignoreOnly.getIgnoreFileType(".dockerignore") == IgnoreFileType::DockerIgnore);
    CHECK(dockerignoreOnly.getIgnoreFileType(".gitignore") == IgnoreFileType::None);
}

TEST(FileIgnorerTestGroup, lastMatchingPatternWins) {
    auto ignorer = ArchiveMatchIgnorer{project.getPath(), IgnoreMode::Legacy};
    ignorer.addPattern("*.md");
    ignorer.addPattern("!README.md");

    CHECK(!ignorer.filter("CHANGELOG.md"));
    CHECK(ignorer.filter("README.md"));
    CHECK(ignorer.filter("main.c"));
}

TEST(FileIgnorerTestGroup, gitignorePatternsAreRootedAtTheirDirectory) {
    libshipyard::filesystem::writeTextFile("\n# build output\nout/\n", project.getPath() / "service/.gitignore");

    auto ignorer = ArchiveMatchIgnorer{project.getPath(), IgnoreMode::Legacy};
    ignorer.addIgnoreFile("service/.gitignore", IgnoreFileType::GitIgnore);

    CHECK_EQUAL(ignorer.getPatterns().size(), 1);
    CHECK_EQUAL(ignorer.getPatterns()[0], std::string{"service/out"});
    CHECK(!ignorer.filter("service/out/binary"));
    CHECK(ignorer.filter("other/file"));
}

TEST(FileIgnorerTestGroup, dockerignoreOnlyDefaultPatterns) {
    auto ignorer = ArchiveMatchIgnorer{project.getPath(), IgnoreMode::DockerIgnoreOnly};
    ignorer.addPattern("*");

    CHECK(!ignorer.filter(".git/config"));
    CHECK(!ignorer.filter("src/main.c"));
    CHECK(ignorer.filter("Dockerfile"));
    CHECK(ignorer.filter("service/Dockerfile.aarch64"));
    CHECK(ignorer.filter("docker-compose.yml"));
    CHECK(ignorer.filter(".shipyard/qemu-execve"));
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
