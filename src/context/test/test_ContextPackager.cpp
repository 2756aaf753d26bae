/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <map>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "context/Archive.hpp"
#include "context/ContextPackager.hpp"
#include "context/eolConversion.hpp"
#include "libshipyard/PathRAII.hpp"
#include "libshipyard/Utility.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace context {
namespace test {

static std::map<std::string, ArchiveEntry> readEntries(const boost::filesystem::path& archive) {
    auto entries = std::map<std::string, ArchiveEntry>{};
    auto reader = ArchiveReader{archive};
    auto entry = ArchiveEntry{};
    while(reader.nextEntry(entry)) {
        entries[entry.name] = entry;
    }
    return entries;
}

TEST_GROUP(ContextPackagerTestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    libshipyard::PathRAII project{ libshipyard::filesystem::makeUniquePathWithRandomSuffix("/tmp/shipyard-project") };

    void createFile(const std::string& relativePath, const std::string& content) {
        libshipyard::filesystem::writeTextFile(content, project.getPath() / relativePath);
    }
};

TEST(ContextPackagerTestGroup, packagesFilesWithPosixPaths) {
    createFile("Dockerfile", "FROM alpine\n");
    createFile("src/main.c", "int main() { return 0; }\n");
    createFile("src/lib/util.h", "#pragma once\n");
    libshipyard::filesystem::setPermissions(project.getPath() / "src/main.c", 0755);

    auto packager = ContextPackager{configRAII.config};
    auto archive = packager.packageContext(project.getPath(), PackageOptions{});

    auto entries = readEntries(archive.getPath());
    CHECK_EQUAL(entries.size(), 3);
    CHECK_EQUAL(entries["Dockerfile"].data, std::string{"FROM alpine\n"});
    CHECK_EQUAL(entries["src/lib/util.h"].data, std::string{"#pragma once\n"});
    CHECK_EQUAL(entries["src/main.c"].mode, 0755);
}

TEST(ContextPackagerTestGroup, legacyModeHonorsDockerignoreAndGitignore) {
    createFile("Dockerfile", "FROM alpine\n");
    createFile(".dockerignore", "# comment\n*.log\n");
    createFile("app/.gitignore", "build\n");
    createFile("app/build/output.o", "binary");
    createFile("app/main.c", "code");
    createFile("debug.log", "log");

    auto warnedDockerignore = std::vector<boost::filesystem::path>{};
    auto warnedGitignore = std::vector<boost::filesystem::path>{};
    int warningCalls = 0;

    auto options = PackageOptions{};
    options.ignoreFileWarning = [&](const std::vector<boost::filesystem::path>& dockerignoreFiles,
                                    const std::vector<boost::filesystem::path>& gitignoreFiles) {
        ++warningCalls;
        warnedDockerignore = dockerignoreFiles;
        warnedGitignore = gitignoreFiles;
    };

    auto packager = ContextPackager{configRAII.config};
    auto archive = packager.packageContext(project.getPath(), options);

    CHECK_EQUAL(warningCalls, 1);
    CHECK_EQUAL(warnedDockerignore.size(), 1);
    CHECK(warnedDockerignore[0] == project.getPath() / ".dockerignore");
    CHECK_EQUAL(warnedGitignore.size(), 1);
    CHECK(warnedGitignore[0] == project.getPath() / "app/.gitignore");

    auto entries = readEntries(archive.getPath());
    CHECK(entries.count("Dockerfile") == 1);
    CHECK(entries.count("app/main.c") == 1);
    CHECK(entries.count("app/build/output.o") == 0);
    CHECK(entries.count("debug.log") == 0);
}

TEST(ContextPackagerTestGroup, dockerignoreOnlyModeSkipsGitignoreAndWarning) {
    createFile("Dockerfile", "FROM alpine\n");
    createFile(".dockerignore", "Dockerfile\nsecret.txt\n");
    createFile(".gitignore", "app\n");
    createFile(".git/HEAD", "ref: refs/heads/master\n");
    createFile("app/main.c", "code");
    createFile("secret.txt", "secret");

    int warningCalls = 0;
    auto options = PackageOptions{};
    options.ignoreMode = IgnoreMode::DockerIgnoreOnly;
    options.ignoreFileWarning = [&warningCalls](const std::vector<boost::filesystem::path>&,
                                                const std::vector<boost::filesystem::path>&) {
        ++warningCalls;
    };

    auto packager = ContextPackager{configRAII.config};
    auto archive = packager.packageContext(project.getPath(), options);

    CHECK_EQUAL(warningCalls, 0);
    auto entries = readEntries(archive.getPath());
    CHECK(entries.count("app/main.c") == 1);
    CHECK(entries.count("secret.txt") == 0);
    CHECK(entries.count(".git/HEAD") == 0);
    // Dockerfiles are always sent to the daemon
    CHECK(entries.count("Dockerfile") == 1);
}

TEST(ContextPackagerTestGroup, preFinalizeHookIsCalledOnce) {
    createFile("Dockerfile", "FROM alpine\n");

    int calls = 0;
    auto options = PackageOptions{};
    options.preFinalize = [&calls](ArchiveWriter& writer) {
        ++calls;
        CHECK(writer.hasEntry("Dockerfile"));
        auto entry = ArchiveEntry{};
        entry.name = "injected.txt";
        entry.data = "injected";
        writer.addEntry(entry);
    };

    auto packager = ContextPackager{configRAII.config};
    auto archive = packager.packageContext(project.getPath(), options);

    CHECK_EQUAL(calls, 1);
    auto entries = readEntries(archive.getPath());
    CHECK_EQUAL(entries["injected.txt"].data, std::string{"injected"});
}

TEST(ContextPackagerTestGroup, convertsLineEndingsOnEolPlatform) {
    createFile("script.sh", "echo one\r\necho two\r\n");
    createFile("image.bin", std::string{"\r\n\0\r\n", 5});

    auto options = PackageOptions{};
    options.convertEol = true;
    options.isEolConversionPlatform = []() { return true; };

    auto packager = ContextPackager{configRAII.config};
    auto archive = packager.packageContext(project.getPath(), options);

    auto entries = readEntries(archive.getPath());
    CHECK_EQUAL(entries["script.sh"].data, std::string{"echo one\necho two\n"});
    CHECK_EQUAL(entries["image.bin"].data.size(), 5);
}

TEST(ContextPackagerTestGroup, keepsLineEndingsOutsideEolPlatform) {
    createFile("script.sh", "echo one\r\n");

    auto options = PackageOptions{};
    options.convertEol = true;
    options.isEolConversionPlatform = []() { return false; };

    auto packager = ContextPackager{configRAII.config};
    auto archive = packager.packageContext(project.getPath(), options);

    auto entries = readEntries(archive.getPath());
    CHECK_EQUAL(entries["script.sh"].data, std::string{"echo one\r\n"});
}

TEST(ContextPackagerTestGroup, failsOnMissingDirectory) {
    auto packager = ContextPackager{configRAII.config};
    CHECK_THROWS(libshipyard::Error, packager.packageContext(project.getPath() / "missing", PackageOptions{}));
}

TEST(ContextPackagerTestGroup, archiveIsRemovedWithHandle) {
    createFile("Dockerfile", "FROM alpine\n");
    auto packager = ContextPackager{configRAII.config};
    auto path = boost::filesystem::path{};
    {
        auto archive = packager.packageContext(project.getPath(), PackageOptions{});
        path = archive.getPath();
        CHECK(boost::filesystem::exists(path));
    }
    CHECK(!boost::filesystem::exists(path));
}

TEST(ContextPackagerTestGroup, eolHelpers) {
    CHECK(isBinaryContent(std::string{"a\0b", 3}));
    CHECK(!isBinaryContent("text\r\n"));
    CHECK_EQUAL(convertCrlfToLf("a\r\nb\r\n"), std::string{"a\nb\n"});
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
