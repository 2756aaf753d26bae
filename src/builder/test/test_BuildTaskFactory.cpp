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
#include <set>
#include <string>

#include <boost/filesystem.hpp>

#include "builder/BuildTaskFactory.hpp"
#include "context/Archive.hpp"
#include "libshipyard/Utility.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace builder {
namespace test {

namespace {

std::map<std::string, std::string> readArchive(const boost::filesystem::path& archive) {
    auto files = std::map<std::string, std::string>{};
    auto reader = context::ArchiveReader{archive};
    auto entry = context::ArchiveEntry{};
    while(reader.nextEntry(entry)) {
        files[entry.name] = entry.data;
    }
    return files;
}

}

TEST_GROUP(BuildTaskFactoryTestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
};

TEST(BuildTaskFactoryTestGroup, projectType) {
    auto files = std::set<std::string>{"Dockerfile", "Dockerfile.armv7hf", "Dockerfile.raspberrypi3", "custom.Dockerfile"};

    auto type = resolveProjectType(files, "armv7hf", "raspberrypi3");
    CHECK_EQUAL(type.dockerfile, std::string{"Dockerfile.raspberrypi3"});
    CHECK_EQUAL(type.description, std::string{"Device-specific Dockerfile"});

    type = resolveProjectType(files, "armv7hf", "fincm3");
    CHECK_EQUAL(type.dockerfile, std::string{"Dockerfile.armv7hf"});
    CHECK_EQUAL(type.description, std::string{"Architecture-specific Dockerfile"});

    type = resolveProjectType(files, "aarch64", "jetson-nano");
    CHECK_EQUAL(type.dockerfile, std::string{"Dockerfile"});
    CHECK_EQUAL(type.description, std::string{"Standard Dockerfile"});

    type = resolveProjectType(files, "armv7hf", "raspberrypi3", std::string{"custom.Dockerfile"});
    CHECK_EQUAL(type.dockerfile, std::string{"custom.Dockerfile"});
    CHECK_EQUAL(type.description, std::string{"Standard Dockerfile"});

    CHECK_THROWS(libshipyard::Error, resolveProjectType(files, "armv7hf", "raspberrypi3", std::string{"missing"}));
    CHECK_THROWS(libshipyard::Error, resolveProjectType({"package.json"}, "armv7hf", "raspberrypi3"));
}

TEST(BuildTaskFactoryTestGroup, contextPrefix) {
    CHECK_EQUAL(getContextPrefix("."), std::string{""});
    CHECK_EQUAL(getContextPrefix("./"), std::string{""});
    CHECK_EQUAL(getContextPrefix(""), std::string{""});
    CHECK_EQUAL(getContextPrefix("frontend"), std::string{"frontend/"});
    CHECK_EQUAL(getContextPrefix("./frontend/"), std::string{"frontend/"});
    CHECK_EQUAL(getContextPrefix("services/../frontend/app"), std::string{"frontend/app/"});
    CHECK_THROWS(libshipyard::Error, getContextPrefix("../outside"));
    CHECK_THROWS(libshipyard::Error, getContextPrefix("/absolute"));
}

TEST(BuildTaskFactoryTestGroup, makeBuildTasks) {
    auto projectArchive = configRAII.rootDirectory / "project.tar";
    {
        auto writer = context::ArchiveWriter{projectArchive};
        writer.addEntry(context::ArchiveEntry{"Dockerfile", "FROM alpine\n"});
        writer.addEntry(context::ArchiveEntry{"frontend/Dockerfile", "FROM node\n"});
        writer.addEntry(context::ArchiveEntry{"frontend/src/index.js", "console.log(1)\n", 0755});
        writer.addEntry(context::ArchiveEntry{"frontend-v2/Dockerfile", "FROM node:20\n"});
        writer.addEntry(context::ArchiveEntry{"backend/Dockerfile.armv7hf", "FROM arm32v7/python\n"});
        writer.finalize();
    }

    auto composition = libshipyard::json::parse(R"({
        "name": "myapp",
        "services": {
            "root": { "build": "." },
            "frontend": { "build": "frontend", "image": "myapp/frontend" },
            "backend": { "build": "./backend" },
            "broken": { "build": "missing" },
            "db": { "image": "postgres:15" }
        }
    })");
    auto project = makeProject(configRAII.rootDirectory, composition);

    auto tasks = BuildTaskFactory{configRAII.config}.makeBuildTasks(project, projectArchive, "armv7hf", "raspberrypi3");
    CHECK_EQUAL(tasks.size(), 5u);

    const auto& root = tasks[0];
    CHECK_EQUAL(root.serviceName, std::string{"root"});
    CHECK(!root.external);
    CHECK(!root.tag);
    CHECK_EQUAL(root.dockerfile, std::string{"Dockerfile"});
    CHECK_EQUAL(root.projectType, std::string{"Standard Dockerfile"});
    CHECK_EQUAL(readArchive(root.buildArchive.getPath()).size(), 5u);

    const auto& frontend = tasks[1];
    CHECK_EQUAL(*frontend.tag, std::string{"myapp/frontend"});
    auto frontendFiles = readArchive(frontend.buildArchive.getPath());
    CHECK_EQUAL(frontendFiles.size(), 2u);
    CHECK_EQUAL(frontendFiles["Dockerfile"], std::string{"FROM node\n"});
    CHECK_EQUAL(frontendFiles["src/index.js"], std::string{"console.log(1)\n"});
    CHECK(!frontend.dockerOptions.HasMember("dockerfile"));

    const auto& backend = tasks[2];
    CHECK_EQUAL(backend.dockerfile, std::string{"Dockerfile.armv7hf"});
    CHECK_EQUAL(backend.projectType, std::string{"Architecture-specific Dockerfile"});
    CHECK_EQUAL(std::string{backend.dockerOptions["dockerfile"].GetString()}, std::string{"Dockerfile.armv7hf"});

    const auto& broken = tasks[3];
    CHECK(broken.resolutionError);

    const auto& db = tasks[4];
    CHECK(db.external);
    CHECK_EQUAL(db.imageName, std::string{"postgres:15"});
    CHECK(!db.buildArchive.hasPath());
}

TEST(BuildTaskFactoryTestGroup, explicitDockerfile) {
    auto projectArchive = configRAII.rootDirectory / "project.tar";
    {
        auto writer = context::ArchiveWriter{projectArchive};
        writer.addEntry(context::ArchiveEntry{"Dockerfile", "FROM alpine\n"});
        writer.addEntry(context::ArchiveEntry{"Dockerfile.debug", "FROM alpine\nRUN apk add gdb\n"});
        writer.finalize();
    }
    auto project = makeProject(configRAII.rootDirectory, libshipyard::json::parse(R"({"services": {"main": {"build": "."}}})"));

    auto tasks = BuildTaskFactory{configRAII.config}.makeBuildTasks(project, projectArchive, "amd64", "intel-nuc",
                                                                    std::string{"Dockerfile.debug"});
    CHECK_EQUAL(tasks[0].dockerfile, std::string{"Dockerfile.debug"});
    CHECK_EQUAL(tasks[0].projectType, std::string{"Standard Dockerfile"});
    CHECK_EQUAL(std::string{tasks[0].dockerOptions["dockerfile"].GetString()}, std::string{"Dockerfile.debug"});
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
