/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "libshipyard/CLIArguments.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"
#include "cli/CLI.hpp"
#include "cli/CommandBuild.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/CommandVersion.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"

using namespace shipyard;

namespace shipyard {
namespace cli {
namespace test {

TEST_GROUP(CLITestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();

    std::unique_ptr<cli::Command> generateCommandFromCLIArguments(const libshipyard::CLIArguments& args) {
        return cli::CLI{}.parseCommandLine(args, configRAII.config);
    }

    std::unique_ptr<cli::CommandBuild> generateCommandBuild(const libshipyard::CLIArguments& args) {
        auto command = cli::CommandObjectsFactory{}.makeCommandObject("build", args, configRAII.config);
        auto* build = dynamic_cast<cli::CommandBuild*>(command.get());
        CHECK(build != nullptr);
        command.release();
        return std::unique_ptr<cli::CommandBuild>{build};
    }
};

template<class ExpectedDynamicType>
void checkCommandDynamicType(const cli::Command& command) {
    CHECK(dynamic_cast<const ExpectedDynamicType*>(&command) != nullptr);
}

TEST(CLITestGroup, LogLevel) {
    auto& logger = libshipyard::Logger::getInstance();
    generateCommandFromCLIArguments({"shipyard"});
    CHECK(logger.getLevel() == libshipyard::LogLevel::WARN);

    generateCommandFromCLIArguments({"shipyard", "--verbose"});
    CHECK(logger.getLevel() == libshipyard::LogLevel::INFO);

    generateCommandFromCLIArguments({"shipyard", "--debug"});
    CHECK(logger.getLevel() == libshipyard::LogLevel::DEBUG);
}

TEST(CLITestGroup, CommandTypes) {
    auto command = generateCommandFromCLIArguments({"shipyard"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"shipyard", "help"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"shipyard", "--help"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"shipyard", "help", "build"});
    checkCommandDynamicType<cli::CommandHelpOfCommand>(*command);

    command = generateCommandFromCLIArguments({"shipyard", "build", "--arch", "armv7hf", "project.json"});
    checkCommandDynamicType<cli::CommandBuild>(*command);

    command = generateCommandFromCLIArguments({"shipyard", "version"});
    checkCommandDynamicType<cli::CommandVersion>(*command);

    command = generateCommandFromCLIArguments({"shipyard", "--version"});
    checkCommandDynamicType<cli::CommandVersion>(*command);
}

TEST(CLITestGroup, UnrecognizedCommandsAndOptions) {
    CHECK_THROWS(libshipyard::Error, generateCommandFromCLIArguments({"shipyard", "--arch", "build"}));
    CHECK_THROWS(libshipyard::Error, generateCommandFromCLIArguments({"shipyard", "---build"}));
    CHECK_THROWS(libshipyard::Error, generateCommandFromCLIArguments({"shipyard", "deploy"}));
    CHECK_THROWS(libshipyard::Error, generateCommandFromCLIArguments({"shipyard", "help", "deploy"}));
    CHECK_THROWS(libshipyard::Error, generateCommandFromCLIArguments({"shipyard", "help", "build", "extra"}));
    CHECK_THROWS(libshipyard::Error, generateCommandFromCLIArguments({"shipyard", "version", "--short"}));
}

TEST(CLITestGroup, CommandBuildDefaults) {
    auto command = generateCommandBuild({"build", "--arch", "armv7hf", "/project/shipyard.json"});
    const auto& parameters = command->getBuildParameters();

    CHECK_EQUAL(std::string{"/project/shipyard.json"}, command->getCompositionFile().string());
    CHECK_EQUAL(std::string{"/project"}, command->getProjectDirectory().string());
    CHECK(!command->getProjectName());
    CHECK_EQUAL(std::string{"armv7hf"}, parameters.architecture);
    CHECK_EQUAL(std::string{""}, parameters.deviceType);
    CHECK(!parameters.emulated);
    CHECK(!parameters.inlineLogs);
    CHECK(!parameters.convertEol);
    CHECK(!parameters.dockerfilePath);
    CHECK(parameters.ignoreMode == context::IgnoreMode::Legacy);
    CHECK_EQUAL(std::string{"{}"}, libshipyard::json::serialize(parameters.buildOptions));
}

TEST(CLITestGroup, CommandBuildOptions) {
    auto command = generateCommandBuild({
        "build",
        "-A", "aarch64",
        "--deviceType=raspberrypi4-64",
        "-e",
        "--logs",
        "-lG",
        "--dockerfile", "Dockerfile.custom",
        "-n", "MyApp",
        "-B", "A=1",
        "--buildArg", "B=x=y",
        "--cache-from", "myapp/main:latest",
        "--nocache",
        "--pull",
        "/project/shipyard.json",
        "/sources"});
    const auto& parameters = command->getBuildParameters();

    CHECK_EQUAL(std::string{"/sources"}, command->getProjectDirectory().string());
    CHECK_EQUAL(std::string{"MyApp"}, *command->getProjectName());
    CHECK_EQUAL(std::string{"aarch64"}, parameters.architecture);
    CHECK_EQUAL(std::string{"raspberrypi4-64"}, parameters.deviceType);
    CHECK(parameters.emulated);
    CHECK(parameters.inlineLogs);
    CHECK(parameters.convertEol);
    CHECK_EQUAL(std::string{"Dockerfile.custom"}, *parameters.dockerfilePath);
    CHECK(parameters.ignoreMode == context::IgnoreMode::DockerIgnoreOnly);
    CHECK_EQUAL(std::string{R"({"buildargs":{"A":"1","B":"x=y"},"cachefrom":["myapp/main:latest"],"nocache":true,"pull":true})"},
                libshipyard::json::serialize(parameters.buildOptions));
}

TEST(CLITestGroup, CommandBuildRelativePaths) {
    auto command = generateCommandBuild({"build", "--arch", "amd64", "shipyard.json"});
    auto expected = boost::filesystem::absolute("shipyard.json");
    CHECK_EQUAL(expected.string(), command->getCompositionFile().string());
    CHECK_EQUAL(expected.parent_path().string(), command->getProjectDirectory().string());
}

TEST(CLITestGroup, CommandBuildErrors) {
    // missing architecture
    CHECK_THROWS(libshipyard::Error, generateCommandBuild({"build", "shipyard.json"}));
    // missing composition
    CHECK_THROWS(libshipyard::Error, generateCommandBuild({"build", "--arch", "amd64"}));
    // too many positional arguments
    CHECK_THROWS(libshipyard::Error, generateCommandBuild({"build", "--arch", "amd64", "a.json", "dir", "extra"}));
    // malformed build argument
    CHECK_THROWS(libshipyard::Error, generateCommandBuild({"build", "--arch", "amd64", "-B", "NOVALUE", "a.json"}));
    CHECK_THROWS(libshipyard::Error, generateCommandBuild({"build", "--arch", "amd64", "--unknown", "a.json"}));
}

TEST(CLITestGroup, CommandVersionReport) {
    auto factory = cli::CommandObjectsFactory{};
    auto makeVersion = [&](const libshipyard::CLIArguments& args) {
        auto command = factory.makeCommandObject("version", args, configRAII.config);
        return dynamic_cast<cli::CommandVersion&>(*command).makeReport();
    };

    CHECK_EQUAL(std::string{SHIPYARD_VERSION}, makeVersion({}));
    CHECK_EQUAL(std::string{SHIPYARD_VERSION}, makeVersion({"version"}));
    CHECK_EQUAL(std::string{R"({"shipyard":")"} + SHIPYARD_VERSION + R"("})", makeVersion({"version", "--json"}));

    auto all = libshipyard::json::parse(makeVersion({"version", "-aj"}));
    CHECK_EQUAL(std::string{SHIPYARD_VERSION}, all["shipyard"].GetString());
    CHECK(all.HasMember("boost"));
    CHECK(all.HasMember("libarchive"));
    CHECK(all.HasMember("rapidjson"));

    CHECK(makeVersion({"version", "--all"}).find("shipyard:   " SHIPYARD_VERSION "\n") == 0);
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
