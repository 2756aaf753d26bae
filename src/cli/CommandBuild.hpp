/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_cli_CommandBuild_hpp
#define shipyard_cli_CommandBuild_hpp

#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <rapidjson/document.h>

#include "common/Config.hpp"
#include "libshipyard/CLIArguments.hpp"
#include "libshipyard/Error.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"
#include "builder/BuildScheduler.hpp"
#include "builder/ImageDescriptor.hpp"
#include "context/FileIgnorer.hpp"
#include "daemon/DockerDriver.hpp"
#include "emulation/ArchiveFetcher.hpp"
#include "renderer/Terminal.hpp"


namespace shipyard {
namespace cli {

class CommandBuild : public Command {
public:
    CommandBuild() {
        initializeOptionsDescription();
    }

    CommandBuild(const libshipyard::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto project = builder::readProject(projectDirectory, compositionFile, projectName);
        cli::utility::printLog(boost::format("Building project %s in %s") % project.name % project.directory,
                               libshipyard::LogLevel::INFO);

        auto dockerDriver = std::make_shared<daemon::DockerDriver>(conf);
        auto fetcher = std::make_shared<emulation::HttpArchiveFetcher>(conf);
        auto terminal = std::make_shared<renderer::AnsiTerminal>();
        auto scheduler = builder::BuildScheduler{conf, dockerDriver, fetcher, terminal};
        auto images = scheduler.buildProject(project, parameters);

        for(const auto& image : images) {
            cli::utility::printLog(boost::format("Service %s: image %s") % image.serviceName % image.name,
                                   libshipyard::LogLevel::INFO);
        }
    }

    std::string getBriefDescription() const override {
        return "Build the images of the services of a project";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("shipyard build [OPTIONS] COMPOSITION [DIRECTORY]")
            .setDescription(getBriefDescription())
            .addArgument("COMPOSITION", "JSON file listing the services of the project")
            .addArgument("DIRECTORY", "root of the build contexts, defaults to the directory of COMPOSITION")
            .setOptionsDescription(optionsDescription)
            .addExample("shipyard build --arch armv7hf project.json")
            .addExample("shipyard build -A aarch64 -d raspberrypi4-64 --emulated project.json src")
            .addExample("shipyard build -A amd64 -B VERSION=1.2 --nocache --logs project.json");
        std::cout << printer;
    }

// these methods are public for test purpose
public:
    const boost::filesystem::path& getCompositionFile() const {
        return compositionFile;
    }

    const boost::filesystem::path& getProjectDirectory() const {
        return projectDirectory;
    }

    const boost::optional<std::string>& getProjectName() const {
        return projectName;
    }

    const builder::BuildParameters& getBuildParameters() const {
        return parameters;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("arch,A",
                boost::program_options::value<std::string>(&parameters.architecture)->required(),
                "Architecture of the target device, e.g. armv7hf")
            ("deviceType,d",
                boost::program_options::value<std::string>(&parameters.deviceType),
                "Type of the target device, e.g. raspberrypi3")
            ("emulated,e", "Run the builds of foreign architectures in an emulator")
            ("dockerfile",
                boost::program_options::value<std::string>(&dockerfile),
                "Alternative Dockerfile name or path, relative to the build context of each service")
            ("projectName,n",
                boost::program_options::value<std::string>(&name),
                "Name of the project, defaults to the name of the composition or of DIRECTORY")
            ("logs", "Print the build logs of the services inline")
            ("convert-eol,l", "Convert line endings from CRLF to LF in the build contexts")
            ("nogitignore,G", "Only honor the .dockerignore file at the root of the project directory")
            ("buildArg,B",
                boost::program_options::value<std::vector<std::string>>(&buildArguments)->composing(),
                "Build argument KEY=VALUE passed to the builds of all services (may be repeated)")
            ("cache-from",
                boost::program_options::value<std::vector<std::string>>(&cacheFrom)->composing(),
                "Image to consider as cache source (may be repeated)")
            ("nocache", "Do not use the build cache")
            ("pull", "Always attempt to pull a newer version of the base images")
            ("squash", "Squash the layers of the built images");
    }

    void parseCommandArguments(const libshipyard::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of build command"), libshipyard::LogLevel::DEBUG);

        libshipyard::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the build command expects the composition file and optionally the project directory
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 2, "build");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            compositionFile = boost::filesystem::absolute(positionalArgs[0]);
            if(positionalArgs.argc() > 1) {
                projectDirectory = boost::filesystem::absolute(positionalArgs[1]);
            }
            else {
                projectDirectory = compositionFile.parent_path();
            }

            if(values.count("projectName")) {
                projectName = name;
            }
            if(values.count("dockerfile")) {
                parameters.dockerfilePath = dockerfile;
            }
            parameters.emulated = values.count("emulated");
            parameters.inlineLogs = values.count("logs");
            parameters.convertEol = values.count("convert-eol");
            parameters.ignoreMode = values.count("nogitignore") ? context::IgnoreMode::DockerIgnoreOnly
                                                                : context::IgnoreMode::Legacy;
            makeBuildOptions(values);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'shipyard help build'") % e.what();
            cli::utility::printLog(message, libshipyard::LogLevel::GENERAL, std::cerr);
            SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libshipyard::LogLevel::DEBUG);
    }

    void makeBuildOptions(const boost::program_options::variables_map& values) {
        auto& options = parameters.buildOptions;
        auto& allocator = options.GetAllocator();

        if(!buildArguments.empty()) {
            auto buildargs = rapidjson::Value{rapidjson::kObjectType};
            for(const auto& kv : cli::utility::parseBuildArguments(buildArguments)) {
                buildargs.AddMember(rapidjson::Value{kv.first.c_str(), allocator},
                                    rapidjson::Value{kv.second.c_str(), allocator},
                                    allocator);
            }
            options.AddMember("buildargs", buildargs, allocator);
        }
        if(!cacheFrom.empty()) {
            auto cachefrom = rapidjson::Value{rapidjson::kArrayType};
            for(const auto& image : cacheFrom) {
                cachefrom.PushBack(rapidjson::Value{image.c_str(), allocator}, allocator);
            }
            options.AddMember("cachefrom", cachefrom, allocator);
        }
        for(const auto* flag : {"nocache", "pull", "squash"}) {
            if(values.count(flag)) {
                options.AddMember(rapidjson::StringRef(flag), true, allocator);
            }
        }
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    boost::filesystem::path compositionFile;
    boost::filesystem::path projectDirectory;
    boost::optional<std::string> projectName;
    builder::BuildParameters parameters;
    std::string name;
    std::string dockerfile;
    std::vector<std::string> buildArguments;
    std::vector<std::string> cacheFrom;
};

}
}

#endif
