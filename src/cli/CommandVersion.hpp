/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef shipyard_cli_CommandVersion_hpp
#define shipyard_cli_CommandVersion_hpp

#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <archive.h>
#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <boost/version.hpp>
#include <rapidjson/document.h>
#include <rapidjson/rapidjson.h>

#include "common/Config.hpp"
#include "libshipyard/CLIArguments.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace shipyard {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() {
        initializeOptionsDescription();
    }

    CommandVersion(const libshipyard::CLIArguments& args, std::shared_ptr<common::Config>) {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        libshipyard::Logger::getInstance().log(makeReport(), "CommandVersion", libshipyard::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Print the version of shipyard";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("shipyard version [OPTIONS]")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription)
            .addExample("shipyard version --all --json");
        std::cout << printer;
    }

// public for test purpose
public:
    std::string makeReport() const {
        auto versions = std::vector<std::pair<std::string, std::string>>{ {"shipyard", SHIPYARD_VERSION} };
        if(all) {
            versions.emplace_back("boost", BOOST_LIB_VERSION);
            versions.emplace_back("libarchive", archive_version_string());
            versions.emplace_back("rapidjson", RAPIDJSON_VERSION_STRING);
        }

        if(json) {
            auto document = rapidjson::Document{rapidjson::kObjectType};
            auto& allocator = document.GetAllocator();
            for(const auto& version : versions) {
                document.AddMember(rapidjson::Value{version.first.c_str(), allocator},
                                   rapidjson::Value{version.second.c_str(), allocator},
                                   allocator);
            }
            return libshipyard::json::serialize(document);
        }
        if(!all) {
            return versions.front().second;
        }
        auto report = std::string{};
        for(const auto& version : versions) {
            report += (boost::format("%-11s %s\n") % (version.first + ":") % version.second).str();
        }
        report.pop_back();
        return report;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("all,a", "Also print the versions of the libraries")
            ("json,j", "Print the versions as a JSON object");
    }

    void parseCommandArguments(const libshipyard::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of version command"), libshipyard::LogLevel::DEBUG);

        // "shipyard --version"
        if(args.empty()) {
            return;
        }

        libshipyard::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");

        try {
            auto values = boost::program_options::variables_map{};
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                    .options(optionsDescription)
                    .style(boost::program_options::command_line_style::unix_style)
                    .run(), values);
            boost::program_options::notify(values);
            all = values.count("all") > 0;
            json = values.count("json") > 0;
        }
        catch(const boost::program_options::error& e) {
            auto message = boost::format("%s\nSee 'shipyard help version'") % e.what();
            cli::utility::printLog(message, libshipyard::LogLevel::GENERAL, std::cerr);
            SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::INFO);
        }
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    bool all = false;
    bool json = false;
};

}
}

#endif
