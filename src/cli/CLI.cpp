/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "CLI.hpp"

#include <iostream>
#include <string>
#include <tuple>

#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace shipyard {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print this help and quit")
        ("version", "Print the version of shipyard and quit")
        ("debug", "Log messages of level DEBUG and above")
        ("verbose", "Log messages of level INFO and above");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libshipyard::CLIArguments& args,
                                                    std::shared_ptr<common::Config> conf) const {
    libshipyard::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

    auto values = parseGlobalOptions(nameAndOptionArgs);
    setLogLevel(values);

    auto factory = cli::CommandObjectsFactory{};

    // --help and --version win over anything that follows
    if(values.count("help")) {
        return factory.makeCommandObject("help", libshipyard::CLIArguments{}, std::move(conf));
    }
    if(values.count("version")) {
        return factory.makeCommandObject("version", libshipyard::CLIArguments{}, std::move(conf));
    }
    if(positionalArgs.empty()) {
        return factory.makeCommandObject("help");
    }

    const auto& commandName = positionalArgs[0];
    if(commandName == "help" && positionalArgs.size() > 1) {
        return parseCommandHelpOfCommand(positionalArgs);
    }
    return factory.makeCommandObject(commandName, positionalArgs, std::move(conf));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

boost::program_options::variables_map CLI::parseGlobalOptions(const libshipyard::CLIArguments& nameAndOptionArgs) const {
    auto values = boost::program_options::variables_map{};
    try {
        auto parsed = boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
            .options(optionsDescription)
            .style(boost::program_options::command_line_style::unix_style)
            .run();
        boost::program_options::store(parsed, values);
        boost::program_options::notify(values);
    }
    catch(const boost::program_options::error& e) {
        auto message = boost::format("%s\nSee 'shipyard help'") % e.what();
        utility::printLog(message, libshipyard::LogLevel::GENERAL, std::cerr);
        SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::INFO);
    }
    return values;
}

void CLI::setLogLevel(const boost::program_options::variables_map& values) const {
    auto level = libshipyard::LogLevel::WARN;
    if(values.count("debug")) {
        level = libshipyard::LogLevel::DEBUG;
    }
    else if(values.count("verbose")) {
        level = libshipyard::LogLevel::INFO;
    }
    libshipyard::Logger::getInstance().setLevel(level);
}

// "help COMMAND": only the name of the command may follow
std::unique_ptr<cli::Command> CLI::parseCommandHelpOfCommand(const libshipyard::CLIArguments& args) const {
    auto commandArgs = libshipyard::CLIArguments{args.begin() + 1, args.end()};
    for(const auto& arg : commandArgs) {
        if(arg.size() > 1 && arg[0] == '-') {
            auto message = boost::format("Command 'help' takes no options\nSee 'shipyard help help'");
            utility::printLog(message, libshipyard::LogLevel::GENERAL, std::cerr);
            SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::INFO);
        }
    }
    utility::validateNumberOfPositionalArguments(commandArgs, 1, 1, "help");
    return cli::CommandObjectsFactory{}.makeCommandObjectHelpOfCommand(commandArgs[0]);
}

}
}
