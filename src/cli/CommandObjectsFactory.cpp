/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "CommandObjectsFactory.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "cli/CommandBuild.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandVersion.hpp"
#include "cli/Utility.hpp"


namespace shipyard {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandBuild>("build");
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandVersion>("version");
}

std::vector<CommandObjectsFactory::CommandSummary> CommandObjectsFactory::getCommandSummaries() const {
    auto summaries = std::vector<CommandSummary>{};
    for(const auto& entry : registry) {
        summaries.emplace_back(entry.first, entry.second.makeDescriber()->getBriefDescription());
    }
    return summaries;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    return findRegistration(commandName).makeDescriber();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libshipyard::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    return findRegistration(commandName).makeRunnable(commandArgs, std::move(config));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    return std::unique_ptr<cli::Command>{new cli::CommandHelpOfCommand{makeCommandObject(commandName)}};
}

const CommandObjectsFactory::Registration& CommandObjectsFactory::findRegistration(const std::string& commandName) const {
    auto it = registry.find(commandName);
    if(it == registry.cend()) {
        auto message = boost::format("'%s' is not a Shipyard command\nSee 'shipyard help'") % commandName;
        utility::printLog(message, libshipyard::LogLevel::GENERAL, std::cerr);
        SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::DEBUG);
    }
    return it->second;
}

}
}
