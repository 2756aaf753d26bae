/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef shipyard_cli_CommandObjectsFactory_hpp
#define shipyard_cli_CommandObjectsFactory_hpp

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"
#include "libshipyard/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace shipyard {
namespace cli {

/**
 * Registry of the shipyard commands by name. A command is created either from its
 * arguments, to be executed, or without arguments, to describe itself.
 */
class CommandObjectsFactory {
public:
    using CommandSummary = std::pair<std::string, std::string>;

public:
    CommandObjectsFactory();

    template<class CommandType>
    void addCommand(const std::string& commandName) {
        auto& registration = registry[commandName];
        registration.makeDescriber = []() {
            return std::unique_ptr<cli::Command>{new CommandType{}};
        };
        registration.makeRunnable = [](const libshipyard::CLIArguments& commandArgs, std::shared_ptr<common::Config> config) {
            return std::unique_ptr<cli::Command>{new CommandType{commandArgs, std::move(config)}};
        };
    }

    // Name and brief description of every command, ordered by name
    std::vector<CommandSummary> getCommandSummaries() const;

    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName) const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName,
                                                    const libshipyard::CLIArguments& commandArgs,
                                                    std::shared_ptr<common::Config> config) const;
    std::unique_ptr<cli::Command> makeCommandObjectHelpOfCommand(const std::string& commandName) const;

private:
    struct Registration {
        std::function<std::unique_ptr<cli::Command>()> makeDescriber;
        std::function<std::unique_ptr<cli::Command>(const libshipyard::CLIArguments&,
                                                    std::shared_ptr<common::Config>)> makeRunnable;
    };

    const Registration& findRegistration(const std::string& commandName) const;

private:
    std::map<std::string, Registration> registry;
};

}
}

#endif
