/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_cli_CommandHelp_hpp
#define shipyard_cli_CommandHelp_hpp

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>

#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libshipyard/CLIArguments.hpp"
#include "libshipyard/Error.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace shipyard {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libshipyard::CLIArguments& args, std::shared_ptr<common::Config>) {
        if(args.argc() > 1) {
            auto message = boost::format("Command 'help' takes no options");
            utility::printLog(message, libshipyard::LogLevel::GENERAL, std::cerr);
            SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::INFO);
        }
    }

    void execute() override {
        std::cout << "Usage: shipyard [OPTIONS] COMMAND\n\n"
                  << cli::CLI{}.getOptionsDescription()
                  << "\nCommands:\n";

        auto summaries = CommandObjectsFactory{}.getCommandSummaries();
        auto width = std::size_t{0};
        for(const auto& summary : summaries) {
            width = std::max(width, summary.first.size());
        }
        for(const auto& summary : summaries) {
            std::cout << "  " << std::left << std::setw(width + 2) << summary.first << summary.second << "\n";
        }
        std::cout << "\nRun 'shipyard help COMMAND' for more information on a command\n";
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("shipyard help [COMMAND]")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }
};

}
}

#endif
