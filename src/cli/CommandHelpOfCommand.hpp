/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_cli_CommandHelpOfCommand_hpp
#define shipyard_cli_CommandHelpOfCommand_hpp

#include <memory>

#include "cli/Command.hpp"


namespace shipyard {
namespace cli {

class CommandHelpOfCommand : public Command {
public:
    explicit CommandHelpOfCommand(std::unique_ptr<cli::Command> command)
        : command(std::move(command))
    {}

    void execute() override {
        command->printHelpMessage();
    }

    std::string getBriefDescription() const override {
        return command->getBriefDescription();
    }

    void printHelpMessage() const override {
        command->printHelpMessage();
    }

private:
    std::unique_ptr<cli::Command> command;
};

}
}

#endif
