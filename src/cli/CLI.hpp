/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_cli_CLI_hpp
#define shipyard_cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "libshipyard/CLIArguments.hpp"


namespace shipyard {
namespace cli {

class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libshipyard::CLIArguments&, std::shared_ptr<common::Config>) const;

// these methods are public for test purpose
public:
    const boost::program_options::options_description& getOptionsDescription() const;

private:
    boost::program_options::variables_map parseGlobalOptions(const libshipyard::CLIArguments& nameAndOptionArgs) const;
    void setLogLevel(const boost::program_options::variables_map&) const;
    std::unique_ptr<cli::Command> parseCommandHelpOfCommand(const libshipyard::CLIArguments&) const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
