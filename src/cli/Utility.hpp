/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_cli_Utility_hpp
#define shipyard_cli_Utility_hpp

#include <iostream>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libshipyard/CLIArguments.hpp"
#include "libshipyard/LogLevel.hpp"


namespace shipyard {
namespace cli {
namespace utility {

std::tuple<libshipyard::CLIArguments, libshipyard::CLIArguments> groupOptionsAndPositionalArguments(
        const libshipyard::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void validateNumberOfPositionalArguments(const libshipyard::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

std::map<std::string, std::string> parseBuildArguments(const std::vector<std::string>& arguments);

void printLog(  const std::string& message, libshipyard::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libshipyard::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
