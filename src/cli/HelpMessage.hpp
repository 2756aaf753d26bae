/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef shipyard_cli_HelpMessage_hpp
#define shipyard_cli_HelpMessage_hpp

#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>


namespace shipyard {
namespace cli {

/**
 * Help text of a command: usage line, description, positional arguments,
 * options and examples. Empty sections are omitted.
 */
class HelpMessage {
    friend std::ostream& operator<<(std::ostream&, const HelpMessage&);

public:
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& addArgument(const std::string& name, const std::string& description);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);
    HelpMessage& addExample(const std::string&);

private:
    std::string usage;
    std::string description;
    std::vector<std::pair<std::string, std::string>> arguments;
    std::shared_ptr<const boost::program_options::options_description> optionsDescription;
    std::vector<std::string> examples;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
