/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "HelpMessage.hpp"

#include <algorithm>
#include <iomanip>


namespace shipyard {
namespace cli {

HelpMessage& HelpMessage::setUsage(const std::string& usage) {
    this->usage = usage;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& description) {
    this->description = description;
    return *this;
}

HelpMessage& HelpMessage::addArgument(const std::string& name, const std::string& description) {
    arguments.emplace_back(name, description);
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& optionsDescription) {
    // options_description can be copy constructed, not assigned
    this->optionsDescription = std::make_shared<const boost::program_options::options_description>(optionsDescription);
    return *this;
}

HelpMessage& HelpMessage::addExample(const std::string& example) {
    examples.push_back(example);
    return *this;
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& help) {
    os << "Usage: " << help.usage << "\n\n" << help.description << "\n";

    if(!help.arguments.empty()) {
        auto width = std::size_t{0};
        for(const auto& argument : help.arguments) {
            width = std::max(width, argument.first.size());
        }
        os << "\nArguments:\n";
        for(const auto& argument : help.arguments) {
            os << "  " << std::left << std::setw(width + 2) << argument.first << argument.second << "\n";
        }
    }

    if(help.optionsDescription && !help.optionsDescription->options().empty()) {
        os << "\n" << *help.optionsDescription;
    }

    if(!help.examples.empty()) {
        os << "\nExamples:\n";
        for(const auto& example : help.examples) {
            os << "  $ " << example << "\n";
        }
    }
    return os;
}

}
}
