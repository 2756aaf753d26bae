/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"


#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace cli {
namespace utility {

namespace {

bool isShortOption(const std::string& token) {
    return token.size() > 1 && token[0] == '-' && token[1] != '-';
}

bool isLongOption(const std::string& token) {
    return token.size() > 2 && token.compare(0, 2, "--") == 0 && token[2] != '-';
}

bool takesValue(const boost::program_options::option_description& option) {
    return option.semantic()->max_tokens() > 0;
}

// Number of tokens, starting at index, that form one option together with its value
std::size_t countOptionTokens(const libshipyard::CLIArguments& args,
                              std::size_t index,
                              const boost::program_options::options_description& optionsDescription) {
    const auto& token = args[index];
    auto valueMayFollow = false;

    if(isLongOption(token)) {
        if(token.find('=') == std::string::npos) {
            const auto* option = optionsDescription.find_nothrow(token.substr(2), false);
            valueMayFollow = option && takesValue(*option);
        }
    }
    else {
        // sticky short options: the first one taking a value ends the token
        for(std::size_t i = 1; i < token.size(); ++i) {
            const auto* option = optionsDescription.find_nothrow(std::string{"-"} + token[i], false);
            if(!option) {
                break;
            }
            if(takesValue(*option)) {
                valueMayFollow = i + 1 == token.size();
                break;
            }
        }
    }

    auto next = index + 1;
    if(valueMayFollow && next < args.size() && !isShortOption(args[next]) && !isLongOption(args[next])) {
        return 2;
    }
    return 1;
}

}

/**
 * Splits a command line into the program or command name with its options, and the
 * positional arguments.
 *
 * The first group is meant for boost::program_options. The second group starts at the
 * first token that is neither an option nor an option value, and is passed unparsed to
 * the command named by its first token. Unknown options are kept in the first group
 * for boost to report them.
 *
 * Options follow the UNIX style of boost::program_options: long options with separate
 * or adjacent ('=') values, short options with separate or adjacent values, sticky
 * short options.
 *
 * E.g. "shipyard --verbose build --arch armv7hf project.json" gives
 * ("shipyard --verbose", "build --arch armv7hf project.json").
 */
std::tuple<libshipyard::CLIArguments, libshipyard::CLIArguments> groupOptionsAndPositionalArguments(
        const libshipyard::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {
    auto nameAndOptionArgs = libshipyard::CLIArguments{};
    auto positionalArgs = libshipyard::CLIArguments{};

    auto index = std::size_t{0};
    if(!args.empty()) {
        nameAndOptionArgs.push_back(args[0]);
        index = 1;
    }

    while(index < args.size()) {
        if(!isShortOption(args[index]) && !isLongOption(args[index])) {
            positionalArgs = libshipyard::CLIArguments{args.begin() + index, args.end()};
            break;
        }
        auto count = countOptionTokens(args, index, optionsDescription);
        for(std::size_t i = 0; i < count; ++i) {
            nameAndOptionArgs.push_back(args[index + i]);
        }
        index += count;
    }

    return std::make_tuple(nameAndOptionArgs, positionalArgs);
}

void validateNumberOfPositionalArguments(const libshipyard::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'shipyard help %s'") % quantity % command % command;
        printLog(message, libshipyard::LogLevel::GENERAL, std::cerr);
        SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::INFO);
    }
}

/**
 * Parses build arguments of the form KEY=VALUE. The value may be empty and may
 * contain further '=' characters. Later occurrences of a key override earlier ones.
 */
std::map<std::string, std::string> parseBuildArguments(const std::vector<std::string>& arguments) {
    auto buildArguments = std::map<std::string, std::string>{};
    for(const auto& argument : arguments) {
        auto separator = argument.find('=');
        if(separator == std::string::npos || separator == 0) {
            auto message = boost::format("Invalid build argument '%s': expected KEY=VALUE") % argument;
            SHIPYARD_THROW_ERROR(message.str());
        }
        auto kv = libshipyard::string::parseKeyValuePair(argument);
        buildArguments[kv.first] = kv.second;
    }
    return buildArguments;
}

void printLog(const std::string& message, libshipyard::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    auto systemName = "CLI";
    libshipyard::Logger::getInstance().log(message, systemName, LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libshipyard::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

} // namespace
} // namespace
} // namespace
