/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <iostream>
#include <memory>
#include <chrono>
#include <clocale>
#include <unistd.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "common/Config.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"
#include "cli/CLI.hpp"

using namespace shipyard;

static boost::optional<boost::filesystem::path> findConfigFile();

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    auto& logger = libshipyard::Logger::getInstance();
    logger.setColored(isatty(STDOUT_FILENO) && isatty(STDERR_FILENO));

    try {
        auto program_start = std::chrono::high_resolution_clock::now();

        auto configFile = findConfigFile();
        auto config = configFile ? std::make_shared<common::Config>(*configFile)
                                 : std::make_shared<common::Config>();
        config->program_start = program_start;

        auto args = libshipyard::CLIArguments(argv, argv + argc);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libshipyard::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libshipyard::LogLevel::ERROR);
        return 1;
    }

    return 0;
}

/**
 * The configuration file is taken from SHIPYARD_CONFIG_FILE if set,
 * otherwise from $HOME/.shipyard/config.json if it exists.
 */
static boost::optional<boost::filesystem::path> findConfigFile() {
    if(auto file = libshipyard::environment::getOptionalVariable("SHIPYARD_CONFIG_FILE")) {
        return boost::filesystem::path{*file};
    }
    auto home = libshipyard::environment::getOptionalVariable("HOME");
    if(home) {
        auto file = boost::filesystem::path{*home} / ".shipyard/config.json";
        if(boost::filesystem::exists(file)) {
            return file;
        }
    }
    return boost::none;
}
