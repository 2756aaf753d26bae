/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_common_Config_hpp
#define shipyard_common_Config_hpp

#include <string>
#include <chrono>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace shipyard {
namespace common {

/**
 * Settings of the pipeline. Values are read from an optional JSON file, any
 * missing key falls back to its default:
 *
 * {
 *     "binDirectory": "$HOME/.shipyard/bin",
 *     "tempDirectory": "/tmp",
 *     "dockerPath": "docker",
 *     "emulator": {
 *         "version": "v4.0.0+balena2",
 *         "downloadBaseUrl": "https://github.com/balena-io/qemu/releases/download"
 *     },
 *     "push": { "maxAttempts": 3, "initialDelayMs": 2000, "backoffScaler": 1.4 }
 * }
 */
class Config {
    public:
        Config();
        Config(const boost::filesystem::path& configFilename);

        struct Directories {
            boost::filesystem::path bin;
            boost::filesystem::path temp;
        };

        struct Emulator {
            std::string version = "v4.0.0+balena2";
            std::string downloadBaseUrl = "https://github.com/balena-io/qemu/releases/download";
        };

        struct Push {
            unsigned int maxAttempts = 3;
            std::chrono::milliseconds initialDelay{ 2000 };
            double backoffScaler = 1.4;
        };

        boost::filesystem::path makeTemporaryPath(const std::string& prefix) const;

        Directories directories;
        Emulator emulator;
        Push push;
        std::string dockerPath = "docker";
        rapidjson::Document json{ rapidjson::kObjectType };

        std::chrono::high_resolution_clock::time_point program_start; // for time measurement

    private:
        void initialize();
};

}
}

#endif
