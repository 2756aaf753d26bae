/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include "libshipyard/Utility.hpp"

using namespace shipyard;

namespace test_utility {
namespace config {

ConfigRAII::ConfigRAII(ConfigRAII&& rhs)
    : config{std::move(rhs.config)}
    , rootDirectory{std::move(rhs.rootDirectory)}
{
    rhs.rootDirectory.clear();
}

ConfigRAII::~ConfigRAII() {
    if(!rootDirectory.empty()) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(rootDirectory, ec);
    }
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.rootDirectory = libshipyard::filesystem::makeUniquePathWithRandomSuffix("/tmp/shipyard-test");
    libshipyard::filesystem::createFoldersIfNecessary(raii.rootDirectory / "tmp");

    raii.config = std::make_shared<common::Config>();
    raii.config->directories.bin = raii.rootDirectory / "bin";
    raii.config->directories.temp = raii.rootDirectory / "tmp";
    raii.config->emulator.downloadBaseUrl = "https://emulator.test/download";

    return raii;
}

}
}
