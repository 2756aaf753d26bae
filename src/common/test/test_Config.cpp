/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "libshipyard/PathRAII.hpp"
#include "libshipyard/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace common {
namespace test {

TEST_GROUP(ConfigTestGroup) {
    libshipyard::PathRAII configDir{ libshipyard::filesystem::makeUniquePathWithRandomSuffix("/tmp/shipyard-config-test") };
    boost::filesystem::path configFile = configDir.getPath() / "shipyard.json";
};

TEST(ConfigTestGroup, defaults) {
    libshipyard::environment::setVariable("HOME", "/home/tester");
    auto config = Config{};

    CHECK(config.directories.bin == boost::filesystem::path{"/home/tester/.shipyard/bin"});
    CHECK(config.directories.temp == boost::filesystem::path{"/tmp"});
    CHECK_EQUAL(config.dockerPath, std::string{"docker"});
    CHECK_EQUAL(config.emulator.version, std::string{"v4.0.0+balena2"});
    CHECK_EQUAL(config.emulator.downloadBaseUrl, std::string{"https://github.com/balena-io/qemu/releases/download"});
    CHECK_EQUAL(config.push.maxAttempts, 3);
    CHECK(config.push.initialDelay == std::chrono::milliseconds{2000});
    DOUBLES_EQUAL(config.push.backoffScaler, 1.4, 1e-9);
}

TEST(ConfigTestGroup, fromFile) {
    libshipyard::filesystem::writeTextFile(R"({
        "binDirectory": "/opt/shipyard/bin",
        "dockerPath": "/usr/local/bin/docker",
        "emulator": { "version": "v5.0.0+balena1" },
        "push": { "maxAttempts": 5, "initialDelayMs": 10, "backoffScaler": 2.0 }
    })", configFile);

    auto config = Config{configFile};

    CHECK(config.directories.bin == boost::filesystem::path{"/opt/shipyard/bin"});
    CHECK_EQUAL(config.dockerPath, std::string{"/usr/local/bin/docker"});
    CHECK_EQUAL(config.emulator.version, std::string{"v5.0.0+balena1"});
    CHECK_EQUAL(config.emulator.downloadBaseUrl, std::string{"https://github.com/balena-io/qemu/releases/download"});
    CHECK_EQUAL(config.push.maxAttempts, 5);
    CHECK(config.push.initialDelay == std::chrono::milliseconds{10});
    DOUBLES_EQUAL(config.push.backoffScaler, 2.0, 1e-9);
}

TEST(ConfigTestGroup, invalidValues) {
    libshipyard::filesystem::writeTextFile(R"({ "push": { "maxAttempts": 0 } })", configFile);
    CHECK_THROWS(libshipyard::Error, Config{configFile});

    libshipyard::filesystem::writeTextFile(R"({ "dockerPath": 42 })", configFile);
    CHECK_THROWS(libshipyard::Error, Config{configFile});

    libshipyard::filesystem::writeTextFile(R"({ "tempDirectory": "/non-existing-shipyard-dir" })", configFile);
    CHECK_THROWS(libshipyard::Error, Config{configFile});

    libshipyard::filesystem::writeTextFile("[1, 2]", configFile);
    CHECK_THROWS(libshipyard::Error, Config{configFile});

    CHECK_THROWS(libshipyard::Error, Config{configDir.getPath() / "missing.json"});
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
