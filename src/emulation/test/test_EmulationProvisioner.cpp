/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "emulation/EmulationProvisioner.hpp"
#include "libshipyard/Utility.hpp"
#include "test_utility/config.hpp"
#include "test_utility/FakeArchiveFetcher.hpp"
#include "test_utility/FakeDaemon.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace emulation {
namespace test {

using test_utility::emulation::FakeArchiveFetcher;

TEST_GROUP(EmulationProvisionerTestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    std::shared_ptr<FakeArchiveFetcher> fetcher = std::make_shared<FakeArchiveFetcher>();
    test_utility::daemon::FakeDaemon daemon;

    EmulationProvisioner makeProvisioner() {
        return EmulationProvisioner{configRAII.config, fetcher};
    }
};

TEST(EmulationProvisionerTestGroup, architectureMapping) {
    CHECK_EQUAL(toEmulatorArchitecture("armv7hf"), std::string{"arm"});
    CHECK_EQUAL(toEmulatorArchitecture("rpi"), std::string{"arm"});
    CHECK_EQUAL(toEmulatorArchitecture("armhf"), std::string{"arm"});
    CHECK_EQUAL(toEmulatorArchitecture("aarch64"), std::string{"aarch64"});
    CHECK_THROWS(libshipyard::Error, toEmulatorArchitecture("amd64"));
    CHECK_THROWS(libshipyard::Error, toEmulatorArchitecture("i386"));
    CHECK_THROWS(libshipyard::Error, toEmulatorArchitecture(""));
}

TEST(EmulationProvisionerTestGroup, desktopDaemonsEmulateOnTheirOwn) {
    auto provisioner = makeProvisioner();
    CHECK(provisioner.needsEmulation(daemon));

    daemon.daemonInfo.operatingSystem = "Docker Desktop";
    CHECK(!provisioner.needsEmulation(daemon));

    daemon.daemonInfo.operatingSystem = "docker for mac";
    CHECK(!provisioner.needsEmulation(daemon));

    daemon.daemonInfo.operatingSystem = "Docker Desktop";
    CHECK(!provisioner.installIfNeeded(true, "rpi", daemon));
    CHECK(fetcher->urls.empty());
}

TEST(EmulationProvisionerTestGroup, nothingIsInstalledWithoutEmulation) {
    auto provisioner = makeProvisioner();
    CHECK(!provisioner.installIfNeeded(false, "rpi", daemon));
    CHECK_EQUAL(daemon.infoCalls, 1);
    CHECK(fetcher->urls.empty());
}

TEST(EmulationProvisionerTestGroup, installIsIdempotent) {
    auto provisioner = makeProvisioner();
    CHECK(provisioner.installIfNeeded(true, "rpi", daemon));
    CHECK(provisioner.installIfNeeded(true, "rpi", daemon));

    CHECK_EQUAL(fetcher->urls.size(), 1);
    CHECK_EQUAL(fetcher->urls[0], std::string{"https://emulator.test/download/v4.0.0%2Bbalena2/qemu-4.0.0.balena2-arm.tar.gz"});

    auto emulator = provisioner.getEmulatorPath("rpi");
    CHECK(emulator == configRAII.config->directories.bin / "qemu-execve-rpi-v4.0.0+balena2");
    CHECK_EQUAL(libshipyard::filesystem::readFile(emulator), std::string{"arm emulator"});
    CHECK_EQUAL(libshipyard::filesystem::getPermissions(emulator), 0755);
    CHECK(!boost::filesystem::exists(emulator.string() + ".lock"));
}

TEST(EmulationProvisionerTestGroup, unknownArchitectureFailsFast) {
    auto provisioner = makeProvisioner();
    CHECK_THROWS(libshipyard::Error, provisioner.installIfNeeded(true, "amd64", daemon));
    CHECK(fetcher->urls.empty());
}

TEST(EmulationProvisionerTestGroup, archiveWithoutEmulator) {
    fetcher->isBinaryIncluded = false;
    auto provisioner = makeProvisioner();
    CHECK_THROWS(libshipyard::Error, provisioner.install("armv7hf"));
    CHECK(!boost::filesystem::exists(provisioner.getEmulatorPath("armv7hf")));
}

TEST(EmulationProvisionerTestGroup, downloadUrl) {
    auto provisioner = makeProvisioner();
    CHECK_EQUAL(provisioner.getDownloadUrl("aarch64"),
                std::string{"https://emulator.test/download/v4.0.0%2Bbalena2/qemu-4.0.0.balena2-aarch64.tar.gz"});
}

TEST(EmulationProvisionerTestGroup, copyToContext) {
    auto provisioner = makeProvisioner();
    provisioner.install("rpi");

    auto context = configRAII.rootDirectory / "project/frontend";
    libshipyard::filesystem::createFoldersIfNecessary(context);

    auto path = provisioner.copyToContext(context, "rpi");
    CHECK_EQUAL(path, std::string{".shipyard/qemu-execve"});
    CHECK_EQUAL(pathInContext(context), path);
    CHECK_EQUAL(libshipyard::filesystem::readFile(context / path), std::string{"arm emulator"});
    CHECK_EQUAL(libshipyard::filesystem::getPermissions(context / path), 0755);
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
