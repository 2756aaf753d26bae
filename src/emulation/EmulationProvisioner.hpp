/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_emulation_EmulationProvisioner_hpp
#define shipyard_emulation_EmulationProvisioner_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "daemon/Daemon.hpp"
#include "emulation/ArchiveFetcher.hpp"
#include "libshipyard/LogLevel.hpp"


namespace shipyard {
namespace emulation {

const std::string emulatorBinaryName = "qemu-execve";
// hidden directory of a build context holding the emulator
const std::string contextBinDirectory = ".shipyard";
const std::string containerEmulatorPath = "/tmp/qemu-execve";

// Maps a device architecture to the emulator variant that runs its binaries
std::string toEmulatorArchitecture(const std::string& architecture);

// Location of the emulator binary relative to the build context, in POSIX form
std::string pathInContext(const boost::filesystem::path& context);

/**
 * Provides the static emulator binary needed to run foreign-architecture
 * binaries while building an image. Binaries are cached per architecture
 * and version in the configured bin directory.
 */
class EmulationProvisioner {
public:
    EmulationProvisioner(std::shared_ptr<const common::Config> config, std::shared_ptr<const ArchiveFetcher> fetcher);

    bool needsEmulation(const daemon::Daemon& daemon) const;
    bool installIfNeeded(bool emulated, const std::string& architecture, const daemon::Daemon& daemon) const;
    void install(const std::string& architecture) const;
    std::string copyToContext(const boost::filesystem::path& context, const std::string& architecture) const;
    boost::filesystem::path getEmulatorPath(const std::string& architecture) const;
    std::string getDownloadUrl(const std::string& architecture) const;

private:
    void printLog(const boost::format& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<const ArchiveFetcher> fetcher;
    const std::string sysname = "EmulationProvisioner";
};

}
}

#endif
