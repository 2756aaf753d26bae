/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "EmulationProvisioner.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/regex.hpp>

#include "context/Archive.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Lockfile.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/PathRAII.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace emulation {

std::string toEmulatorArchitecture(const std::string& architecture) {
    if(architecture == "armv7hf" || architecture == "rpi" || architecture == "armhf") {
        return "arm";
    }
    else if(architecture == "aarch64") {
        return "aarch64";
    }
    auto message = boost::format("Cannot install emulator for architecture %s") % architecture;
    SHIPYARD_THROW_ERROR(message.str());
}

std::string pathInContext(const boost::filesystem::path& context) {
    return (boost::filesystem::path{contextBinDirectory} / emulatorBinaryName).generic_string();
}

EmulationProvisioner::EmulationProvisioner(std::shared_ptr<const common::Config> config,
                                           std::shared_ptr<const ArchiveFetcher> fetcher)
    : config{std::move(config)}
    , fetcher{std::move(fetcher)}
{}

/**
 * Docker Desktop (and the older Docker for Mac) registers binfmt_misc handlers
 * on its own, so the daemon emulates foreign architectures without our help.
 */
bool EmulationProvisioner::needsEmulation(const daemon::Daemon& daemon) const {
    static const boost::regex desktopPattern{"(?:Docker Desktop)|(?:Docker for Mac)", boost::regex::icase};

    auto info = daemon.info();
    if(boost::regex_search(info.operatingSystem, desktopPattern)) {
        printLog(boost::format("Docker Desktop detected (daemon architecture: \"%s\")\n"
                               "  Docker itself will determine and enable architecture emulation if required,\n"
                               "  regardless of the --emulated option.") % info.architecture,
                 libshipyard::LogLevel::GENERAL);
        return false;
    }
    return true;
}

bool EmulationProvisioner::installIfNeeded(bool emulated, const std::string& architecture,
                                           const daemon::Daemon& daemon) const {
    // queried even when no emulation was requested, for the information it logs
    auto isEmulationNeeded = needsEmulation(daemon);
    if(!emulated || !isEmulationNeeded) {
        return false;
    }

    auto emulatorPath = getEmulatorPath(architecture);
    auto lock = libshipyard::Lockfile{emulatorPath};
    if(!boost::filesystem::exists(emulatorPath)) {
        printLog(boost::format("Installing qemu for %s emulation...") % architecture, libshipyard::LogLevel::GENERAL);
        install(architecture);
    }
    else {
        printLog(boost::format("Found emulator %s") % emulatorPath, libshipyard::LogLevel::DEBUG);
    }
    return true;
}

void EmulationProvisioner::install(const std::string& architecture) const {
    auto emulatorArchitecture = toEmulatorArchitecture(architecture);
    auto url = getDownloadUrl(architecture);
    auto emulatorPath = getEmulatorPath(architecture);

    auto downloadPath = config->makeTemporaryPath("shipyard-emulator");
    downloadPath += ".tar.gz";
    auto download = libshipyard::PathRAII{downloadPath};
    try {
        fetcher->fetch(url, download.getPath());
    }
    catch(libshipyard::Error& e) {
        auto message = boost::format("Failed to download emulator for architecture %s") % architecture;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }

    auto binaryName = "qemu-" + emulatorArchitecture + "-static";
    auto entry = context::ArchiveEntry{};
    bool isFound = false;
    try {
        auto reader = context::ArchiveReader{download.getPath()};
        while(reader.nextEntry(entry)) {
            if(entry.name.find(binaryName) != std::string::npos) {
                isFound = true;
                break;
            }
        }
    }
    catch(libshipyard::Error& e) {
        auto message = boost::format("Failed to extract emulator from %s") % url;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }
    if(!isFound) {
        auto message = boost::format("Emulator archive %s does not contain %s") % url % binaryName;
        SHIPYARD_THROW_ERROR(message.str());
    }

    // the binary is renamed into place once complete
    auto partial = libshipyard::PathRAII{libshipyard::filesystem::makeUniquePathWithRandomSuffix(emulatorPath)};
    libshipyard::filesystem::writeTextFile(entry.data, partial.getPath(), std::ios_base::out | std::ios_base::binary);
    libshipyard::filesystem::setPermissions(partial.getPath(), 0755);
    boost::filesystem::rename(partial.getPath(), emulatorPath);
    partial.release();

    printLog(boost::format("Installed emulator %s") % emulatorPath, libshipyard::LogLevel::INFO);
}

std::string EmulationProvisioner::copyToContext(const boost::filesystem::path& context, const std::string& architecture) const {
    auto binDirectory = context / contextBinDirectory;
    auto binPath = binDirectory / emulatorBinaryName;

    try {
        libshipyard::filesystem::createFoldersIfNecessary(binDirectory);
        libshipyard::filesystem::copyFile(getEmulatorPath(architecture), binPath);
        libshipyard::filesystem::setPermissions(binPath, 0755);
    }
    catch(libshipyard::Error& e) {
        auto message = boost::format("Failed to copy emulator into build context %s") % context;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }

    printLog(boost::format("Copied emulator to %s") % binPath, libshipyard::LogLevel::DEBUG);
    return pathInContext(context);
}

boost::filesystem::path EmulationProvisioner::getEmulatorPath(const std::string& architecture) const {
    libshipyard::filesystem::createFoldersIfNecessary(config->directories.bin);
    auto fileName = boost::format("%s-%s-%s") % emulatorBinaryName % architecture % config->emulator.version;
    return config->directories.bin / fileName.str();
}

std::string EmulationProvisioner::getDownloadUrl(const std::string& architecture) const {
    auto emulatorArchitecture = toEmulatorArchitecture(architecture);

    auto fileVersion = config->emulator.version;
    if(boost::starts_with(fileVersion, "v")) {
        fileVersion.erase(0, 1);
    }
    auto plus = fileVersion.find('+');
    if(plus != std::string::npos) {
        fileVersion[plus] = '.';
    }

    auto fileName = boost::format("qemu-%s-%s.tar.gz") % fileVersion % emulatorArchitecture;
    return config->emulator.downloadBaseUrl
        + "/" + libshipyard::string::urlEncode(config->emulator.version)
        + "/" + libshipyard::string::urlEncode(fileName.str());
}

void EmulationProvisioner::printLog(const boost::format& message, libshipyard::LogLevel level,
                                    std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
