/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_emulation_DockerfileTransposer_hpp
#define shipyard_emulation_DockerfileTransposer_hpp

#include <memory>
#include <string>
#include <sys/types.h>

#include <boost/filesystem.hpp>
#include <boost/regex.hpp>

#include "common/Config.hpp"
#include "emulation/EmulationProvisioner.hpp"
#include "libshipyard/PathRAII.hpp"


namespace shipyard {
namespace emulation {

struct TransposeOptions {
    // emulator location inside the build context, in POSIX form
    std::string hostEmulatorPath;
    std::string containerEmulatorPath = emulation::containerEmulatorPath;
    mode_t emulatorFileMode = 0555;
    // local copy of the emulator, added to archives that lack hostEmulatorPath
    boost::filesystem::path emulatorBinary;
    std::string dockerfile = "Dockerfile";
};

/**
 * Rewrites a build so that every RUN instruction is executed through the
 * emulator. The emulator is copied into each build stage right after its
 * FROM instruction.
 */
class DockerfileTransposer {
public:
    DockerfileTransposer(std::shared_ptr<const common::Config> config, const TransposeOptions& options);

    std::string transposeDockerfile(const std::string& dockerfile) const;
    libshipyard::PathRAII transposeArchive(const boost::filesystem::path& archive) const;

private:
    std::string transposeRun(const std::string& arguments) const;

private:
    std::shared_ptr<const common::Config> config;
    TransposeOptions options;
};

/**
 * Maps the transposed RUN instructions echoed by the daemon in its build
 * output back to the form the user wrote them in.
 */
class BuildOutputFilter {
public:
    BuildOutputFilter(const std::string& containerEmulatorPath);
    std::string filter(const std::string& line) const;

private:
    boost::regex transposedRunPattern;
};

// Serializes the string as a JSON string literal
std::string quoteJsonString(const std::string& value);

}
}

#endif
