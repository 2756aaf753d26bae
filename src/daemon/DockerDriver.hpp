/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_daemon_DockerDriver_hpp
#define shipyard_daemon_DockerDriver_hpp

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "common/Config.hpp"
#include "daemon/Daemon.hpp"
#include "libshipyard/CLIArguments.hpp"
#include "libshipyard/LogLevel.hpp"


namespace shipyard {
namespace daemon {

/**
 * Daemon implementation that drives the docker command line tool.
 */
class DockerDriver : public Daemon {
public:
    DockerDriver(std::shared_ptr<const common::Config> config);

    DaemonInfo info() const override;
    void build(const boost::filesystem::path& contextArchive,
               const rapidjson::Value& options,
               const OutputHandler& outputHandler) const override;
    void pull(const std::string& image, const ProgressHandler& progressHandler) const override;
    std::size_t inspectImageSize(const std::string& image) const override;
    void tagImage(const std::string& image, const std::string& repository, const std::string& tag) const override;
    std::string pushImage(const std::string& reference,
                          const std::string& registryToken,
                          const ProgressHandler& progressHandler) const override;
    void removeImage(const std::string& reference) const override;

private:
    std::vector<std::string> runAndCollectOutput(const libshipyard::CLIArguments& args) const;
    void runAndForwardProgress(const libshipyard::CLIArguments& args, const ProgressHandler& progressHandler,
                               std::vector<std::string>& outputLines) const;
    void writeRegistryTokenConfig(const boost::filesystem::path& configDirectory,
                                  const std::string& reference, const std::string& registryToken) const;
    void printLog(const boost::format& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void printLog(const std::string& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    std::string dockerPath;
    const std::string sysname = "DockerDriver";
};

// Translates the daemon's build API options into "docker build" arguments
libshipyard::CLIArguments makeBuildArguments(const rapidjson::Value& options);
// Parses one line of "docker pull/push" output into a progress event
rapidjson::Document parseProgressLine(const std::string& line);
// Extracts the manifest digest from the output of "docker push"
std::string parsePushDigest(const std::vector<std::string>& outputLines);
// Name of the registry that hosts the image reference, "docker.io" if none is specified
std::string getRegistryOfReference(const std::string& reference);

}
}

#endif
