/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_builder_BuildTaskFactory_hpp
#define shipyard_builder_BuildTaskFactory_hpp

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "builder/BuildTask.hpp"
#include "builder/ImageDescriptor.hpp"
#include "common/Config.hpp"
#include "libshipyard/LogLevel.hpp"


namespace shipyard {
namespace builder {

struct ProjectType {
    std::string dockerfile;
    std::string description;
};

/**
 * Determines which Dockerfile of a build context is used. An explicit dockerfile
 * wins, then the device-specific "Dockerfile.<deviceType>", the architecture-specific
 * "Dockerfile.<architecture>" and finally the plain "Dockerfile".
 */
ProjectType resolveProjectType(const std::set<std::string>& files,
                               const std::string& architecture,
                               const std::string& deviceType,
                               const boost::optional<std::string>& dockerfile = boost::none);

/**
 * Makes the build tasks of a project out of the archive of the whole project
 * directory. The entries below the context of a build are re-rooted into a
 * per-service archive.
 */
class BuildTaskFactory {
public:
    BuildTaskFactory(std::shared_ptr<const common::Config> config);
    std::vector<BuildTask> makeBuildTasks(const Project& project,
                                          const boost::filesystem::path& projectArchive,
                                          const std::string& architecture,
                                          const std::string& deviceType,
                                          const boost::optional<std::string>& dockerfilePath = boost::none) const;

private:
    void makeBuildContext(BuildTask& task,
                          const BuildSpecification& build,
                          const boost::filesystem::path& projectArchive,
                          const std::string& architecture,
                          const std::string& deviceType,
                          const boost::optional<std::string>& dockerfilePath) const;
    std::set<std::string> extractContext(const boost::filesystem::path& projectArchive,
                                         const std::string& prefix,
                                         const boost::filesystem::path& destination) const;
    void printLog(const boost::format& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    const std::string sysname = "BuildTaskFactory";
};

// Archive entry prefix of a build context, empty for the project root
std::string getContextPrefix(const boost::filesystem::path& context);

}
}

#endif
