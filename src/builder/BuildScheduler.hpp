/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_builder_BuildScheduler_hpp
#define shipyard_builder_BuildScheduler_hpp

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "builder/BuildTask.hpp"
#include "builder/BuiltImage.hpp"
#include "builder/ImageDescriptor.hpp"
#include "common/Config.hpp"
#include "context/FileIgnorer.hpp"
#include "daemon/Daemon.hpp"
#include "emulation/ArchiveFetcher.hpp"
#include "emulation/EmulationProvisioner.hpp"
#include "libshipyard/LogLevel.hpp"
#include "renderer/Renderer.hpp"
#include "renderer/Terminal.hpp"


namespace shipyard {
namespace builder {

struct BuildParameters {
    std::string architecture;
    std::string deviceType;
    // the target is emulated by the host, i.e. foreign binaries need an emulator
    bool emulated = false;
    // members of the daemon's build API, merged into the options of every build
    rapidjson::Document buildOptions{ rapidjson::kObjectType };
    bool inlineLogs = false;
    bool convertEol = false;
    boost::optional<std::string> dockerfilePath;
    context::IgnoreMode ignoreMode = context::IgnoreMode::Legacy;
};

/**
 * Builds the images of all the services of a project concurrently, one worker
 * per service, rendering their progress live.
 */
class BuildScheduler {
public:
    BuildScheduler(std::shared_ptr<const common::Config> config,
                   std::shared_ptr<const daemon::Daemon> daemon,
                   std::shared_ptr<const emulation::ArchiveFetcher> fetcher,
                   std::shared_ptr<renderer::Terminal> terminal);

    /**
     * Returns one built image per descriptor, in the order of the descriptors.
     * Descriptors lacking a tag get the default tag assigned.
     * Throws ServiceBuildError as soon as the build of a service failed.
     */
    std::vector<BuiltImage> buildProject(Project& project, const BuildParameters& parameters) const;

private:
    struct TaskResult {
        bool successful = false;
        std::exception_ptr error;
        std::chrono::system_clock::time_point startTime;
        std::chrono::system_clock::time_point endTime;
    };

    std::unique_ptr<renderer::Renderer> makeRenderer(const Project& project, bool inlineLogs) const;
    void provisionEmulation(const Project& project, const std::string& architecture) const;
    void prepareTask(BuildTask& task,
                     ImageDescriptor& descriptor,
                     const Project& project,
                     const BuildParameters& parameters,
                     renderer::Renderer& renderer,
                     bool needsEmulation) const;
    TaskResult runTask(BuildTask& task) const;
    BuiltImage makeBuiltImage(const BuildTask& task, const ImageDescriptor& descriptor, const TaskResult& result) const;
    void printLog(const boost::format& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<const daemon::Daemon> daemon;
    std::shared_ptr<renderer::Terminal> terminal;
    emulation::EmulationProvisioner provisioner;
    const std::string sysname = "BuildScheduler";
};

// Default tag of the image of a service: <project>_<service>, lower-cased
std::string makeDefaultTag(const std::string& projectName, const std::string& serviceName);

[[noreturn]] void throwServiceBuildError(const std::string& serviceName, std::exception_ptr error);

}
}

#endif
