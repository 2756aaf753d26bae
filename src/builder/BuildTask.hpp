/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_builder_BuildTask_hpp
#define shipyard_builder_BuildTask_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "builder/TaskHooks.hpp"
#include "libshipyard/PathRAII.hpp"
#include "progress/LogBuffer.hpp"
#include "renderer/Renderer.hpp"


namespace shipyard {
namespace builder {

/**
 * Unit of work of a single service, consumed once by the scheduler.
 * External tasks pull imageName, the others build buildArchive.
 */
struct BuildTask {
    std::string serviceName;
    bool external = false;
    std::string imageName;
    // relative to the project directory
    boost::filesystem::path context;
    libshipyard::PathRAII buildArchive;
    rapidjson::Document dockerOptions{ rapidjson::kObjectType };
    boost::optional<std::string> tag;
    std::string dockerfile;
    std::string projectType;
    // set when the build context cannot be built, reported as the failure of the task
    boost::optional<std::string> resolutionError;

    boost::optional<renderer::ServiceStream> logStream;
    std::shared_ptr<progress::LogBuffer> logBuffer;
    std::shared_ptr<LocalBuildHook> streamHook;
    std::shared_ptr<PullHook> progressHook;
};

}
}

#endif
