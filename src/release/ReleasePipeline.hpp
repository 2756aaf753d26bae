/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_release_ReleasePipeline_hpp
#define shipyard_release_ReleasePipeline_hpp

#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "builder/BuiltImage.hpp"
#include "common/Config.hpp"
#include "daemon/Daemon.hpp"
#include "libshipyard/LogLevel.hpp"
#include "release/ImageLocation.hpp"
#include "release/PushProgress.hpp"
#include "release/ReleaseBackend.hpp"
#include "release/ReleaseRecords.hpp"
#include "release/Retry.hpp"
#include "renderer/Terminal.hpp"


namespace shipyard {
namespace release {

struct DeployParameters {
    std::int64_t applicationId = 0;
    std::int64_t userId = 0;
    // the build logs are not uploaded with the service images
    bool skipLogUpload = false;
};

/**
 * Records built images as a release: the images are tagged into the registry
 * namespace assigned by the backend, pushed concurrently and the outcome of
 * every push is saved with its service image. The release is saved with the
 * status "success" only if every push succeeded, else with "failed".
 */
class ReleasePipeline {
public:
    ReleasePipeline(std::shared_ptr<const common::Config> config,
                    std::shared_ptr<const daemon::Daemon> daemon,
                    std::shared_ptr<const ReleaseBackend> backend,
                    std::shared_ptr<renderer::Terminal> terminal,
                    SleepFunction sleep = defaultSleepFunction());

    /**
     * Returns the saved release. Errors raised while tagging or pushing are
     * rethrown once the release was saved.
     */
    Release deployProject(const rapidjson::Value& composition,
                          const std::vector<builder::BuiltImage>& images,
                          const DeployParameters& parameters) const;

private:
    struct TaggedImage {
        const builder::BuiltImage* image;
        ServiceImage* serviceImage;
        ImageLocation location;
    };

    Release createRelease(const rapidjson::Value& composition, const DeployParameters& parameters) const;
    void tagServiceImages(const std::vector<builder::BuiltImage>& images,
                          Release& release,
                          std::vector<TaggedImage>& taggedImages) const;
    std::vector<std::string> getPreviousRepositories(std::int64_t applicationId) const;
    std::string authorizePush(const std::string& registry,
                              const std::vector<TaggedImage>& taggedImages,
                              const std::vector<std::string>& previousRepositories) const;
    void pushAndUpdateServiceImages(const std::string& token,
                                    std::vector<TaggedImage>& taggedImages,
                                    bool skipLogUpload) const;
    void pushImage(const std::string& token, TaggedImage& taggedImage, PushProgress& progress, std::size_t index) const;
    void saveServiceImage(ServiceImage& serviceImage, bool skipLogUpload) const;
    void untagImages(const std::vector<TaggedImage>& taggedImages) const;
    void saveRelease(Release& release) const;
    void printLog(const boost::format& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<const daemon::Daemon> daemon;
    std::shared_ptr<const ReleaseBackend> backend;
    std::shared_ptr<renderer::Terminal> terminal;
    SleepFunction sleep;
    // serializes the updates of the service images
    mutable std::mutex updateMutex;
    const std::string sysname = "ReleasePipeline";
};

}
}

#endif
