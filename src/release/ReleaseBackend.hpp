/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_release_ReleaseBackend_hpp
#define shipyard_release_ReleaseBackend_hpp

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <rapidjson/document.h>


namespace shipyard {
namespace release {

struct CreatedRelease {
    rapidjson::Document release{ rapidjson::kObjectType };
    // keyed by service name
    std::map<std::string, rapidjson::Document> serviceImages;
};

/**
 * Abstract handle on the cloud service that records releases. The handle is
 * already authenticated. All the methods throw on failure.
 */
class ReleaseBackend {
public:
    virtual ~ReleaseBackend() = default;

    virtual CreatedRelease createRelease(std::int64_t userId,
                                         std::int64_t applicationId,
                                         const rapidjson::Value& composition,
                                         const std::string& source,
                                         const std::string& commit) const = 0;

    virtual void updateImage(std::int64_t imageId, const rapidjson::Value& serviceImage) const = 0;

    virtual void updateRelease(std::int64_t releaseId, const rapidjson::Value& release) const = 0;

    // Storage locations of the images of the application's most recent successful release
    virtual std::vector<std::string> getLatestSuccessfulReleaseImageLocations(std::int64_t applicationId) const = 0;

    // Token granting the scopes, e.g. "repository:v2/0a1b2c3d:pull,push", on the registry
    virtual std::string getRegistryToken(const std::string& registry, const std::vector<std::string>& scopes) const = 0;
};

}
}

#endif
