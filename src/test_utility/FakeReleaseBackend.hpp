/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_test_utility_FakeReleaseBackend_hpp
#define shipyard_test_utility_FakeReleaseBackend_hpp

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "release/ReleaseBackend.hpp"

namespace test_utility {
namespace release {

/**
 * In-memory release backend. createRelease returns a release with the given id
 * and one service image per entry of imageLocations. Every call is recorded.
 */
class FakeReleaseBackend : public shipyard::release::ReleaseBackend {
public:
    struct CreateRecord {
        std::int64_t userId;
        std::int64_t applicationId;
        std::string composition;
        std::string source;
        std::string commit;
    };

    struct UpdateRecord {
        std::int64_t id;
        std::string record;
    };

public:
    shipyard::release::CreatedRelease createRelease(std::int64_t userId,
                                                    std::int64_t applicationId,
                                                    const rapidjson::Value& composition,
                                                    const std::string& source,
                                                    const std::string& commit) const override;
    void updateImage(std::int64_t imageId, const rapidjson::Value& serviceImage) const override;
    void updateRelease(std::int64_t releaseId, const rapidjson::Value& release) const override;
    std::vector<std::string> getLatestSuccessfulReleaseImageLocations(std::int64_t applicationId) const override;
    std::string getRegistryToken(const std::string& registry, const std::vector<std::string>& scopes) const override;

    // the last update of the service image with the given id
    rapidjson::Document getUpdatedImage(std::int64_t imageId) const;
    rapidjson::Document getUpdatedRelease() const;

public:
    // service name -> storage location
    std::map<std::string, std::string> imageLocations;
    bool isReleaseIdAssigned = true;
    std::int64_t releaseId = 42;
    std::vector<std::string> previousImageLocations;
    bool isPreviousReleaseQueryFailing = false;
    bool isAuthorizationFailing = false;
    std::string token = "registry-token";

    mutable std::vector<CreateRecord> creates;
    mutable std::vector<UpdateRecord> imageUpdates;
    mutable std::vector<UpdateRecord> releaseUpdates;
    mutable std::string tokenRegistry;
    mutable std::vector<std::string> tokenScopes;
    // number of updateImage calls running at the same time, at most
    mutable unsigned int maxConcurrentImageUpdates = 0;

private:
    mutable unsigned int concurrentImageUpdates = 0;
    mutable std::mutex mutex;
};

}
}

#endif
