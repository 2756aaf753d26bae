/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FakeReleaseBackend.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"

namespace test_utility {
namespace release {

shipyard::release::CreatedRelease FakeReleaseBackend::createRelease(std::int64_t userId,
                                                                    std::int64_t applicationId,
                                                                    const rapidjson::Value& composition,
                                                                    const std::string& source,
                                                                    const std::string& commit) const {
    {
        std::lock_guard<std::mutex> lock{mutex};
        creates.push_back(CreateRecord{userId, applicationId, libshipyard::json::serialize(composition), source, commit});
    }

    auto created = shipyard::release::CreatedRelease{};
    auto releaseJson = boost::format(R"({"commit": "%s", "status": "running", "source": "%s",)"
                                     R"( "created_at": "2023-05-01T12:00:00.000Z",)"
                                     R"( "belongs_to__application": {"__id": %d},)"
                                     R"( "is_created_by__user": {"__id": %d},)"
                                     R"( "__metadata": {"uri": "/resin/release(@id)?@id=%d"}%s})")
        % commit % source % applicationId % userId % releaseId
        % (isReleaseIdAssigned ? (boost::format(R"(, "id": %d)") % releaseId).str() : std::string{});
    created.release = libshipyard::json::parse(releaseJson.str());

    auto imageId = std::int64_t{100};
    for(const auto& location : imageLocations) {
        auto imageJson = boost::format(R"({"id": %d, "is_stored_at__image_location": "%s", "status": "running",)"
                                       R"( "created_at": "2023-05-01T12:00:00.000Z",)"
                                       R"( "is_a_build_of__service": {"__id": 7},)"
                                       R"( "__metadata": {"uri": "/resin/image(@id)?@id=%d"}})")
            % imageId % location.second % imageId;
        created.serviceImages.emplace(location.first, libshipyard::json::parse(imageJson.str()));
        ++imageId;
    }
    return created;
}

void FakeReleaseBackend::updateImage(std::int64_t imageId, const rapidjson::Value& serviceImage) const {
    auto record = libshipyard::json::serialize(serviceImage);
    {
        std::lock_guard<std::mutex> lock{mutex};
        ++concurrentImageUpdates;
        maxConcurrentImageUpdates = std::max(maxConcurrentImageUpdates, concurrentImageUpdates);
    }
    // leaves room for overlapping calls to show up
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
    std::lock_guard<std::mutex> lock{mutex};
    --concurrentImageUpdates;
    imageUpdates.push_back(UpdateRecord{imageId, record});
}

void FakeReleaseBackend::updateRelease(std::int64_t releaseId, const rapidjson::Value& release) const {
    std::lock_guard<std::mutex> lock{mutex};
    releaseUpdates.push_back(UpdateRecord{releaseId, libshipyard::json::serialize(release)});
}

std::vector<std::string> FakeReleaseBackend::getLatestSuccessfulReleaseImageLocations(std::int64_t applicationId) const {
    if(isPreviousReleaseQueryFailing) {
        auto message = boost::format("Request error: 500 Internal Server Error (application %d)") % applicationId;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return previousImageLocations;
}

std::string FakeReleaseBackend::getRegistryToken(const std::string& registry, const std::vector<std::string>& scopes) const {
    std::lock_guard<std::mutex> lock{mutex};
    tokenRegistry = registry;
    tokenScopes = scopes;
    if(isAuthorizationFailing) {
        SHIPYARD_THROW_ERROR("Request error: 401 Unauthorized");
    }
    return token;
}

rapidjson::Document FakeReleaseBackend::getUpdatedImage(std::int64_t imageId) const {
    std::lock_guard<std::mutex> lock{mutex};
    auto update = std::find_if(imageUpdates.crbegin(), imageUpdates.crend(), [imageId](const UpdateRecord& record) {
        return record.id == imageId;
    });
    if(update == imageUpdates.crend()) {
        auto message = boost::format("Image %d was not updated") % imageId;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return libshipyard::json::parse(update->record);
}

rapidjson::Document FakeReleaseBackend::getUpdatedRelease() const {
    std::lock_guard<std::mutex> lock{mutex};
    if(releaseUpdates.empty()) {
        SHIPYARD_THROW_ERROR("The release was not updated");
    }
    return libshipyard::json::parse(releaseUpdates.back().record);
}

}
}
