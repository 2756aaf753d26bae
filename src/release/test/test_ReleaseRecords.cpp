/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <chrono>
#include <string>

#include "libshipyard/Utility.hpp"
#include "release/ReleaseRecords.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace release {
namespace test {

TEST_GROUP(ReleaseRecordsTestGroup) {
};

TEST(ReleaseRecordsTestGroup, formatTimestamp) {
    auto epoch = std::chrono::system_clock::from_time_t(0);
    CHECK_EQUAL(formatTimestamp(epoch), std::string{"1970-01-01T00:00:00.000Z"});
    CHECK_EQUAL(formatTimestamp(epoch + std::chrono::milliseconds{1500}), std::string{"1970-01-01T00:00:01.500Z"});
    CHECK_EQUAL(formatTimestamp(epoch + std::chrono::hours{24 * 365} + std::chrono::milliseconds{7}),
                std::string{"1971-01-01T00:00:00.007Z"});
}

TEST(ReleaseRecordsTestGroup, omitMembers) {
    auto json = libshipyard::json::parse(R"({"id": 1, "created_at": "now", "nested": {"created_at": "kept"}})");
    auto result = omitMembers(json, {"created_at", "__metadata"});
    CHECK_EQUAL(libshipyard::json::serialize(result), std::string{R"({"id":1,"nested":{"created_at":"kept"}})"});
    CHECK_THROWS(libshipyard::Error, omitMembers(libshipyard::json::parse("[]"), {}));
}

TEST(ReleaseRecordsTestGroup, release) {
    auto release = Release{libshipyard::json::parse(R"({
        "id": 42,
        "commit": "0123456789abcdef0123456789abcdef",
        "status": "running",
        "created_at": "2023-05-01T12:00:00.000Z",
        "belongs_to__application": {"__id": 7},
        "is_created_by__user": {"__id": 3},
        "__metadata": {"uri": "/resin/release(@id)?@id=42"}
    })")};

    CHECK_EQUAL(*release.getId(), 42);
    CHECK_EQUAL(release.getCommit(), std::string{"0123456789abcdef0123456789abcdef"});
    CHECK_EQUAL(*release.getStatus(), std::string{"running"});
    CHECK(!release.getRecord().HasMember("created_at"));
    CHECK(!release.getRecord().HasMember("belongs_to__application"));
    CHECK(!release.getRecord().HasMember("is_created_by__user"));
    CHECK(!release.getRecord().HasMember("__metadata"));

    release.setStatus("success");
    release.setEndTimestamp(std::chrono::system_clock::from_time_t(60));
    CHECK_EQUAL(*release.getStatus(), std::string{"success"});
    CHECK_EQUAL(std::string{release.getRecord()["end_timestamp"].GetString()}, std::string{"1970-01-01T00:01:00.000Z"});

    auto withoutId = Release{libshipyard::json::parse(R"({"commit": "abc"})")};
    CHECK(!withoutId.getId());
    CHECK(!withoutId.getStatus());
}

TEST(ReleaseRecordsTestGroup, serviceImage) {
    auto serviceImage = ServiceImage{libshipyard::json::parse(R"({
        "id": 100,
        "is_stored_at__image_location": "registry.test/v2/abc123",
        "created_at": "2023-05-01T12:00:00.000Z",
        "is_a_build_of__service": {"__id": 7},
        "__metadata": {}
    })")};
    CHECK_EQUAL(serviceImage.getId(), 100);
    CHECK_EQUAL(serviceImage.getImageLocation(), std::string{"registry.test/v2/abc123"});
    CHECK(!serviceImage.getStatus());
    CHECK(!serviceImage.getRecord().HasMember("created_at"));
    CHECK(!serviceImage.getRecord().HasMember("is_a_build_of__service"));
    CHECK(!serviceImage.getRecord().HasMember("__metadata"));

    auto image = builder::BuiltImage{};
    image.serviceName = "main";
    image.logs = "Step 1/1 : FROM alpine";
    image.dockerfile = "Dockerfile.armv7hf";
    image.projectType = "Architecture-specific Dockerfile";
    image.startTime = std::chrono::system_clock::from_time_t(10);

    serviceImage.setPushSucceeded(image, 2048, "sha256:0123", std::chrono::system_clock::from_time_t(20));
    const auto& record = serviceImage.getRecord();
    CHECK_EQUAL(*serviceImage.getStatus(), std::string{"success"});
    CHECK_EQUAL(record["image_size"].GetUint64(), 2048u);
    CHECK_EQUAL(std::string{record["content_hash"].GetString()}, std::string{"sha256:0123"});
    CHECK_EQUAL(std::string{record["build_log"].GetString()}, std::string{"Step 1/1 : FROM alpine"});
    CHECK_EQUAL(std::string{record["dockerfile"].GetString()}, std::string{"Dockerfile.armv7hf"});
    CHECK_EQUAL(std::string{record["project_type"].GetString()}, std::string{"Architecture-specific Dockerfile"});
    CHECK_EQUAL(std::string{record["start_timestamp"].GetString()}, std::string{"1970-01-01T00:00:10.000Z"});
    CHECK(!record.HasMember("end_timestamp"));
    CHECK_EQUAL(std::string{record["push_timestamp"].GetString()}, std::string{"1970-01-01T00:00:20.000Z"});

    serviceImage.removeBuildLog();
    CHECK(!serviceImage.getRecord().HasMember("build_log"));

    serviceImage.setPushFailed("unauthorized: authentication required");
    CHECK_EQUAL(*serviceImage.getStatus(), std::string{"failed"});
    CHECK_EQUAL(std::string{serviceImage.getRecord()["error_message"].GetString()},
                std::string{"unauthorized: authentication required"});
}

TEST(ReleaseRecordsTestGroup, incompleteServiceImage) {
    auto serviceImage = ServiceImage{libshipyard::json::parse(R"({"status": "running"})")};
    CHECK_THROWS(libshipyard::Error, serviceImage.getId());
    CHECK_THROWS(libshipyard::Error, serviceImage.getImageLocation());
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
