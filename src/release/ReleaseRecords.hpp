/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_release_ReleaseRecords_hpp
#define shipyard_release_ReleaseRecords_hpp

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "builder/BuiltImage.hpp"


namespace shipyard {
namespace release {

// UTC, millisecond precision, e.g. "2023-05-01T12:00:00.000Z"
std::string formatTimestamp(std::chrono::system_clock::time_point time);

// Deep copy of the object without the given members
rapidjson::Document omitMembers(const rapidjson::Value& object, const std::vector<std::string>& members);

/**
 * Release-side record of one image. Wraps the JSON record returned by the
 * backend, stripped of the backend-internal members, and updated in place
 * with the outcome of the push.
 */
class ServiceImage {
public:
    explicit ServiceImage(const rapidjson::Value& record);

    std::int64_t getId() const;
    std::string getImageLocation() const;
    boost::optional<std::string> getStatus() const;

    void setPushSucceeded(const builder::BuiltImage& image,
                          std::size_t size,
                          const std::string& digest,
                          std::chrono::system_clock::time_point pushTime);
    void setPushFailed(const std::string& errorMessage);
    void removeBuildLog();

    const rapidjson::Document& getRecord() const;

private:
    void setMember(const char* name, rapidjson::Value value);
    void setString(const char* name, const std::string& value);

private:
    rapidjson::Document record;
};

/**
 * Release of an application, holding the service images keyed by service name.
 */
class Release {
public:
    explicit Release(const rapidjson::Value& record);

    boost::optional<std::int64_t> getId() const;
    boost::optional<std::string> getStatus() const;
    std::string getCommit() const;

    void setStatus(const std::string& status);
    void setEndTimestamp(std::chrono::system_clock::time_point time);

    const rapidjson::Document& getRecord() const;

public:
    std::map<std::string, ServiceImage> serviceImages;

private:
    rapidjson::Document record;
};

}
}

#endif
