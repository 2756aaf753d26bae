/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ReleaseRecords.hpp"

#include <algorithm>
#include <ctime>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace release {

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    if(milliseconds < 0) {
        milliseconds += 1000;
    }
    auto seconds = std::chrono::system_clock::to_time_t(time);
    if(milliseconds != 0 && time < std::chrono::system_clock::from_time_t(seconds)) {
        --seconds;
    }

    struct tm timeInfo;
    if(gmtime_r(&seconds, &timeInfo) == nullptr) {
        SHIPYARD_THROW_ERROR("Failed to convert time point to UTC");
    }
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &timeInfo);
    return (boost::format("%s.%03dZ") % buffer % milliseconds).str();
}

rapidjson::Document omitMembers(const rapidjson::Value& object, const std::vector<std::string>& members) {
    if(!object.IsObject()) {
        SHIPYARD_THROW_ERROR("Expected a JSON object");
    }

    auto result = rapidjson::Document{ rapidjson::kObjectType };
    auto& allocator = result.GetAllocator();
    for(auto it = object.MemberBegin(); it != object.MemberEnd(); ++it) {
        auto name = std::string{it->name.GetString(), it->name.GetStringLength()};
        if(std::find(members.cbegin(), members.cend(), name) != members.cend()) {
            continue;
        }
        result.AddMember(rapidjson::Value{it->name, allocator},
                         rapidjson::Value{it->value, allocator},
                         allocator);
    }
    return result;
}

ServiceImage::ServiceImage(const rapidjson::Value& record)
    : record{omitMembers(record, {"created_at", "is_a_build_of__service", "__metadata"})}
{}

std::int64_t ServiceImage::getId() const {
    if(!record.HasMember("id") || !record["id"].IsInt64()) {
        SHIPYARD_THROW_ERROR("Service image record has no id");
    }
    return record["id"].GetInt64();
}

std::string ServiceImage::getImageLocation() const {
    if(!record.HasMember("is_stored_at__image_location") || !record["is_stored_at__image_location"].IsString()) {
        auto message = boost::format("Service image record %s has no image location")
            % libshipyard::json::serialize(record);
        SHIPYARD_THROW_ERROR(message.str());
    }
    return record["is_stored_at__image_location"].GetString();
}

boost::optional<std::string> ServiceImage::getStatus() const {
    if(!record.HasMember("status") || !record["status"].IsString()) {
        return boost::none;
    }
    return std::string{record["status"].GetString()};
}

void ServiceImage::setPushSucceeded(const builder::BuiltImage& image,
                                    std::size_t size,
                                    const std::string& digest,
                                    std::chrono::system_clock::time_point pushTime) {
    setMember("image_size", rapidjson::Value{static_cast<uint64_t>(size)});
    setString("content_hash", digest);
    setString("build_log", image.logs);
    setString("dockerfile", image.dockerfile);
    setString("project_type", image.projectType);
    if(image.startTime) {
        setString("start_timestamp", formatTimestamp(*image.startTime));
    }
    if(image.endTime) {
        setString("end_timestamp", formatTimestamp(*image.endTime));
    }
    setString("push_timestamp", formatTimestamp(pushTime));
    setString("status", "success");
}

void ServiceImage::setPushFailed(const std::string& errorMessage) {
    setString("error_message", errorMessage);
    setString("status", "failed");
}

void ServiceImage::removeBuildLog() {
    record.RemoveMember("build_log");
}

const rapidjson::Document& ServiceImage::getRecord() const {
    return record;
}

void ServiceImage::setMember(const char* name, rapidjson::Value value) {
    auto& allocator = record.GetAllocator();
    record.RemoveMember(name);
    record.AddMember(rapidjson::Value{name, allocator}, value, allocator);
}

void ServiceImage::setString(const char* name, const std::string& value) {
    setMember(name, rapidjson::Value{value.c_str(), static_cast<rapidjson::SizeType>(value.size()), record.GetAllocator()});
}

Release::Release(const rapidjson::Value& record)
    : record{omitMembers(record, {"created_at", "belongs_to__application", "is_created_by__user", "__metadata"})}
{}

boost::optional<std::int64_t> Release::getId() const {
    if(!record.HasMember("id") || !record["id"].IsInt64()) {
        return boost::none;
    }
    return record["id"].GetInt64();
}

boost::optional<std::string> Release::getStatus() const {
    if(!record.HasMember("status") || !record["status"].IsString()) {
        return boost::none;
    }
    return std::string{record["status"].GetString()};
}

std::string Release::getCommit() const {
    if(!record.HasMember("commit") || !record["commit"].IsString()) {
        return "";
    }
    return record["commit"].GetString();
}

void Release::setStatus(const std::string& status) {
    auto& allocator = record.GetAllocator();
    record.RemoveMember("status");
    record.AddMember("status", rapidjson::Value{status.c_str(), allocator}, allocator);
}

void Release::setEndTimestamp(std::chrono::system_clock::time_point time) {
    auto& allocator = record.GetAllocator();
    record.RemoveMember("end_timestamp");
    record.AddMember("end_timestamp", rapidjson::Value{formatTimestamp(time).c_str(), allocator}, allocator);
}

const rapidjson::Document& Release::getRecord() const {
    return record;
}

}
}
