/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ProgressAdapters.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace progress {

BuildProgressAdapter::BuildProgressAdapter(bool isInline)
    : isInline{isInline}
{}

Event BuildProgressAdapter::adapt(const std::string& line) {
    static const boost::regex stepPattern{"^\\s*Step\\s+(\\d+)/(\\d+)\\s*: (.+)$"};

    if(isInline) {
        return StatusEvent{ line };
    }

    auto status = line;
    if(boost::starts_with(line, "Successfully tagged ")) {
        progress = boost::none;
    }
    else {
        auto matches = boost::smatch{};
        if(boost::regex_match(line, matches, stepPattern)) {
            step = matches[1].str();
            if(!numberOfSteps) {
                numberOfSteps = matches[2].str();
            }
            status = matches[3].str();
        }
        if(step) {
            status = "Step " + *step + "/" + *numberOfSteps + ": " + status;
            auto current = boost::lexical_cast<long>(*step);
            auto total = boost::lexical_cast<long>(*numberOfSteps);
            progress = total > 0 ? static_cast<int>(current * 100 / total) : 0;
        }
    }

    if(progress && *progress != 0) {
        return ProgressEvent{ *progress, status };
    }
    return StatusEvent{ status };
}

boost::optional<int> getPercentage(const rapidjson::Value& json) {
    if(!json.HasMember("progressDetail") || !json["progressDetail"].IsObject()) {
        return boost::none;
    }
    const auto& detail = json["progressDetail"];
    if(!detail.HasMember("current") || !detail["current"].IsNumber()
       || !detail.HasMember("total") || !detail["total"].IsNumber()) {
        return boost::none;
    }
    auto total = detail["total"].GetDouble();
    if(total <= 0) {
        return boost::none;
    }
    return static_cast<int>(detail["current"].GetDouble() * 100 / total);
}

Event PullProgressAdapter::adapt(const rapidjson::Value& json) const {
    if(!json.IsObject()) {
        return RawEvent{ libshipyard::json::serialize(json) };
    }

    if(json.HasMember("errorDetail") && json["errorDetail"].IsObject()
       && json["errorDetail"].HasMember("message") && json["errorDetail"]["message"].IsString()) {
        return ErrorEvent{ json["errorDetail"]["message"].GetString() };
    }
    if(json.HasMember("error") && json["error"].IsString()) {
        return ErrorEvent{ json["error"].GetString() };
    }

    bool hasStatus = json.HasMember("status") && json["status"].IsString();
    bool hasId = json.HasMember("id") && json["id"].IsString();
    if(!hasStatus && !hasId) {
        return RawEvent{ libshipyard::json::serialize(json) };
    }

    auto status = hasStatus ? std::string{json["status"].GetString()} : std::string{};
    if(boost::starts_with(status, "Status: ")) {
        status.erase(0, std::string{"Status: "}.size());
    }
    if(hasId) {
        status = std::string{json["id"].GetString()} + ": " + status;
    }

    auto percentage = getPercentage(json);
    if(percentage && *percentage != 0 && *percentage != 100) {
        return ProgressEvent{ *percentage, status };
    }
    return StatusEvent{ status };
}

}
}
