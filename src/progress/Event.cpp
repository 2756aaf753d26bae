/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Event.hpp"

#include <boost/format.hpp>

#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace progress {

namespace {

class LogEntryVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const ErrorEvent& event) const {
        return event.message;
    }
    std::string operator()(const ProgressEvent& event) const {
        return (boost::format("%d%% %s") % event.progress % event.status).str();
    }
    std::string operator()(const StatusEvent& event) const {
        return event.status;
    }
    std::string operator()(const RawEvent& event) const {
        return event.data;
    }
};

}

Event decodeEvent(const rapidjson::Value& json) {
    if(!json.IsObject()) {
        return RawEvent{ libshipyard::json::serialize(json) };
    }
    if(json.HasMember("error") && json["error"].IsString()) {
        return ErrorEvent{ json["error"].GetString() };
    }
    bool hasStatus = json.HasMember("status") && json["status"].IsString();
    if(hasStatus && json.HasMember("progress") && json["progress"].IsNumber()) {
        auto progress = static_cast<int>(json["progress"].GetDouble());
        if(progress != 0) {
            return ProgressEvent{ progress, json["status"].GetString() };
        }
    }
    if(hasStatus) {
        return StatusEvent{ json["status"].GetString() };
    }
    return RawEvent{ libshipyard::json::serialize(json) };
}

std::string toLogEntry(const Event& event) {
    return boost::apply_visitor(LogEntryVisitor{}, event);
}

bool isError(const Event& event) {
    return boost::get<ErrorEvent>(&event) != nullptr;
}

}
}
