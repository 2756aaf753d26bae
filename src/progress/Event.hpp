/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_progress_Event_hpp
#define shipyard_progress_Event_hpp

#include <string>

#include <boost/variant.hpp>
#include <rapidjson/document.h>


namespace shipyard {
namespace progress {

struct ErrorEvent {
    std::string message;
};

// progress is a non-zero percentage
struct ProgressEvent {
    int progress;
    std::string status;
};

struct StatusEvent {
    std::string status;
};

// payload that carries neither status nor error, kept verbatim
struct RawEvent {
    std::string data;
};

using Event = boost::variant<ErrorEvent, ProgressEvent, StatusEvent, RawEvent>;

struct ServiceEvent {
    std::string service;
    Event event;
};

/**
 * Decodes a daemon progress object ({"status", "progress", "error"}) into an event.
 * A progress of zero is considered absent.
 */
Event decodeEvent(const rapidjson::Value& json);

// The line recorded in the service's build log for the event
std::string toLogEntry(const Event& event);

bool isError(const Event& event);

}
}

#endif
