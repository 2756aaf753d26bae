/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_progress_ProgressAdapters_hpp
#define shipyard_progress_ProgressAdapters_hpp

#include <string>

#include <boost/optional.hpp>
#include <boost/regex.hpp>
#include <rapidjson/document.h>

#include "progress/Event.hpp"


namespace shipyard {
namespace progress {

/**
 * Turns the lines of a build log into status events. Lines following a
 * "Step N/M : ..." line are prefixed with the current step and carry the
 * build progress floor(N*100/M). The total number of steps is latched on
 * the first step line. "Successfully tagged" marks the end of the build and
 * clears the progress.
 *
 * In inline mode every line is forwarded as a plain status.
 */
class BuildProgressAdapter {
public:
    explicit BuildProgressAdapter(bool isInline = false);
    Event adapt(const std::string& line);

private:
    bool isInline;
    boost::optional<std::string> step;
    boost::optional<std::string> numberOfSteps;
    boost::optional<int> progress;
};

/**
 * Turns the progress objects of a pull into events.
 */
class PullProgressAdapter {
public:
    Event adapt(const rapidjson::Value& json) const;
};

// Percentage of progressDetail {current, total}, if any
boost::optional<int> getPercentage(const rapidjson::Value& json);

}
}

#endif
