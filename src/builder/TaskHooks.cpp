/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "TaskHooks.hpp"

#include <boost/algorithm/string.hpp>


namespace shipyard {
namespace builder {

LocalBuildHook::LocalBuildHook(renderer::ServiceStream sink,
                               std::shared_ptr<progress::LogBuffer> logBuffer,
                               bool isInline,
                               const boost::optional<std::string>& containerEmulatorPath)
    : sink{std::move(sink)}
    , logBuffer{std::move(logBuffer)}
    , adapter{isInline}
{
    if(containerEmulatorPath) {
        outputFilter = emulation::BuildOutputFilter{*containerEmulatorPath};
    }
}

void LocalBuildHook::operator()(const std::string& output) {
    for(const auto& line : splitter.push(progress::stripAnsi(output))) {
        handleLine(line);
    }
}

void LocalBuildHook::flush() {
    for(const auto& line : splitter.flush()) {
        handleLine(line);
    }
}

void LocalBuildHook::handleLine(const std::string& line) {
    auto filtered = outputFilter ? outputFilter->filter(line) : line;
    if(boost::algorithm::trim_copy(filtered).empty()) {
        return;
    }
    logBuffer->append(filtered);
    sink.write(adapter.adapt(filtered));
}

PullHook::PullHook(renderer::ServiceStream sink, std::shared_ptr<progress::LogBuffer> logBuffer)
    : sink{std::move(sink)}
    , logBuffer{std::move(logBuffer)}
{}

void PullHook::operator()(const rapidjson::Value& json) {
    auto event = adapter.adapt(json);
    logBuffer->capture(event);
    sink.write(event);
}

}
}
