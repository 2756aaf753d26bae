/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PushProgress.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "progress/ProgressAdapters.hpp"
#include "renderer/Formatting.hpp"


namespace shipyard {
namespace release {

PushProgress::PushProgress(renderer::Terminal& terminal, std::size_t numberOfPushes, const std::string& prefix)
    : terminal(terminal)
    , prefix{prefix}
    , layers(numberOfPushes)
    , isCompleted(numberOfPushes, false)
{
    terminal.hideCursor();
}

PushProgress::~PushProgress() {
    end();
}

daemon::ProgressHandler PushProgress::getReporter(std::size_t index) {
    if(index >= layers.size()) {
        auto message = boost::format("No push with index %d") % index;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return [this, index](const rapidjson::Value& event) { update(index, event); };
}

// Errors reported in the events are raised by the push itself
void PushProgress::update(std::size_t index, const rapidjson::Value& event) {
    if(!event.IsObject() || !event.HasMember("id") || !event["id"].IsString()
       || !event.HasMember("status") || !event["status"].IsString()) {
        return;
    }

    auto layer = std::string{event["id"].GetString()};
    auto status = std::string{event["status"].GetString()};

    std::lock_guard<std::mutex> lock{mutex};
    auto& progress = layers.at(index)[layer];
    if(status == "Pushed" || status == "Layer already exists") {
        progress = 100;
    }
    else if(status == "Pushing") {
        auto percentage = progress::getPercentage(event);
        if(percentage) {
            progress = std::max(0, std::min(*percentage, 100));
        }
    }
    render();
}

void PushProgress::complete(std::size_t index) {
    std::lock_guard<std::mutex> lock{mutex};
    isCompleted.at(index) = true;
    render();
}

int PushProgress::getPercentage() const {
    std::lock_guard<std::mutex> lock{mutex};
    return computePercentage();
}

void PushProgress::end() {
    std::lock_guard<std::mutex> lock{mutex};
    if(isEnded) {
        return;
    }
    isEnded = true;
    terminal.clearLine();
    terminal.showCursor();
}

int PushProgress::computePercentage() const {
    if(layers.empty()) {
        return 100;
    }
    auto total = 0;
    for(std::size_t i = 0; i < layers.size(); ++i) {
        if(isCompleted[i]) {
            total += 100;
            continue;
        }
        if(layers[i].empty()) {
            continue;
        }
        auto sum = 0;
        for(const auto& layer : layers[i]) {
            sum += layer.second;
        }
        total += sum / static_cast<int>(layers[i].size());
    }
    return total / static_cast<int>(layers.size());
}

void PushProgress::render() {
    if(isEnded) {
        return;
    }
    terminal.clearLine();
    terminal.write(prefix + renderer::renderProgressBar(computePercentage(), 40) + "\r");
}

}
}
