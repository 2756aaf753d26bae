/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_release_PushProgress_hpp
#define shipyard_release_PushProgress_hpp

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "daemon/Daemon.hpp"
#include "renderer/Terminal.hpp"


namespace shipyard {
namespace release {

/**
 * Renders the progress of concurrent pushes as a single bar, the mean of the
 * progress of every push. The progress of a push is the mean of the progress
 * of its layers. The cursor is hidden until end() is called.
 */
class PushProgress {
public:
    PushProgress(renderer::Terminal& terminal, std::size_t numberOfPushes, const std::string& prefix = "[Push]    ");
    PushProgress(const PushProgress&) = delete;
    PushProgress& operator=(const PushProgress&) = delete;
    ~PushProgress();

    daemon::ProgressHandler getReporter(std::size_t index);
    void update(std::size_t index, const rapidjson::Value& event);
    void complete(std::size_t index);
    int getPercentage() const;
    void end();

private:
    int computePercentage() const;
    void render();

private:
    renderer::Terminal& terminal;
    std::string prefix;
    // progress of the layers of every push
    std::vector<std::map<std::string, int>> layers;
    std::vector<bool> isCompleted;
    bool isEnded = false;
    mutable std::mutex mutex;
};

}
}

#endif
