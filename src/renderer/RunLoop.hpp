/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_RunLoop_hpp
#define shipyard_renderer_RunLoop_hpp

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>


namespace shipyard {
namespace renderer {

/**
 * Invokes a callback at a fixed interval on a background thread until ended.
 * The first invocation happens one interval after construction.
 */
class RunLoop {
public:
    RunLoop(std::chrono::milliseconds interval, std::function<void()> tick,
            std::function<void()> onEnd = nullptr);
    RunLoop(const RunLoop&) = delete;
    RunLoop& operator=(const RunLoop&) = delete;
    ~RunLoop();

    // Stops ticking, waits for an in-flight tick, then invokes onEnd once
    void end();

private:
    void run();

private:
    std::chrono::milliseconds interval;
    std::function<void()> tick;
    std::function<void()> onEnd;
    std::mutex mutex;
    std::condition_variable stopCondition;
    bool isStopRequested = false;
    bool isEnded = false;
    std::thread thread;
};

}
}

#endif
