/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "RunLoop.hpp"

#include <exception>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace renderer {

RunLoop::RunLoop(std::chrono::milliseconds interval, std::function<void()> tick, std::function<void()> onEnd)
    : interval{interval}
    , tick{std::move(tick)}
    , onEnd{std::move(onEnd)}
{
    if(interval.count() <= 0) {
        SHIPYARD_THROW_ERROR("The interval of a run loop must be positive");
    }
    thread = std::thread{&RunLoop::run, this};
}

RunLoop::~RunLoop() {
    end();
}

void RunLoop::end() {
    {
        std::lock_guard<std::mutex> lock{mutex};
        if(isEnded) {
            return;
        }
        isEnded = true;
        isStopRequested = true;
    }
    stopCondition.notify_all();

    if(thread.joinable()) {
        if(thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        }
        else {
            thread.join();
        }
    }

    if(onEnd) {
        onEnd();
    }
}

void RunLoop::run() {
    std::unique_lock<std::mutex> lock{mutex};
    while(!stopCondition.wait_for(lock, interval, [this]() { return isStopRequested; })) {
        lock.unlock();
        try {
            tick();
        }
        catch(const std::exception& e) {
            libshipyard::logMessage(boost::format("Run loop stopped: %s") % e.what(), libshipyard::LogLevel::ERROR);
            return;
        }
        lock.lock();
    }
}

}
}
