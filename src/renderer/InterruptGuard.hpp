/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_InterruptGuard_hpp
#define shipyard_renderer_InterruptGuard_hpp

#include <functional>
#include <mutex>
#include <signal.h>
#include <thread>


namespace shipyard {
namespace renderer {

/**
 * Installs a SIGINT handler for the lifetime of the object and invokes the
 * callback on a watcher thread (not in signal context) when the signal arrives.
 * The callback is invoked at most once. The previous handler is restored on release.
 */
class InterruptGuard {
public:
    explicit InterruptGuard(std::function<void()> onInterrupt);
    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;
    ~InterruptGuard();

    // Idempotent and safe to call from within the callback
    void release();

private:
    static void watch(int readFd, std::function<void()> onInterrupt);

private:
    struct sigaction previousAction;
    int previousWriteFd = -1;
    int writeFd = -1;
    bool isReleased = false;
    std::mutex mutex;
    std::thread watcher;
};

}
}

#endif
