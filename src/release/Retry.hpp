/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_release_Retry_hpp
#define shipyard_release_Retry_hpp

#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <string>
#include <thread>

#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace release {

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

inline SleepFunction defaultSleepFunction() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

/**
 * Calls the operation up to policy.maxAttempts times. The delay before the
 * n-th retry is initialDelay * backoffScaler^(n-1). The exception of the last
 * attempt is propagated.
 */
template<class Operation>
auto retry(Operation operation,
           const common::Config::Push& policy,
           const std::string& label,
           const SleepFunction& sleep = defaultSleepFunction()) -> decltype(operation()) {
    auto delay = static_cast<double>(policy.initialDelay.count());
    for(unsigned int attempt = 1; ; ++attempt) {
        try {
            return operation();
        }
        catch(const std::exception& e) {
            if(attempt >= policy.maxAttempts) {
                throw;
            }
            auto message = boost::format("Retrying \"%s\" after %.2fs (%d of %d) due to: %s")
                % label % (delay / 1000) % attempt % (policy.maxAttempts - 1) % e.what();
            libshipyard::logMessage(message, libshipyard::LogLevel::WARN);
            sleep(std::chrono::milliseconds{ std::llround(delay) });
            delay *= policy.backoffScaler;
        }
    }
}

}
}

#endif
