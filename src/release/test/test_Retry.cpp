/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "libshipyard/Error.hpp"
#include "release/Retry.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace release {

namespace test {

TEST_GROUP(RetryTestGroup) {
    common::Config::Push policy{};
    std::vector<std::chrono::milliseconds> delays;

    SleepFunction makeSleep() {
        return [this](std::chrono::milliseconds delay) { delays.push_back(delay); };
    }
};

TEST(RetryTestGroup, succeedsAtFirstAttempt) {
    auto attempts = 0;
    auto result = retry([&attempts]() { ++attempts; return std::string{"sha256:0123"}; }, policy, "push", makeSleep());
    CHECK_EQUAL(result, std::string{"sha256:0123"});
    CHECK_EQUAL(attempts, 1);
    CHECK(delays.empty());
}

TEST(RetryTestGroup, backoff) {
    auto attempts = 0;
    auto result = retry([&attempts]() {
        if(++attempts < 3) {
            SHIPYARD_THROW_ERROR("connection reset by peer");
        }
        return attempts;
    }, policy, "push", makeSleep());

    CHECK_EQUAL(result, 3);
    CHECK_EQUAL(delays.size(), 2u);
    CHECK(delays[0] == std::chrono::milliseconds{2000});
    CHECK(delays[1] == std::chrono::milliseconds{2800});
}

TEST(RetryTestGroup, lastErrorIsPropagated) {
    auto attempts = 0;
    auto operation = [&attempts]() -> int {
        ++attempts;
        throw std::runtime_error{"attempt " + std::to_string(attempts)};
    };

    auto message = std::string{};
    try {
        retry(operation, policy, "push", makeSleep());
    }
    catch(const std::runtime_error& e) {
        message = e.what();
    }
    CHECK_EQUAL(message, std::string{"attempt 3"});
    CHECK_EQUAL(attempts, 3);
    CHECK_EQUAL(delays.size(), 2u);
}

TEST(RetryTestGroup, customPolicy) {
    policy.maxAttempts = 4;
    policy.initialDelay = std::chrono::milliseconds{100};
    policy.backoffScaler = 2;

    auto operation = []() -> int { SHIPYARD_THROW_ERROR("unavailable"); };
    CHECK_THROWS(libshipyard::Error, retry(operation, policy, "push", makeSleep()));
    CHECK_EQUAL(delays.size(), 3u);
    CHECK(delays[0] == std::chrono::milliseconds{100});
    CHECK(delays[1] == std::chrono::milliseconds{200});
    CHECK(delays[2] == std::chrono::milliseconds{400});
}

TEST(RetryTestGroup, singleAttempt) {
    policy.maxAttempts = 1;
    auto operation = []() -> int { SHIPYARD_THROW_ERROR("unavailable"); };
    CHECK_THROWS(libshipyard::Error, retry(operation, policy, "push", makeSleep()));
    CHECK(delays.empty());
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
