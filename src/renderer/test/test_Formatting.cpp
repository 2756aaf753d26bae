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
#include <string>

#include "renderer/Formatting.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace renderer {
namespace test {

TEST_GROUP(FormattingTestGroup) {
};

TEST(FormattingTestGroup, progressBar) {
    CHECK_EQUAL(renderProgressBar(25, 20), std::string{"[=====>               ]  25%"});
    CHECK_EQUAL(renderProgressBar(0, 4), std::string{"[>    ]   0%"});
    CHECK_EQUAL(renderProgressBar(100, 4), std::string{"[====>] 100%"});
    CHECK_EQUAL(renderProgressBar(99, 10), std::string{"[=========> ]  99%"});
}

TEST(FormattingTestGroup, progressBarClampsPercentage) {
    CHECK_EQUAL(renderProgressBar(-5, 4), renderProgressBar(0, 4));
    CHECK_EQUAL(renderProgressBar(150, 4), renderProgressBar(100, 4));
}

TEST(FormattingTestGroup, duration) {
    using std::chrono::seconds;
    CHECK_EQUAL(formatDuration(seconds{0}), std::string{"0 seconds"});
    CHECK_EQUAL(formatDuration(seconds{1}), std::string{"1 second"});
    CHECK_EQUAL(formatDuration(seconds{59}), std::string{"59 seconds"});
    CHECK_EQUAL(formatDuration(seconds{60}), std::string{"1:00"});
    CHECK_EQUAL(formatDuration(seconds{187}), std::string{"3:07"});
    CHECK_EQUAL(formatDuration(seconds{3729}), std::string{"1:02:09"});
    CHECK_EQUAL(formatDuration(std::chrono::milliseconds{2999}), std::string{"2 seconds"});
}

TEST(FormattingTestGroup, padEnd) {
    CHECK_EQUAL(padEnd("db", 5), std::string{"db   "});
    CHECK_EQUAL(padEnd("frontend", 5), std::string{"frontend"});
}

TEST(FormattingTestGroup, truncateToWidth) {
    CHECK_EQUAL(truncateToWidth("abcdefg", 5), std::string{"abcd…"});
    CHECK_EQUAL(truncateToWidth("abcde", 5), std::string{"abcde"});
    CHECK_EQUAL(truncateToWidth("abc", 0), std::string{"abc"});
    // multi-byte characters count as one
    CHECK_EQUAL(truncateToWidth("ééé", 3), std::string{"ééé"});
    CHECK_EQUAL(truncateToWidth("éééé", 3), std::string{"éé…"});
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
