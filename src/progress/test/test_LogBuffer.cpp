/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>

#include "progress/LineSplitter.hpp"
#include "progress/LogBuffer.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace progress {
namespace test {

TEST_GROUP(LogBufferTestGroup) {
};

TEST(LogBufferTestGroup, shortLogsAreKept) {
    CHECK_EQUAL(truncateLog("line 1\nline 2"), std::string{"line 1\nline 2"});
    CHECK_EQUAL(truncateLog(""), std::string{""});
}

TEST(LogBufferTestGroup, truncationEndsOnLineBoundary) {
    auto line = std::string(99, 'x') + "\n";
    auto log = std::string{};
    while(log.size() <= maxLogSize + 1000) {
        log += line;
    }

    auto truncated = truncateLog(log);
    CHECK(truncated.size() <= maxLogSize);
    CHECK(truncated.size() > maxLogSize - line.size());
    CHECK_EQUAL(log[truncated.size()], '\n');
    CHECK_EQUAL(truncated.back(), 'x');
    CHECK_EQUAL(log.compare(0, truncated.size(), truncated), 0);
}

TEST(LogBufferTestGroup, truncationWithSmallCap) {
    CHECK_EQUAL(truncateLog("aaa\nbbb\nccc", 9), std::string{"aaa\nbbb"});
    CHECK_EQUAL(truncateLog("aaa\nbbb\nccc", 8), std::string{"aaa\nbbb"});
    CHECK_EQUAL(truncateLog("aaa\nbbb\nccc", 7), std::string{"aaa"});
    CHECK_EQUAL(truncateLog("aaaaaaaa", 4), std::string{""});
}

TEST(LogBufferTestGroup, buffer) {
    auto buffer = LogBuffer{};
    CHECK(buffer.empty());
    buffer.append("Step 1/2 : FROM alpine");
    buffer.capture(ProgressEvent{50, "Step 2/2: RUN make"});
    buffer.capture(ErrorEvent{"make: *** No rule to make target"});
    CHECK(!buffer.empty());
    CHECK_EQUAL(buffer.str(), std::string{"Step 1/2 : FROM alpine\n50% Step 2/2: RUN make\nmake: *** No rule to make target"});
    CHECK_EQUAL(buffer.truncated(30), std::string{"Step 1/2 : FROM alpine"});
}

TEST(LogBufferTestGroup, lineSplitter) {
    auto splitter = LineSplitter{};
    auto lines = splitter.push("Step 1/2 : FR");
    CHECK(lines.empty());

    lines = splitter.push("OM alpine\r\n ---> 14119a10abf4\n\nStep 2");
    CHECK_EQUAL(lines.size(), 3);
    CHECK_EQUAL(lines[0], std::string{"Step 1/2 : FROM alpine"});
    CHECK_EQUAL(lines[1], std::string{" ---> 14119a10abf4"});
    CHECK_EQUAL(lines[2], std::string{""});

    lines = splitter.flush();
    CHECK_EQUAL(lines.size(), 1);
    CHECK_EQUAL(lines[0], std::string{"Step 2"});
    CHECK(splitter.flush().empty());
}

TEST(LogBufferTestGroup, stripAnsi) {
    CHECK_EQUAL(stripAnsi("\x1B[31mred\x1B[0m text"), std::string{"red text"});
    CHECK_EQUAL(stripAnsi("\x1B[1A\x1B[2Kprogress"), std::string{"progress"});
    CHECK_EQUAL(stripAnsi("plain \xE2\x9C\x93 text"), std::string{"plain \xE2\x9C\x93 text"});
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
