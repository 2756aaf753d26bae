/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "RecordingTerminal.hpp"

#include <algorithm>


namespace test_utility {
namespace renderer {

RecordingTerminal::RecordingTerminal(unsigned int windowWidth)
    : windowWidth{windowWidth}
{}

void RecordingTerminal::clearLine() {
    record("clearLine");
}

void RecordingTerminal::write(const std::string& text) {
    record("write:" + text, text);
}

void RecordingTerminal::writeLine(const std::string& text) {
    record("writeLine:" + text, text + "\n");
}

void RecordingTerminal::cursorUp(unsigned int rows) {
    record("cursorUp:" + std::to_string(rows));
}

void RecordingTerminal::hideCursor() {
    record("hideCursor");
}

void RecordingTerminal::showCursor() {
    record("showCursor");
}

void RecordingTerminal::deleteToEnd() {
    record("deleteToEnd");
}

unsigned int RecordingTerminal::getWindowWidth() const {
    return windowWidth;
}

std::vector<std::string> RecordingTerminal::getOperations() const {
    std::lock_guard<std::mutex> lock{mutex};
    return operations;
}

std::string RecordingTerminal::getOutput() const {
    std::lock_guard<std::mutex> lock{mutex};
    return output;
}

bool RecordingTerminal::contains(const std::string& operation) const {
    std::lock_guard<std::mutex> lock{mutex};
    return std::find(operations.cbegin(), operations.cend(), operation) != operations.cend();
}

void RecordingTerminal::record(const std::string& operation, const std::string& text) {
    std::lock_guard<std::mutex> lock{mutex};
    operations.push_back(operation);
    output += text;
}

}
}
