/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>


namespace shipyard {
namespace renderer {

constexpr unsigned int AnsiTerminal::defaultWindowWidth;

AnsiTerminal::AnsiTerminal(std::ostream& stream, int fileDescriptor)
    : stream{stream}
    , fileDescriptor{fileDescriptor}
{}

void AnsiTerminal::clearLine() {
    stream << "\x1B[2K\r" << std::flush;
}

void AnsiTerminal::write(const std::string& text) {
    stream << text << std::flush;
}

void AnsiTerminal::writeLine(const std::string& text) {
    stream << text << "\n" << std::flush;
}

void AnsiTerminal::cursorUp(unsigned int rows) {
    stream << "\x1B[" << rows << "A" << std::flush;
}

void AnsiTerminal::hideCursor() {
    stream << "\x1B[?25l" << std::flush;
}

void AnsiTerminal::showCursor() {
    stream << "\x1B[?25h" << std::flush;
}

void AnsiTerminal::deleteToEnd() {
    stream << "\x1B[0J" << std::flush;
}

unsigned int AnsiTerminal::getWindowWidth() const {
    struct winsize size;
    if(ioctl(fileDescriptor, TIOCGWINSZ, &size) != 0 || size.ws_col == 0) {
        return defaultWindowWidth;
    }
    return size.ws_col;
}

bool isInteractive(int fileDescriptor) {
    return isatty(fileDescriptor) == 1;
}

}
}
