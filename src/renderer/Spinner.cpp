/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Spinner.hpp"


namespace shipyard {
namespace renderer {

const std::string Spinner::frames = "|/-\\";

char Spinner::next() {
    auto frame = frames[index];
    index = (index + 1) % frames.size();
    return frame;
}

SpinnerLine::SpinnerLine(Terminal& terminal, const std::string& message, std::chrono::milliseconds interval)
    : terminal(terminal)
    , message{message}
    , runLoop{interval,
              [this]() { draw(); },
              [this]() {
                  this->terminal.clearLine();
                  this->terminal.writeLine(this->message);
              }}
{}

SpinnerLine::~SpinnerLine() {
    end();
}

void SpinnerLine::end() {
    runLoop.end();
}

void SpinnerLine::draw() {
    terminal.clearLine();
    terminal.writeLine(message + " " + spinner.next());
    terminal.cursorUp(1);
}

}
}
