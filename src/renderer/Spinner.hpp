/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_Spinner_hpp
#define shipyard_renderer_Spinner_hpp

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

#include "renderer/RunLoop.hpp"
#include "renderer/Terminal.hpp"


namespace shipyard {
namespace renderer {

// Cycles through the frames "|", "/", "-", "\"
class Spinner {
public:
    char next();

private:
    static const std::string frames;
    std::size_t index = 0;
};

/**
 * Shows a message followed by a spinner on the current line until ended.
 * Once ended the message stays on its own line without the spinner.
 */
class SpinnerLine {
public:
    SpinnerLine(Terminal& terminal, const std::string& message,
                std::chrono::milliseconds interval = std::chrono::milliseconds{100});
    ~SpinnerLine();
    void end();

private:
    void draw();

private:
    Terminal& terminal;
    std::string message;
    Spinner spinner;
    RunLoop runLoop;
};

}
}

#endif
