/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_Formatting_hpp
#define shipyard_renderer_Formatting_hpp

#include <chrono>
#include <string>


namespace shipyard {
namespace renderer {

/**
 * Renders e.g. "[=====>               ] 25%" with the given number of bar cells.
 * The percentage is clamped to [0, 100].
 */
std::string renderProgressBar(int percentage, unsigned int width);

// "12 seconds", "3:07" or "1:02:09"
std::string formatDuration(std::chrono::steady_clock::duration duration);

std::string padEnd(const std::string& text, std::size_t width);

// Truncates to the given number of characters, marking the cut with an ellipsis
std::string truncateToWidth(const std::string& text, std::size_t width);

}
}

#endif
