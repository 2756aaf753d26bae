/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_progress_LineSplitter_hpp
#define shipyard_progress_LineSplitter_hpp

#include <string>
#include <vector>


namespace shipyard {
namespace progress {

// Removes the ANSI escape sequences (colors, cursor movements) from the text
std::string stripAnsi(const std::string& text);

/**
 * Reassembles lines out of arbitrarily chunked output. Line terminators
 * ("\n" or "\r\n") are not part of the returned lines.
 */
class LineSplitter {
public:
    std::vector<std::string> push(const std::string& chunk);
    // returns the pending partial line, if any
    std::vector<std::string> flush();

private:
    std::string pending;
};

}
}

#endif
