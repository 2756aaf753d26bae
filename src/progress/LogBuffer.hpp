/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_progress_LogBuffer_hpp
#define shipyard_progress_LogBuffer_hpp

#include <cstddef>
#include <string>
#include <vector>

#include "progress/Event.hpp"


namespace shipyard {
namespace progress {

constexpr std::size_t maxLogSize = 512 * 1024;

/**
 * Truncates the log to at most maxSize bytes. The result ends on the last
 * newline boundary before the cap (the newline itself is dropped), i.e. it
 * is empty when the first maxSize bytes contain no newline.
 */
std::string truncateLog(const std::string& log, std::size_t maxSize = maxLogSize);

/**
 * Build log of a single service.
 */
class LogBuffer {
public:
    void append(const std::string& line);
    void capture(const Event& event);
    bool empty() const;
    // lines joined with newlines
    std::string str() const;
    std::string truncated(std::size_t maxSize = maxLogSize) const;

private:
    std::vector<std::string> lines;
};

}
}

#endif
