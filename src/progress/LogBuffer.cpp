/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "LogBuffer.hpp"

#include <boost/algorithm/string/join.hpp>


namespace shipyard {
namespace progress {

std::string truncateLog(const std::string& log, std::size_t maxSize) {
    if(log.size() < maxSize) {
        return log;
    }
    if(maxSize == 0) {
        return std::string{};
    }
    auto newline = log.rfind('\n', maxSize - 1);
    if(newline == std::string::npos) {
        return std::string{};
    }
    return log.substr(0, newline);
}

void LogBuffer::append(const std::string& line) {
    lines.push_back(line);
}

void LogBuffer::capture(const Event& event) {
    lines.push_back(toLogEntry(event));
}

bool LogBuffer::empty() const {
    return lines.empty();
}

std::string LogBuffer::str() const {
    return boost::algorithm::join(lines, "\n");
}

std::string LogBuffer::truncated(std::size_t maxSize) const {
    return truncateLog(str(), maxSize);
}

}
}
