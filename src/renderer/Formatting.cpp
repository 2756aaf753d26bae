/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Formatting.hpp"

#include <algorithm>

#include <boost/format.hpp>


namespace shipyard {
namespace renderer {

std::string renderProgressBar(int percentage, unsigned int width) {
    percentage = std::min(std::max(percentage, 0), 100);
    auto bars = static_cast<unsigned int>(width * percentage / 100);
    auto spaces = width - bars;
    return "[" + std::string(bars, '=') + ">" + std::string(spaces, ' ') + "] "
        + (boost::format("%3d%%") % percentage).str();
}

std::string formatDuration(std::chrono::steady_clock::duration duration) {
    auto totalSeconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    if(totalSeconds < 0) {
        totalSeconds = 0;
    }
    if(totalSeconds == 1) {
        return "1 second";
    }
    if(totalSeconds < 60) {
        return (boost::format("%d seconds") % totalSeconds).str();
    }
    auto hours = totalSeconds / 3600;
    auto minutes = (totalSeconds % 3600) / 60;
    auto seconds = totalSeconds % 60;
    if(hours == 0) {
        return (boost::format("%d:%02d") % minutes % seconds).str();
    }
    return (boost::format("%d:%02d:%02d") % hours % minutes % seconds).str();
}

std::string padEnd(const std::string& text, std::size_t width) {
    if(text.size() >= width) {
        return text;
    }
    return text + std::string(width - text.size(), ' ');
}

namespace {

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}

std::string truncateToWidth(const std::string& text, std::size_t width) {
    // count code points, not bytes
    auto length = std::count_if(text.cbegin(), text.cend(), [](char c) { return !isContinuationByte(c); });
    if(width == 0 || static_cast<std::size_t>(length) <= width) {
        return text;
    }

    auto kept = std::size_t{0};
    auto end = std::size_t{0};
    for(; end < text.size(); ++end) {
        if(!isContinuationByte(text[end])) {
            if(kept == width - 1) {
                break;
            }
            ++kept;
        }
    }
    return text.substr(0, end) + "…";
}

}
}
