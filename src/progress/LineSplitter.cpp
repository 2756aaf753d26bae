/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "LineSplitter.hpp"

#include <boost/regex.hpp>


namespace shipyard {
namespace progress {

std::string stripAnsi(const std::string& text) {
    static const boost::regex ansiSequence{
        "\x1B[\\[\\]()#;?]*(?:(?:(?:[a-zA-Z\\d]*(?:;[-a-zA-Z\\d/#&.:=?%@~_]*)*)?\x07)"
        "|(?:(?:\\d{1,4}(?:;\\d{0,4})*)?[\\dA-PR-TZcf-ntqry=><~]))"};
    return boost::regex_replace(text, ansiSequence, "");
}

std::vector<std::string> LineSplitter::push(const std::string& chunk) {
    auto lines = std::vector<std::string>{};
    pending += chunk;

    std::string::size_type start = 0;
    std::string::size_type newline;
    while((newline = pending.find('\n', start)) != std::string::npos) {
        auto line = pending.substr(start, newline - start);
        if(!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = newline + 1;
    }
    pending.erase(0, start);
    return lines;
}

std::vector<std::string> LineSplitter::flush() {
    auto lines = std::vector<std::string>{};
    if(!pending.empty()) {
        if(pending.back() == '\r') {
            pending.pop_back();
        }
        lines.push_back(std::move(pending));
        pending.clear();
    }
    return lines;
}

}
}
