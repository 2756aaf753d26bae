/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_test_utility_RecordingTerminal_hpp
#define shipyard_test_utility_RecordingTerminal_hpp

#include <mutex>
#include <string>
#include <vector>

#include "renderer/Terminal.hpp"


namespace test_utility {
namespace renderer {

/**
 * Terminal that records every operation, e.g. "writeLine:Built 1 service in 0 seconds".
 */
class RecordingTerminal : public shipyard::renderer::Terminal {
public:
    explicit RecordingTerminal(unsigned int windowWidth = 80);

    void clearLine() override;
    void write(const std::string& text) override;
    void writeLine(const std::string& text) override;
    void cursorUp(unsigned int rows = 1) override;
    void hideCursor() override;
    void showCursor() override;
    void deleteToEnd() override;
    unsigned int getWindowWidth() const override;

    std::vector<std::string> getOperations() const;
    // Text written so far, cursor movements and clearing left out
    std::string getOutput() const;
    bool contains(const std::string& operation) const;

private:
    void record(const std::string& operation, const std::string& text = "");

private:
    unsigned int windowWidth;
    std::vector<std::string> operations;
    std::string output;
    mutable std::mutex mutex;
};

}
}

#endif
