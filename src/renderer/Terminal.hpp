/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_Terminal_hpp
#define shipyard_renderer_Terminal_hpp

#include <iostream>
#include <string>


namespace shipyard {
namespace renderer {

/**
 * Minimal line-oriented view of the output device the renderers draw on.
 */
class Terminal {
public:
    virtual ~Terminal() = default;
    virtual void clearLine() = 0;
    virtual void write(const std::string& text) = 0;
    virtual void writeLine(const std::string& text) = 0;
    virtual void cursorUp(unsigned int rows = 1) = 0;
    virtual void hideCursor() = 0;
    virtual void showCursor() = 0;
    virtual void deleteToEnd() = 0;
    virtual unsigned int getWindowWidth() const = 0;
};

// Terminal driven through ANSI escape sequences
class AnsiTerminal : public Terminal {
public:
    explicit AnsiTerminal(std::ostream& stream = std::cout, int fileDescriptor = 1);
    void clearLine() override;
    void write(const std::string& text) override;
    void writeLine(const std::string& text) override;
    void cursorUp(unsigned int rows = 1) override;
    void hideCursor() override;
    void showCursor() override;
    void deleteToEnd() override;
    unsigned int getWindowWidth() const override;

public:
    static constexpr unsigned int defaultWindowWidth = 80;

private:
    std::ostream& stream;
    int fileDescriptor;
};

// Whether the file descriptor refers to an interactive terminal
bool isInteractive(int fileDescriptor = 1);

}
}

#endif
