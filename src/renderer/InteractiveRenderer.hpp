/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_InteractiveRenderer_hpp
#define shipyard_renderer_InteractiveRenderer_hpp

#include <chrono>
#include <functional>
#include <memory>

#include "renderer/InterruptGuard.hpp"
#include "renderer/Renderer.hpp"
#include "renderer/RunLoop.hpp"
#include "renderer/Spinner.hpp"


namespace shipyard {
namespace renderer {

/**
 * Redraws one line per service in place, below a status line with a spinner.
 * An interrupt (SIGINT) while running cancels the build: the final state is
 * rendered and the process exits with status 130.
 */
class InteractiveRenderer : public Renderer {
public:
    using ExitFunction = std::function<void(int)>;

public:
    InteractiveRenderer(const std::vector<std::string>& services, Terminal& terminal,
                        ExitFunction exitProcess = defaultExitFunction(),
                        std::chrono::milliseconds interval = std::chrono::milliseconds{100});
    ~InteractiveRenderer();

    void start() override;
    void end(const boost::optional<Summary>& summary = boost::none) override;
    void interrupt();
    void display();

    static ExitFunction defaultExitFunction();

public:
    static const std::string prefix;
    static constexpr int cancelledExitStatus = 130;

private:
    void clear();
    void renderStatus(bool isEnd);
    void renderSummary(const Summary& summary);
    Summary getCurrentSummary() const;

private:
    ExitFunction exitProcess;
    std::chrono::milliseconds interval;
    std::size_t prefixWidth;
    unsigned int maxLineWidth = AnsiTerminal::defaultWindowWidth;
    bool isCancelled = false;
    Spinner spinner;
    std::unique_ptr<InterruptGuard> interruptGuard;
    std::unique_ptr<RunLoop> runLoop;
};

}
}

#endif
