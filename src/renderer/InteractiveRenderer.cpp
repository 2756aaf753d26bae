/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "InteractiveRenderer.hpp"

#include <cstdlib>
#include <iostream>

#include "renderer/Formatting.hpp"


namespace shipyard {
namespace renderer {

const std::string InteractiveRenderer::prefix = "[Build]   ";
constexpr int InteractiveRenderer::cancelledExitStatus;

// Called from the interrupt watcher while build workers and the main thread still run,
// so static destructors and atexit handlers must not run
InteractiveRenderer::ExitFunction InteractiveRenderer::defaultExitFunction() {
    return [](int status) {
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(status);
    };
}

InteractiveRenderer::InteractiveRenderer(const std::vector<std::string>& services, Terminal& terminal,
                                         ExitFunction exitProcess, std::chrono::milliseconds interval)
    : Renderer{services, terminal}
    , exitProcess{std::move(exitProcess)}
    , interval{interval}
    , prefixWidth{prefix.size() + getLongestServiceName() + 1}
{
    startConsumer();
}

InteractiveRenderer::~InteractiveRenderer() {
    interruptGuard.reset();
    runLoop.reset();
    stopConsumer();
}

void InteractiveRenderer::start() {
    interruptGuard = std::unique_ptr<InterruptGuard>{ new InterruptGuard{[this]() { interrupt(); }} };
    {
        std::lock_guard<std::mutex> lock{mutex};
        terminal.hideCursor();
        setPreparing();
        startTime = std::chrono::steady_clock::now();
    }
    runLoop = std::unique_ptr<RunLoop>{ new RunLoop{interval, [this]() { display(); }} };
}

void InteractiveRenderer::end(const boost::optional<Summary>& summary) {
    if(!markEnded()) {
        return;
    }

    // release the guard and the loop without holding the lock, a tick may be waiting for it
    if(interruptGuard) {
        interruptGuard->release();
    }
    if(runLoop) {
        runLoop->end();
    }
    finishServices();

    std::lock_guard<std::mutex> lock{mutex};
    clear();
    renderStatus(true);
    renderSummary(summary ? *summary : getCurrentSummary());
    terminal.showCursor();
}

void InteractiveRenderer::interrupt() {
    {
        std::lock_guard<std::mutex> lock{mutex};
        isCancelled = true;
    }
    end();
    exitProcess(cancelledExitStatus);
}

void InteractiveRenderer::display() {
    std::lock_guard<std::mutex> lock{mutex};
    clear();
    renderStatus(false);
    renderSummary(getCurrentSummary());
    terminal.cursorUp(static_cast<unsigned int>(services.size() + 1));
}

void InteractiveRenderer::clear() {
    terminal.deleteToEnd();
    maxLineWidth = terminal.getWindowWidth();
}

void InteractiveRenderer::renderStatus(bool isEnd) {
    terminal.clearLine();
    terminal.write(prefix);
    if(!isEnd) {
        terminal.writeLine(std::string{"Building services... "} + spinner.next());
    }
    else if(isCancelled) {
        terminal.writeLine("Build cancelled");
    }
    else {
        terminal.writeLine(formatBuiltStatus());
    }
}

void InteractiveRenderer::renderSummary(const Summary& summary) {
    for(const auto& service : services) {
        auto it = summary.find(service);
        auto text = it != summary.cend() ? it->second : getSummaryText(states.at(service), true);
        terminal.clearLine();
        terminal.writeLine(truncateToWidth(padEnd(prefix + service, prefixWidth) + text, maxLineWidth));
    }
}

Renderer::Summary InteractiveRenderer::getCurrentSummary() const {
    auto summary = Summary{};
    for(const auto& state : states) {
        summary[state.first] = getSummaryText(state.second, true);
    }
    return summary;
}

}
}
