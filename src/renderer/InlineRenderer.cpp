/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "InlineRenderer.hpp"

#include "renderer/Formatting.hpp"


namespace shipyard {
namespace renderer {

InlineRenderer::InlineRenderer(const std::vector<std::string>& services, Terminal& terminal)
    : Renderer{services, terminal}
    , prefixWidth{getLongestServiceName() + 1}
{
    startConsumer();
}

InlineRenderer::~InlineRenderer() {
    stopConsumer();
}

void InlineRenderer::start() {
    std::lock_guard<std::mutex> lock{mutex};
    terminal.write("Building services...\n");
    setPreparing();
    for(const auto& service : services) {
        renderLine(service, getSummaryText(states.at(service), false));
    }
    startTime = std::chrono::steady_clock::now();
}

void InlineRenderer::end(const boost::optional<Summary>& summary) {
    if(!markEnded()) {
        return;
    }
    finishServices();

    if(!summary) {
        return;
    }

    std::lock_guard<std::mutex> lock{mutex};
    for(const auto& service : services) {
        auto it = summary->find(service);
        auto text = it != summary->cend() ? it->second : getSummaryText(states.at(service), false);
        renderLine(service, text);
    }
    terminal.write(formatBuiltStatus() + "\n");
}

void InlineRenderer::onServiceEvent(const std::string& service, const ServiceStatus& status) {
    renderLine(service, getSummaryText(status, false));
}

void InlineRenderer::renderLine(const std::string& service, const std::string& text) {
    terminal.write(padEnd(service, prefixWidth) + text + "\n");
}

}
}
