/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_InlineRenderer_hpp
#define shipyard_renderer_InlineRenderer_hpp

#include "renderer/Renderer.hpp"


namespace shipyard {
namespace renderer {

/**
 * Appends one line per event, for output that is not an interactive terminal.
 */
class InlineRenderer : public Renderer {
public:
    InlineRenderer(const std::vector<std::string>& services, Terminal& terminal);
    ~InlineRenderer();

    void start() override;
    void end(const boost::optional<Summary>& summary = boost::none) override;

private:
    void onServiceEvent(const std::string& service, const ServiceStatus& status) override;
    void renderLine(const std::string& service, const std::string& text);

private:
    std::size_t prefixWidth;
};

}
}

#endif
