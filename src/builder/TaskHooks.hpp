/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_builder_TaskHooks_hpp
#define shipyard_builder_TaskHooks_hpp

#include <memory>
#include <string>

#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "emulation/DockerfileTransposer.hpp"
#include "progress/LineSplitter.hpp"
#include "progress/LogBuffer.hpp"
#include "progress/ProgressAdapters.hpp"
#include "renderer/Renderer.hpp"


namespace shipyard {
namespace builder {

/**
 * Receives the raw output of a local build. Output is stripped of ANSI sequences
 * and split into lines. Blank lines are dropped, the others are recorded in the
 * log buffer and then forwarded to the sink as status/progress events.
 * With emulation, the transposed RUN instructions echoed by the daemon are
 * mapped back first.
 */
class LocalBuildHook {
public:
    LocalBuildHook(renderer::ServiceStream sink,
                   std::shared_ptr<progress::LogBuffer> logBuffer,
                   bool isInline,
                   const boost::optional<std::string>& containerEmulatorPath = boost::none);
    void operator()(const std::string& output);
    // handles the last line if the output did not end with a newline
    void flush();

private:
    void handleLine(const std::string& line);

private:
    renderer::ServiceStream sink;
    std::shared_ptr<progress::LogBuffer> logBuffer;
    progress::LineSplitter splitter;
    progress::BuildProgressAdapter adapter;
    boost::optional<emulation::BuildOutputFilter> outputFilter;
};

/**
 * Receives the progress objects of a pull and forwards them to the sink,
 * recording each event in the log buffer.
 */
class PullHook {
public:
    PullHook(renderer::ServiceStream sink, std::shared_ptr<progress::LogBuffer> logBuffer);
    void operator()(const rapidjson::Value& json);

private:
    renderer::ServiceStream sink;
    std::shared_ptr<progress::LogBuffer> logBuffer;
    progress::PullProgressAdapter adapter;
};

}
}

#endif
