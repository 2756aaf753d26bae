/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libshipyard_utility_process_hpp
#define libshipyard_utility_process_hpp

#include <functional>
#include <string>

#include <boost/optional.hpp>

#include "libshipyard/CLIArguments.hpp"

/**
 * Utility functions for system operations
 */

namespace libshipyard {
namespace process {

using OutputLineHandler = std::function<void(const std::string&)>;

int forkExecWait(const libshipyard::CLIArguments& args,
                 const boost::optional<std::function<void()>>& preExecChildActions = {},
                 const boost::optional<std::function<void(int)>>& postForkParentActions = {},
                 const OutputLineHandler& childStdoutLineHandler = {});

}}

#endif
