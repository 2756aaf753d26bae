/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "environment.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/utility/logging.hpp"


namespace libshipyard {
namespace environment {

boost::optional<std::string> getOptionalVariable(const std::string& key) {
    const char* value = getenv(key.c_str());
    if(value == nullptr) {
        return boost::none;
    }
    return std::string{value};
}

void setVariable(const std::string& key, const std::string& value) {
    if(setenv(key.c_str(), value.c_str(), 1) != 0) {
        auto message = boost::format("Failed to set environment variable %s: %s") % key % strerror(errno);
        SHIPYARD_THROW_ERROR(message.str());
    }
    logMessage(boost::format("Set environment variable %s=%s") % key % value, libshipyard::LogLevel::DEBUG);
}

}}
