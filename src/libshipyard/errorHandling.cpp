/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "Error.hpp"

#include <future>
#include <ios>
#include <new>
#include <stdexcept>
#include <system_error>

namespace libshipyard {

// Most derived types first: future_error is a logic_error,
// ios_base::failure is a system_error
std::string getExceptionTypeString(const std::exception& e) {
    if(dynamic_cast<const std::future_error*>(&e)) {
        return "future error";
    }
    if(dynamic_cast<const std::ios_base::failure*>(&e)) {
        return "ios_base failure";
    }
    if(dynamic_cast<const std::system_error*>(&e)) {
        return "system error";
    }
    if(dynamic_cast<const std::logic_error*>(&e)) {
        return "logic error";
    }
    if(dynamic_cast<const std::runtime_error*>(&e)) {
        return "runtime error";
    }
    if(dynamic_cast<const std::bad_alloc*>(&e)) {
        return "allocation failure";
    }
    return "generic exception";
}

Error Error::fromException(const std::exception& exception, LogLevel logLevel) {
    return Error{logLevel, ErrorTraceEntry{exception.what(), "unspecified location", -1, getExceptionTypeString(exception)}};
}

}
