/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_builder_BuiltImage_hpp
#define shipyard_builder_BuiltImage_hpp

#include <chrono>
#include <cstddef>
#include <string>

#include <boost/optional.hpp>

#include "libshipyard/Error.hpp"


namespace shipyard {
namespace builder {

struct BuiltImage {
    std::string serviceName;
    bool successful = false;
    boost::optional<std::string> error;
    // the external image reference or the tag of the build
    std::string name;
    // truncated at a line boundary
    std::string logs;
    boost::optional<std::chrono::system_clock::time_point> startTime;
    boost::optional<std::chrono::system_clock::time_point> endTime;
    std::size_t size = 0;
    std::string dockerfile;
    std::string projectType;
};

/**
 * Failure of the build (or pull) of a service. The error trace of the
 * underlying failure is preserved.
 */
class ServiceBuildError : public libshipyard::Error {
public:
    ServiceBuildError(const std::string& serviceName, const libshipyard::Error& cause)
        : libshipyard::Error{cause}
        , serviceName{serviceName}
    {}

    const std::string& getServiceName() const {
        return serviceName;
    }

private:
    std::string serviceName;
};

}
}

#endif
