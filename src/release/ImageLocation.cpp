/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageLocation.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libshipyard/Error.hpp"


namespace shipyard {
namespace release {

std::string ImageLocation::getName() const {
    return registry + "/" + repository;
}

std::string ImageLocation::getReference() const {
    return getName() + ":" + tag;
}

ImageLocation parseImageLocation(const std::string& location) {
    static const boost::regex pattern{"(.*?)/(.*?)(?::([^/]*))?"};

    auto matches = boost::smatch{};
    if(!boost::regex_match(location, matches, pattern)) {
        auto message = boost::format("Could not parse imageName: '%s'") % location;
        SHIPYARD_THROW_ERROR(message.str());
    }

    auto result = ImageLocation{};
    result.registry = matches[1].str();
    result.repository = matches[2].str();
    result.tag = matches[3].matched ? matches[3].str() : std::string{"latest"};
    return result;
}

}
}
