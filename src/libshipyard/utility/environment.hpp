/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libshipyard_utility_environment_hpp
#define libshipyard_utility_environment_hpp

#include <string>

#include <boost/optional.hpp>


namespace libshipyard {
namespace environment {

boost::optional<std::string> getOptionalVariable(const std::string& key);
void setVariable(const std::string& key, const std::string& value);

}}

#endif
