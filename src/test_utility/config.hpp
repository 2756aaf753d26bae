/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef shipyard_test_utility_config_hpp
#define shipyard_test_utility_config_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(ConfigRAII&&);
    ~ConfigRAII();
    std::shared_ptr<shipyard::common::Config> config;
    boost::filesystem::path rootDirectory;
};

// Config whose bin and temp directories live in a private scratch directory
ConfigRAII makeConfig();

}
}

#endif
