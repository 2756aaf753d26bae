/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_release_ImageLocation_hpp
#define shipyard_release_ImageLocation_hpp

#include <string>


namespace shipyard {
namespace release {

/**
 * Storage location of a service image in the registry, e.g.
 * "registry.example.com/v2/0a1b2c3d:latest".
 */
struct ImageLocation {
    std::string registry;
    std::string repository;
    std::string tag;

    // "<registry>/<repository>"
    std::string getName() const;
    // "<registry>/<repository>:<tag>"
    std::string getReference() const;
};

// The tag defaults to "latest"
ImageLocation parseImageLocation(const std::string& location);

}
}

#endif
