/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>

#include "libshipyard/Error.hpp"
#include "release/ImageLocation.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace release {
namespace test {

TEST_GROUP(ImageLocationTestGroup) {
};

TEST(ImageLocationTestGroup, defaultTag) {
    auto location = parseImageLocation("registry2.example.com/v2/0a1b2c3d4e5f");
    CHECK_EQUAL(location.registry, std::string{"registry2.example.com"});
    CHECK_EQUAL(location.repository, std::string{"v2/0a1b2c3d4e5f"});
    CHECK_EQUAL(location.tag, std::string{"latest"});
    CHECK_EQUAL(location.getName(), std::string{"registry2.example.com/v2/0a1b2c3d4e5f"});
    CHECK_EQUAL(location.getReference(), std::string{"registry2.example.com/v2/0a1b2c3d4e5f:latest"});
}

TEST(ImageLocationTestGroup, explicitTag) {
    auto location = parseImageLocation("registry2.example.com/v2/0a1b2c3d4e5f:build-12");
    CHECK_EQUAL(location.repository, std::string{"v2/0a1b2c3d4e5f"});
    CHECK_EQUAL(location.tag, std::string{"build-12"});
}

TEST(ImageLocationTestGroup, registryWithPort) {
    auto location = parseImageLocation("localhost:5000/myapp/main:v1");
    CHECK_EQUAL(location.registry, std::string{"localhost:5000"});
    CHECK_EQUAL(location.repository, std::string{"myapp/main"});
    CHECK_EQUAL(location.tag, std::string{"v1"});

    // a colon followed by a slash is part of the repository
    location = parseImageLocation("localhost:5000/my:app/main");
    CHECK_EQUAL(location.repository, std::string{"my:app/main"});
    CHECK_EQUAL(location.tag, std::string{"latest"});
}

TEST(ImageLocationTestGroup, invalidLocation) {
    CHECK_THROWS(libshipyard::Error, parseImageLocation("postgres"));
    CHECK_THROWS(libshipyard::Error, parseImageLocation(""));
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
