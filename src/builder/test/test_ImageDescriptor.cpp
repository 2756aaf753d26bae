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

#include <boost/filesystem.hpp>

#include "builder/ImageDescriptor.hpp"
#include "libshipyard/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace builder {
namespace test {

TEST_GROUP(ImageDescriptorTestGroup) {
};

TEST(ImageDescriptorTestGroup, makeProject) {
    auto composition = libshipyard::json::parse(R"({
        "name": "MyApp",
        "services": {
            "frontend": { "build": { "context": "frontend", "args": { "NODE_ENV": "production", "PORT": 80 } } },
            "cache": { "build": "cache", "image": "myapp/cache" },
            "db": { "image": "postgres:15" }
        }
    })");
    auto project = makeProject("/home/user/myapp", composition);

    CHECK_EQUAL(project.name, std::string{"MyApp"});
    CHECK(project.directory == boost::filesystem::path{"/home/user/myapp"});
    CHECK(project.composition.HasMember("services"));
    CHECK_EQUAL(project.descriptors.size(), 3u);

    const auto& frontend = project.descriptors[0];
    CHECK_EQUAL(frontend.serviceName, std::string{"frontend"});
    CHECK(!frontend.isExternal());
    CHECK(frontend.getBuild().context == boost::filesystem::path{"frontend"});
    CHECK_EQUAL(frontend.getBuild().args.at("NODE_ENV"), std::string{"production"});
    CHECK_EQUAL(frontend.getBuild().args.at("PORT"), std::string{"80"});
    CHECK(!frontend.getBuild().tag);
    CHECK_EQUAL(frontend.getImageName(), std::string{""});

    const auto& cache = project.descriptors[1];
    CHECK(cache.getBuild().context == boost::filesystem::path{"cache"});
    CHECK_EQUAL(cache.getImageName(), std::string{"myapp/cache"});

    const auto& db = project.descriptors[2];
    CHECK(db.isExternal());
    CHECK_EQUAL(db.getImageReference(), std::string{"postgres:15"});
    CHECK_EQUAL(db.getImageName(), std::string{"postgres:15"});
    CHECK_THROWS(libshipyard::Error, db.getBuild());
    CHECK_THROWS(libshipyard::Error, frontend.getImageReference());
}

TEST(ImageDescriptorTestGroup, projectName) {
    auto composition = libshipyard::json::parse(R"({"services": {"main": {"build": "."}}})");
    CHECK_EQUAL(makeProject("/home/user/myapp", composition).name, std::string{"myapp"});
    CHECK_EQUAL(makeProject("/home/user/myapp", composition, std::string{"other"}).name, std::string{"other"});
    CHECK(makeProject("/home/user/myapp", composition).descriptors[0].getBuild().context == boost::filesystem::path{"."});
}

TEST(ImageDescriptorTestGroup, invalidCompositions) {
    CHECK_THROWS(libshipyard::Error, makeProject("/p", libshipyard::json::parse(R"({})")));
    CHECK_THROWS(libshipyard::Error, makeProject("/p", libshipyard::json::parse(R"({"services": {}})")));
    CHECK_THROWS(libshipyard::Error, makeProject("/p", libshipyard::json::parse(R"({"services": {"main": {}}})")));
    CHECK_THROWS(libshipyard::Error, makeProject("/p", libshipyard::json::parse(R"({"services": {"main": {"image": 1}}})")));
    CHECK_THROWS(libshipyard::Error, makeProject("/p", libshipyard::json::parse(R"({"services": {"main": {"build": {"args": []}}}})")));
}

TEST(ImageDescriptorTestGroup, duplicateServiceName) {
    auto composition = libshipyard::json::parse(
        R"({"services": {"main": {"build": "."}, "db": {"image": "redis"}, "main": {"image": "alpine"}}})");
    try {
        makeProject("/p", composition);
        FAIL("expected an error");
    }
    catch(const libshipyard::Error& e) {
        CHECK_EQUAL(e.getOutermostMessage(), std::string{"Invalid composition: service main is defined more than once"});
    }
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
