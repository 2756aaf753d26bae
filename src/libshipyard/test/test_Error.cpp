/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include <exception>
#include <future>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>

#include "aux/unitTestMain.hpp"
#include "libshipyard/Error.hpp"


namespace libshipyard {
namespace test {

TEST_GROUP(ErrorTestGroup) {
};

static int throwLine;
static int rethrowLine;

static void failToReachDaemon() {
    throwLine = __LINE__ + 1;
    SHIPYARD_THROW_ERROR("Cannot connect to the Docker daemon");
}

static void failToBuildService() {
    try {
        failToReachDaemon();
    }
    catch(libshipyard::Error& error) {
        rethrowLine = __LINE__ + 1;
        SHIPYARD_RETHROW_ERROR(error, "Failed to build service main");
    }
}

static void failToParseComposition() {
    try {
        throw std::runtime_error("unexpected end of input");
    }
    catch(const std::exception& e) {
        rethrowLine = __LINE__ + 1;
        SHIPYARD_RETHROW_ERROR(e, "Failed to read composition");
    }
}

static void failWithUsageError() {
    try {
        failToReachDaemon();
    }
    catch(libshipyard::Error& error) {
        SHIPYARD_RETHROW_ERROR(error, "See 'shipyard help build'", libshipyard::LogLevel::INFO);
    }
}

class PushError : public libshipyard::Error {
public:
    PushError(const std::string& repository, const libshipyard::Error::ErrorTraceEntry& entry)
        : libshipyard::Error{libshipyard::LogLevel::ERROR, entry}
        , repository{repository}
    {}
    std::string repository;
};

static void failToPush() {
    try {
        throw PushError{"registry.test/v2/abc123", SHIPYARD_MAKE_ERROR_TRACE_ENTRY("denied")};
    }
    catch(libshipyard::Error& error) {
        SHIPYARD_RETHROW_ERROR(error, "Failed to push images");
    }
}

TEST(ErrorTestGroup, throwCreatesOneEntry) {
    try {
        failToReachDaemon();
        FAIL("expected exception");
    }
    catch(const libshipyard::Error& error) {
        auto expected = libshipyard::Error::ErrorTraceEntry{
            "Cannot connect to the Docker daemon", "test_Error.cpp", throwLine, "failToReachDaemon"};
        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        CHECK(error.getErrorTrace()[0] == expected);
        CHECK(error.getLogLevel() == libshipyard::LogLevel::ERROR);
        CHECK_EQUAL(std::string{"Cannot connect to the Docker daemon"}, error.what());
        CHECK_EQUAL(std::string{"Cannot connect to the Docker daemon"}, error.getOutermostMessage());
    }
}

TEST(ErrorTestGroup, rethrowAppendsEntry) {
    try {
        failToBuildService();
        FAIL("expected exception");
    }
    catch(const libshipyard::Error& error) {
        auto expected = libshipyard::Error::ErrorTraceEntry{
            "Failed to build service main", "test_Error.cpp", rethrowLine, "failToBuildService"};
        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[1] == expected);
        CHECK(error.getErrorTrace()[0] != expected);
        // what() reports the innermost failure
        CHECK_EQUAL(std::string{"Cannot connect to the Docker daemon"}, error.what());
        CHECK_EQUAL(std::string{"Failed to build service main"}, error.getOutermostMessage());
    }
}

TEST(ErrorTestGroup, rethrowWrapsStdException) {
    try {
        failToParseComposition();
        FAIL("expected exception");
    }
    catch(const libshipyard::Error& error) {
        auto expectedFirst = libshipyard::Error::ErrorTraceEntry{
            "unexpected end of input", "unspecified location", -1, "runtime error"};
        auto expectedSecond = libshipyard::Error::ErrorTraceEntry{
            "Failed to read composition", "test_Error.cpp", rethrowLine, "failToParseComposition"};
        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirst);
        CHECK(error.getErrorTrace()[1] == expectedSecond);
        CHECK(error.getLogLevel() == libshipyard::LogLevel::ERROR);
    }
}

TEST(ErrorTestGroup, rethrowOverridesLogLevel) {
    try {
        failWithUsageError();
        FAIL("expected exception");
    }
    catch(const libshipyard::Error& error) {
        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getLogLevel() == libshipyard::LogLevel::INFO);
    }
}

TEST(ErrorTestGroup, rethrowPreservesDerivedType) {
    try {
        failToPush();
        FAIL("expected exception");
    }
    catch(const PushError& error) {
        CHECK_EQUAL(std::string{"registry.test/v2/abc123"}, error.repository);
        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK_EQUAL(std::string{"Failed to push images"}, error.getOutermostMessage());
    }
}

TEST(ErrorTestGroup, exceptionTypeString) {
    CHECK_EQUAL(libshipyard::getExceptionTypeString(std::logic_error{""}), std::string{"logic error"});
    CHECK_EQUAL(libshipyard::getExceptionTypeString(std::runtime_error{""}), std::string{"runtime error"});
    CHECK_EQUAL(libshipyard::getExceptionTypeString(std::system_error{std::error_code{}}), std::string{"system error"});
    CHECK_EQUAL(libshipyard::getExceptionTypeString(std::future_error{std::future_errc::broken_promise}),
                std::string{"future error"});
    CHECK_EQUAL(libshipyard::getExceptionTypeString(std::bad_alloc{}), std::string{"allocation failure"});
}

}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
