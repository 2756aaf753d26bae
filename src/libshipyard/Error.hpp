/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef libshipyard_Error_hpp
#define libshipyard_Error_hpp

#include <cstring>
#include <exception>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "libshipyard/LogLevel.hpp"

namespace libshipyard {

/**
 * Exception carrying an error trace: the innermost failure first, then one entry
 * for every stack frame that added context to it while propagating it.
 *
 * SHIPYARD_THROW_ERROR creates the first entry, SHIPYARD_RETHROW_ERROR appends one
 * and throws the same object again, so that subclasses survive the rethrow. A caught
 * Error must therefore be bound to a non-const reference before rethrowing it.
 * Subclasses with extra context (e.g. ServiceBuildError) are thrown directly with an
 * entry made by SHIPYARD_MAKE_ERROR_TRACE_ENTRY.
 *
 * The log level tells the Logger whether the trace is worth printing: usage errors
 * already reported to the user are raised with level INFO.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    // An Error whose first entry describes an exception of another type
    static Error fromException(const std::exception& exception, LogLevel logLevel);

    // Message of the innermost failure
    const char* what() const noexcept override {
        return errorTrace.front().errorMessage.c_str();
    }

    // Message of the last context added to the failure
    const std::string& getOutermostMessage() const {
        return errorTrace.back().errorMessage;
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


#define SHIPYARD_FILENAME (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define SHIPYARD_MAKE_ERROR_TRACE_ENTRY(errorMessage) \
    libshipyard::Error::ErrorTraceEntry{errorMessage, SHIPYARD_FILENAME, __LINE__, __func__}

// SHIPYARD_THROW_ERROR(message [, logLevel])
#define SHIPYARD_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define SHIPYARD_THROW_ERROR_2(errorMessage, logLevel) { \
    throw libshipyard::Error{logLevel, SHIPYARD_MAKE_ERROR_TRACE_ENTRY(errorMessage)}; \
}

#define SHIPYARD_THROW_ERROR_1(errorMessage) SHIPYARD_THROW_ERROR_2(errorMessage, libshipyard::LogLevel::ERROR)

#define SHIPYARD_THROW_ERROR(...) SHIPYARD_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, SHIPYARD_THROW_ERROR_2, SHIPYARD_THROW_ERROR_1)(__VA_ARGS__)


// SHIPYARD_RETHROW_ERROR(caughtException, message [, logLevel])
// Without a log level, an Error keeps its own and any other exception gets ERROR.
#define SHIPYARD_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define SHIPYARD_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto shipyardTraceEntry = SHIPYARD_MAKE_ERROR_TRACE_ENTRY(errorMessage); \
    auto shipyardLogLevel = logLevel; \
    if(auto* shipyardCaught = dynamic_cast<const libshipyard::Error*>(&exception)) { \
        auto* shipyardError = const_cast<libshipyard::Error*>(shipyardCaught); \
        shipyardError->setLogLevel(shipyardLogLevel); \
        shipyardError->appendErrorTraceEntry(shipyardTraceEntry); \
        throw; \
    } \
    auto shipyardWrapped = libshipyard::Error::fromException(exception, shipyardLogLevel); \
    shipyardWrapped.appendErrorTraceEntry(shipyardTraceEntry); \
    throw shipyardWrapped; \
}

#define SHIPYARD_RETHROW_ERROR_2(exception, errorMessage) { \
    auto* shipyardInner = dynamic_cast<const libshipyard::Error*>(&exception); \
    auto shipyardInheritedLevel = shipyardInner ? shipyardInner->getLogLevel() : libshipyard::LogLevel::ERROR; \
    SHIPYARD_RETHROW_ERROR_3(exception, errorMessage, shipyardInheritedLevel) \
}

#define SHIPYARD_RETHROW_ERROR(...) SHIPYARD_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, SHIPYARD_RETHROW_ERROR_3, SHIPYARD_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
