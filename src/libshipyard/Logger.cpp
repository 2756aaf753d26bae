/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "libshipyard/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <time.h>

#include "libshipyard/Error.hpp"

namespace libshipyard {

namespace {

const char* getLevelColor(libshipyard::LogLevel logLevel) {
    switch(logLevel) {
        case libshipyard::LogLevel::DEBUG: return "\033[35m";
        case libshipyard::LogLevel::INFO:  return "\033[36m";
        case libshipyard::LogLevel::WARN:  return "\033[33m";
        case libshipyard::LogLevel::ERROR: return "\033[31m";
        default:                           return "";
    }
}

std::string makeTimestamp() {
    auto tp = timespec{};
    if(clock_gettime(CLOCK_MONOTONIC, &tp) != 0) {
        auto message = boost::format("Logger failed to read the monotonic clock: %s") % strerror(errno);
        SHIPYARD_THROW_ERROR(message.str());
    }
    return (boost::format("[%d.%09d] ") % tp.tv_sec % tp.tv_nsec).str();
}

}

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

std::string Logger::getLevelTag(libshipyard::LogLevel logLevel) {
    switch(logLevel) {
        case libshipyard::LogLevel::DEBUG:   return "[Debug]   ";
        case libshipyard::LogLevel::INFO:    return "[Info]    ";
        case libshipyard::LogLevel::WARN:    return "[Warn]    ";
        case libshipyard::LogLevel::ERROR:   return "[Error]   ";
        case libshipyard::LogLevel::GENERAL: return "";
    }
    SHIPYARD_THROW_ERROR("Logger cannot name an unknown log level");
}

void Logger::log(const std::string& message, const std::string& systemName, const libshipyard::LogLevel& logLevel,
                 std::ostream& out_stream, std::ostream& err_stream) {
    if(logLevel < level.load()) {
        return;
    }

    auto line = makePrefix(logLevel, systemName) + message;
    auto& stream = (logLevel == libshipyard::LogLevel::WARN || logLevel == libshipyard::LogLevel::ERROR)
        ? err_stream : out_stream;

    std::lock_guard<std::mutex> lock{mutex};
    stream << line << std::endl;
}

void Logger::log(const boost::format& message, const std::string& systemName, const libshipyard::LogLevel& logLevel,
                 std::ostream& out_stream, std::ostream& err_stream) {
    log(message.str(), systemName, logLevel, out_stream, err_stream);
}

void Logger::logErrorTrace(const libshipyard::Error& error, const std::string& systemName, std::ostream& errStream) {
    if(error.getLogLevel() < level.load()) {
        return;
    }

    const auto& trace = error.getErrorTrace();
    log(error.getOutermostMessage(), systemName, LogLevel::ERROR, std::cout, errStream);
    if(trace.size() < 2 && level.load() > LogLevel::DEBUG) {
        return;
    }

    std::lock_guard<std::mutex> lock{mutex};
    errStream << "Error trace (most nested error last):\n";
    for(std::size_t i = 0; i < trace.size(); ++i) {
        const auto& entry = trace[trace.size() - i - 1];
        auto location = entry.fileLine != -1
            ? (boost::format("%s:%d") % entry.fileName.string() % entry.fileLine).str()
            : entry.fileName.string();
        errStream << boost::format("  #%-2d %s at %s: %s\n") % i % entry.functionName % location % entry.errorMessage;
    }
}

std::string Logger::makePrefix(libshipyard::LogLevel logLevel, const std::string& systemName) const {
    if(logLevel == libshipyard::LogLevel::GENERAL) {
        return "";
    }

    auto prefix = colored.load()
        ? std::string{getLevelColor(logLevel)} + getLevelTag(logLevel) + "\033[0m"
        : getLevelTag(logLevel);
    if(level.load() == libshipyard::LogLevel::DEBUG) {
        prefix += makeTimestamp() + "[" + systemName + "] ";
    }
    return prefix;
}

}
