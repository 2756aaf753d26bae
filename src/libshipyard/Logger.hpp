/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef libshipyard_Logger_hpp
#define libshipyard_Logger_hpp

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

#include <boost/format.hpp>

#include "libshipyard/LogLevel.hpp"
#include "libshipyard/Error.hpp"

namespace libshipyard {

/**
 * Process-wide logger.
 *
 * Messages are prefixed with a tag naming their level, e.g. "[Info]    ". In debug
 * mode the prefix also carries a monotonic timestamp and the name of the subsystem
 * that logged the message. GENERAL messages are printed as they are, and are never
 * filtered out. WARN and ERROR messages go to the error stream.
 */
class Logger {
public:
    static Logger& getInstance();

    // Level tag padded to a common width, e.g. "[Warn]    ". Empty for GENERAL.
    static std::string getLevelTag(libshipyard::LogLevel logLevel);

    void log(const std::string& message, const std::string& sysName, const libshipyard::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libshipyard::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libshipyard::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);

    void setLevel(libshipyard::LogLevel logLevel) { level = logLevel; }
    libshipyard::LogLevel getLevel() const { return level; }
    // ANSI colors on the level tags, for terminals
    void setColored(bool colored) { this->colored = colored; }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makePrefix(libshipyard::LogLevel logLevel, const std::string& systemName) const;

private:
    std::atomic<libshipyard::LogLevel> level{libshipyard::LogLevel::WARN};
    std::atomic<bool> colored{false};
    std::mutex mutex;
};

}

#endif
