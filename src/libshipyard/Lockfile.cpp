/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "Lockfile.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"

namespace libshipyard {

Lockfile::Lockfile(const boost::filesystem::path& file, Timeout timeout, std::chrono::milliseconds warningInterval) {
    auto path = file;
    path += ".lock";

    auto& logger = Logger::getInstance();
    logger.log(boost::format("Acquiring lock on %s") % file, sysname, LogLevel::DEBUG);

    const auto pollInterval = std::chrono::milliseconds{100};
    auto waited = std::chrono::milliseconds{0};
    auto sinceWarning = std::chrono::milliseconds{0};

    lockfile = path;
    while(!tryCreate()) {
        if(timeout && waited >= *timeout) {
            auto holder = readHolder();
            lockfile.reset();
            auto message = boost::format("Failed to acquire lock on %s within %d ms (held by %s)")
                % path % timeout->count() % holder;
            SHIPYARD_THROW_ERROR(message.str());
        }
        std::this_thread::sleep_for(pollInterval);
        waited += pollInterval;
        sinceWarning += pollInterval;
        if(sinceWarning >= warningInterval) {
            sinceWarning = std::chrono::milliseconds{0};
            logger.log(boost::format("Waiting for lock on %s held by %s (%d ms so far)")
                       % path % readHolder() % waited.count(),
                       sysname, LogLevel::WARN);
        }
    }

    logger.log(boost::format("Acquired lock %s") % path, sysname, LogLevel::DEBUG);
}

Lockfile::Lockfile(Lockfile&& rhs)
    : lockfile{std::move(rhs.lockfile)}
{
    rhs.lockfile.reset();
}

Lockfile& Lockfile::operator=(Lockfile&& rhs) {
    if(this != &rhs) {
        release();
        lockfile = std::move(rhs.lockfile);
        rhs.lockfile.reset();
    }
    return *this;
}

Lockfile::~Lockfile() {
    release();
}

void Lockfile::release() {
    if(!lockfile) {
        return;
    }
    Logger::getInstance().log(boost::format("Releasing lock %s") % *lockfile, sysname, LogLevel::DEBUG);
    auto ec = boost::system::error_code{};
    boost::filesystem::remove(*lockfile, ec);
    lockfile.reset();
}

bool Lockfile::tryCreate() const {
    auto fd = open(lockfile->c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if(fd == -1) {
        if(errno != EEXIST) {
            auto message = boost::format("Failed to create lockfile %s: %s") % *lockfile % strerror(errno);
            SHIPYARD_THROW_ERROR(message.str());
        }
        return false;
    }

    auto pid = std::to_string(getpid()) + "\n";
    auto written = write(fd, pid.c_str(), pid.size());
    auto writeErrno = errno;
    if(close(fd) != 0 || written != static_cast<ssize_t>(pid.size())) {
        boost::filesystem::remove(*lockfile);
        auto message = boost::format("Failed to write lockfile %s: %s") % *lockfile % strerror(writeErrno);
        SHIPYARD_THROW_ERROR(message.str());
    }
    return true;
}

std::string Lockfile::readHolder() const {
    auto ifs = std::ifstream{lockfile->string()};
    auto pid = std::string{};
    if(!(ifs >> pid)) {
        return "an unknown process";
    }
    return "pid " + pid;
}

}
