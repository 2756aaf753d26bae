/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "InterruptGuard.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace renderer {

namespace {

volatile sig_atomic_t interruptWriteFd = -1;

const char interruptByte = 'i';

void handleInterrupt(int) {
    auto savedErrno = errno;
    int fd = interruptWriteFd;
    if(fd != -1) {
        auto written = ::write(fd, &interruptByte, 1);
        (void)written; // nothing else can be done in signal context
    }
    errno = savedErrno;
}

}

InterruptGuard::InterruptGuard(std::function<void()> onInterrupt) {
    int fds[2];
    if(pipe2(fds, O_CLOEXEC) != 0) {
        auto message = boost::format("Failed to create interrupt pipe: %s") % strerror(errno);
        SHIPYARD_THROW_ERROR(message.str());
    }
    writeFd = fds[1];

    watcher = std::thread{&InterruptGuard::watch, fds[0], std::move(onInterrupt)};

    previousWriteFd = interruptWriteFd;
    interruptWriteFd = writeFd;

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if(sigaction(SIGINT, &action, &previousAction) != 0) {
        auto message = boost::format("Failed to install SIGINT handler: %s") % strerror(errno);
        interruptWriteFd = previousWriteFd;
        close(writeFd);
        watcher.join();
        SHIPYARD_THROW_ERROR(message.str());
    }
}

InterruptGuard::~InterruptGuard() {
    release();
}

void InterruptGuard::release() {
    std::lock_guard<std::mutex> lock{mutex};
    if(isReleased) {
        return;
    }
    isReleased = true;

    if(sigaction(SIGINT, &previousAction, nullptr) != 0) {
        libshipyard::logMessage(boost::format("Failed to restore SIGINT handler: %s") % strerror(errno),
                                libshipyard::LogLevel::WARN);
    }
    interruptWriteFd = previousWriteFd;

    // end of file on the pipe stops the watcher
    close(writeFd);

    if(watcher.get_id() == std::this_thread::get_id()) {
        watcher.detach();
    }
    else {
        watcher.join();
    }
}

void InterruptGuard::watch(int readFd, std::function<void()> onInterrupt) {
    char byte = 0;
    while(true) {
        auto count = ::read(readFd, &byte, 1);
        if(count == -1 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(readFd);

    if(byte == interruptByte) {
        try {
            onInterrupt();
        }
        catch(const libshipyard::Error& e) {
            libshipyard::Logger::getInstance().logErrorTrace(e, "InterruptGuard");
        }
        catch(const std::exception& e) {
            libshipyard::logMessage(boost::format("Interrupt handling failed: %s") % e.what(),
                                    libshipyard::LogLevel::ERROR);
        }
    }
}

}
}
