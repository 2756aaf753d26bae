/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cstdio>
#include <cstring>
#include <cerrno>

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/utility/logging.hpp"


namespace libshipyard {
namespace process {

// Reads the C stream line by line. Lines longer than the internal buffer
// are reassembled before being handed over to the handler.
static void readCStreamLines(FILE* const in, const OutputLineHandler& handler) {
    char buffer[1024];
    auto line = std::string{};
    while(!feof(in)) {
        if(fgets(buffer, sizeof(buffer), in)) {
            line += buffer;
            if(!line.empty() && line.back() == '\n') {
                handler(line);
                line.clear();
            }
        }
        else if(!feof(in)) {
            SHIPYARD_THROW_ERROR("Failed to read C stream: call to fgets() failed.");
        }
    }
    if(!line.empty()) {
        handler(line);
    }
}

// Waits for a child whose output is abandoned after an error. Once the pipe is
// closed, the child gets SIGPIPE on its next write.
static void reapAbandonedChild(pid_t pid) {
    int status;
    while(waitpid(pid, &status, 0) == -1) {
        if(errno != EINTR) {
            logMessage(boost::format("Failed to waitpid abandoned subprocess (pid %d): %s") % pid % strerror(errno),
                       libshipyard::LogLevel::DEBUG);
            return;
        }
    }
}

int forkExecWait(const libshipyard::CLIArguments& args,
                 const boost::optional<std::function<void()>>& preExecChildActions,
                 const boost::optional<std::function<void(int)>>& postForkParentActions,
                 const OutputLineHandler& childStdoutLineHandler) {
    logMessage(boost::format("Forking and executing '%s'") % args, libshipyard::LogLevel::DEBUG);

    int pipefd[2];
    if(childStdoutLineHandler) {
        if(pipe2(pipefd, O_CLOEXEC) == -1) {
            auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
                % args % strerror(errno);
            SHIPYARD_THROW_ERROR(message.str());
        }
    }

    // no allocation in the child
    auto argv = args.argv();

    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args % strerror(errno);
        SHIPYARD_THROW_ERROR(message.str());
    }

    bool isChild = pid == 0;
    if(isChild) {
        if(childStdoutLineHandler) {
            // Redirect stdout to write to the pipe, the pipe ends are closed on exec
            dup2(pipefd[1], STDOUT_FILENO);
        }
        if(preExecChildActions) {
            (*preExecChildActions)();
        }
        execvp(argv[0], argv);
        // only async-signal-safe calls from here on: the parent may be multithreaded
        const char message[] = "Failed to execvp subprocess\n";
        auto written = write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)written;
        _exit(127);
    }

    if(postForkParentActions) {
        (*postForkParentActions)(pid);
    }
    if(childStdoutLineHandler) {
        // Close the write end of the pipe, as it won't be used
        close(pipefd[1]);

        FILE *childStdoutPipe = fdopen(pipefd[0], "r");
        if(!childStdoutPipe) {
            close(pipefd[0]);
            reapAbandonedChild(pid);
            auto message = boost::format("Failed to open stdout of subprocess %s: %s") % args % strerror(errno);
            SHIPYARD_THROW_ERROR(message.str());
        }
        try {
            readCStreamLines(childStdoutPipe, childStdoutLineHandler);
        } catch(const std::exception& e) {
            fclose(childStdoutPipe);
            reapAbandonedChild(pid);
            auto message = boost::format("Failed to read stdout from subprocess %s") % args;
            SHIPYARD_RETHROW_ERROR(e, message.str());
        }
        fclose(childStdoutPipe);
    }

    int status;
    do {
        if(waitpid(pid, &status, 0) == -1) {
            auto message = boost::format("Failed to waitpid subprocess %s: %s")
                % args % strerror(errno);
            SHIPYARD_THROW_ERROR(message.str());
        }
    } while(!WIFEXITED(status) && !WIFSIGNALED(status));

    if(!WIFEXITED(status)) {
        auto message = boost::format("Subprocess %s terminated abnormally")
            % args;
        SHIPYARD_THROW_ERROR(message.str());
    }

    logMessage( boost::format("%s (pid %d) exited with status %d") % args % pid % WEXITSTATUS(status),
                libshipyard::LogLevel::DEBUG);

    return WEXITSTATUS(status);
}

}}
