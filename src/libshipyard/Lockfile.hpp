/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef libshipyard_Lockfile_hpp
#define libshipyard_Lockfile_hpp

#include <chrono>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

namespace libshipyard {

/**
 * Inter-process lock on a file, held as long as the sibling "<file>.lock" exists.
 *
 * The lockfile is created with O_EXCL and contains the pid of the holder, which
 * is reported while other processes wait for it. Without a timeout the constructor
 * waits indefinitely. The lock is released on destruction.
 */
class Lockfile {
public:
    using Timeout = boost::optional<std::chrono::milliseconds>;

public:
    Lockfile() = default;
    explicit Lockfile(const boost::filesystem::path& file,
                      Timeout timeout = boost::none,
                      std::chrono::milliseconds warningInterval = std::chrono::seconds{1});
    Lockfile(const Lockfile&) = delete;
    Lockfile(Lockfile&&);
    ~Lockfile();

    Lockfile& operator=(const Lockfile&) = delete;
    Lockfile& operator=(Lockfile&&);

private:
    bool tryCreate() const;
    std::string readHolder() const;
    void release();

private:
    const std::string sysname = "Lockfile";
    boost::optional<boost::filesystem::path> lockfile;
};

}

#endif
