/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

#include <boost/format.hpp>

#include "Error.hpp"
#include "Logger.hpp"

namespace libshipyard {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    if(this != &rhs) {
        remove();
        path = std::move(rhs.path);
        rhs.release();
    }
    return *this;
}

PathRAII::~PathRAII() {
    remove();
}

const boost::filesystem::path& PathRAII::getPath() const {
    if(!path) {
        SHIPYARD_THROW_ERROR("Attempted to access the path of an empty PathRAII");
    }
    return *path;
}

bool PathRAII::hasPath() const {
    return static_cast<bool>(path);
}

void PathRAII::release() {
    path.reset();
}

void PathRAII::remove() noexcept {
    if(!path) {
        return;
    }
    auto ec = boost::system::error_code{};
    boost::filesystem::remove_all(*path, ec);
    if(ec) {
        auto message = boost::format("Failed to remove %s: %s") % *path % ec.message();
        Logger::getInstance().log(message, "PathRAII", LogLevel::WARN);
    }
}

}
