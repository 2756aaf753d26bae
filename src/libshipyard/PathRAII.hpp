/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libshipyard_PathRAII_hpp
#define libshipyard_PathRAII_hpp

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

namespace libshipyard {

// RAII wrapper for a path: manages the lifetime of a specified path,
// which is automatically removed by the destructor of this class.
// Used for the temporary tar archives and scratch directories of a build.
class PathRAII {
public:
    PathRAII() = default;
    PathRAII(const boost::filesystem::path& path);
    PathRAII(const PathRAII&) = delete;
    PathRAII(PathRAII&&);
    PathRAII& operator=(const PathRAII&) = delete;
    PathRAII& operator=(PathRAII&&);
    ~PathRAII();

    const boost::filesystem::path& getPath() const;
    bool hasPath() const;
    void release();

private:
    void remove() noexcept;

    boost::optional<boost::filesystem::path> path;
};

}

#endif
