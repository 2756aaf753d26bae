/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef libshipyard_utility_filesystem_hpp
#define libshipyard_utility_filesystem_hpp

#include <ios>
#include <string>
#include <sys/types.h>

#include <boost/filesystem.hpp>

namespace libshipyard {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
void copyFile(const boost::filesystem::path& src, const boost::filesystem::path& dst);
void setPermissions(const boost::filesystem::path& path, mode_t mode);
mode_t getPermissions(const boost::filesystem::path& path);
std::string readFile(const boost::filesystem::path& path);
void writeTextFile(const std::string& text,
                   const boost::filesystem::path& filename,
                   const std::ios_base::openmode mode = std::ios_base::out);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);

}}

#endif
