/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sys/stat.h>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/utility/logging.hpp"
#include "libshipyard/utility/string.hpp"

namespace libshipyard {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    if(path.empty() || boost::filesystem::is_directory(path)) {
        return;
    }
    logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);

    auto error = boost::system::error_code{};
    boost::filesystem::create_directories(path, error);
    // a concurrent process may have created it in the meantime
    if(error && !boost::filesystem::is_directory(path)) {
        auto message = boost::format("Failed to create directory %s: %s") % path % error.message();
        SHIPYARD_THROW_ERROR(message.str());
    }
}

void copyFile(const boost::filesystem::path& src, const boost::filesystem::path& dst) {
    logMessage(boost::format{"Copying %s to %s"} % src % dst, LogLevel::DEBUG);
    createFoldersIfNecessary(dst.parent_path());

    auto error = boost::system::error_code{};
    boost::filesystem::copy_file(src, dst, boost::filesystem::copy_option::overwrite_if_exists, error);
    if(error) {
        auto message = boost::format("Failed to copy %s to %s: %s") % src % dst % error.message();
        SHIPYARD_THROW_ERROR(message.str());
    }
}

void setPermissions(const boost::filesystem::path& path, mode_t mode) {
    if(chmod(path.c_str(), mode) != 0) {
        auto message = boost::format("Failed to set permissions %o on %s: %s") % mode % path % strerror(errno);
        SHIPYARD_THROW_ERROR(message.str());
    }
}

mode_t getPermissions(const boost::filesystem::path& path) {
    struct stat sb;
    if(stat(path.c_str(), &sb) != 0) {
        auto message = boost::format("Failed to stat %s: %s") % path % strerror(errno);
        SHIPYARD_THROW_ERROR(message.str());
    }
    return sb.st_mode & 07777;
}

std::string readFile(const boost::filesystem::path& path) {
    auto ifs = std::ifstream{path.string(), std::ios::binary};
    if(!ifs) {
        auto message = boost::format("Failed to open %s for reading") % path;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return std::string{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};
}

void writeTextFile(const std::string& text, const boost::filesystem::path& filename, const std::ios_base::openmode mode) {
    createFoldersIfNecessary(filename.parent_path());
    auto ofs = std::ofstream{filename.string(), mode};
    if(!ofs) {
        auto message = boost::format("Failed to open %s for writing") % filename;
        SHIPYARD_THROW_ERROR(message.str());
    }
    ofs << text;
    if(!ofs) {
        auto message = boost::format("Failed to write %s") % filename;
        SHIPYARD_THROW_ERROR(message.str());
    }
}

/**
 * Appends a random suffix to the path, retrying until the result does not exist.
 * Used instead of boost::filesystem::unique_path, which throws under an invalid locale.
 */
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    const std::size_t suffixLength = 16;
    auto candidate = boost::filesystem::path{};
    do {
        candidate = path.string() + "-" + string::generateRandom(suffixLength);
    } while(boost::filesystem::exists(candidate));
    return candidate;
}

}}
