/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_context_ContextPackager_hpp
#define shipyard_context_ContextPackager_hpp

#include <functional>
#include <memory>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "context/Archive.hpp"
#include "context/FileIgnorer.hpp"
#include "libshipyard/LogLevel.hpp"
#include "libshipyard/PathRAII.hpp"


namespace shipyard {
namespace context {

using IgnoreFileWarning = std::function<void(const std::vector<boost::filesystem::path>& dockerignoreFiles,
                                             const std::vector<boost::filesystem::path>& gitignoreFiles)>;

struct PackageOptions {
    IgnoreMode ignoreMode = IgnoreMode::Legacy;
    bool convertEol = false;
    // called once with the archive writer right before the archive is finalized
    std::function<void(ArchiveWriter&)> preFinalize;
    // defaults to a log message, never called in IgnoreMode::DockerIgnoreOnly
    IgnoreFileWarning ignoreFileWarning;
    // defaults to an ArchiveMatchIgnorer rooted at the packaged directory
    std::shared_ptr<FileIgnorer> ignorer;
    std::function<bool()> isEolConversionPlatform;
};

/**
 * Turns a source directory into a tar archive suitable as a daemon build context.
 */
class ContextPackager {
public:
    ContextPackager(std::shared_ptr<const common::Config> config);
    libshipyard::PathRAII packageContext(const boost::filesystem::path& directory, const PackageOptions& options) const;

private:
    std::vector<boost::filesystem::path> listFiles(const boost::filesystem::path& directory) const;
    void printIgnoreFileWarning(const std::vector<boost::filesystem::path>& dockerignoreFiles,
                                const std::vector<boost::filesystem::path>& gitignoreFiles) const;
    void printLog(const boost::format& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    std::string sysname = "ContextPackager";
};

}
}

#endif
