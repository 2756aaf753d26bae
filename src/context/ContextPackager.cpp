/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ContextPackager.hpp"

#include <algorithm>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

#include "context/eolConversion.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace context {

ContextPackager::ContextPackager(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

libshipyard::PathRAII ContextPackager::packageContext(const boost::filesystem::path& directory,
                                                      const PackageOptions& options) const {
    printLog(boost::format("Packaging build context %s") % directory, libshipyard::LogLevel::INFO);

    auto archivePath = config->makeTemporaryPath("shipyard-context");
    archivePath += ".tar";
    auto archive = libshipyard::PathRAII{archivePath};

    try {
        auto ignorer = options.ignorer;
        if(!ignorer) {
            ignorer = std::make_shared<ArchiveMatchIgnorer>(directory, options.ignoreMode);
        }

        auto files = listFiles(directory);

        auto dockerignoreFiles = std::vector<boost::filesystem::path>{};
        auto gitignoreFiles = std::vector<boost::filesystem::path>{};
        for(const auto& file : files) {
            auto type = ignorer->getIgnoreFileType(file);
            if(type == IgnoreFileType::DockerIgnore) {
                dockerignoreFiles.push_back(directory / file);
            }
            else if(type == IgnoreFileType::GitIgnore) {
                gitignoreFiles.push_back(directory / file);
            }
            if(type != IgnoreFileType::None) {
                ignorer->addIgnoreFile(file, type);
            }
        }

        if(options.ignoreMode != IgnoreMode::DockerIgnoreOnly) {
            if(options.ignoreFileWarning) {
                options.ignoreFileWarning(dockerignoreFiles, gitignoreFiles);
            }
            else {
                printIgnoreFileWarning(dockerignoreFiles, gitignoreFiles);
            }
        }

        files.erase(std::remove_if(files.begin(), files.end(), [&ignorer](const boost::filesystem::path& file) {
            return !ignorer->filter(file);
        }), files.end());

        bool isEolPlatform = options.isEolConversionPlatform
            ? options.isEolConversionPlatform()
            : isEolConversionPlatform();
        if(options.convertEol && !isEolPlatform) {
            printLog(boost::format("Line ending conversion is not applicable on this platform"),
                     libshipyard::LogLevel::DEBUG);
        }

        auto writer = ArchiveWriter{archive.getPath()};
        for(const auto& file : files) {
            auto absolutePath = directory / file;

            struct stat sb;
            if(stat(absolutePath.c_str(), &sb) != 0) {
                auto message = boost::format("Failed to stat %s: %s") % absolutePath % strerror(errno);
                SHIPYARD_THROW_ERROR(message.str());
            }

            auto entry = ArchiveEntry{};
            entry.name = file.generic_string();
            entry.data = isEolPlatform
                ? readFileWithEolConversion(absolutePath, options.convertEol)
                : libshipyard::filesystem::readFile(absolutePath);
            entry.mode = sb.st_mode & 07777;
            entry.mtime = sb.st_mtime;
            writer.addEntry(entry);
        }

        if(options.preFinalize) {
            options.preFinalize(writer);
        }
        writer.finalize();

        printLog(boost::format("Packaged %d files of build context %s into %s")
                 % files.size() % directory % archive.getPath(),
                 libshipyard::LogLevel::DEBUG);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to package build context %s") % directory;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }

    return archive;
}

// Files (no directories) of the tree as relative paths, in lexicographic order
std::vector<boost::filesystem::path> ContextPackager::listFiles(const boost::filesystem::path& directory) const {
    if(!boost::filesystem::is_directory(directory)) {
        auto message = boost::format("Build context %s is not a directory") % directory;
        SHIPYARD_THROW_ERROR(message.str());
    }

    auto files = std::vector<boost::filesystem::path>{};
    auto end = boost::filesystem::recursive_directory_iterator{};
    for(auto it = boost::filesystem::recursive_directory_iterator{directory}; it != end; ++it) {
        if(boost::filesystem::is_directory(it->path())) {
            continue;
        }
        files.push_back(it->path().lexically_relative(directory));
    }
    std::sort(files.begin(), files.end());
    return files;
}

void ContextPackager::printIgnoreFileWarning(const std::vector<boost::filesystem::path>& dockerignoreFiles,
                                             const std::vector<boost::filesystem::path>& gitignoreFiles) const {
    if(dockerignoreFiles.empty() && gitignoreFiles.empty()) {
        return;
    }

    auto list = std::string{};
    for(const auto* files : {&dockerignoreFiles, &gitignoreFiles}) {
        for(const auto& file : *files) {
            list += "\n    " + file.string();
        }
    }

    if(gitignoreFiles.empty()) {
        printLog(boost::format("Using file ignore patterns from:%s") % list, libshipyard::LogLevel::INFO);
        return;
    }

    printLog(boost::format("Using file ignore patterns from:%s\n"
                           "Use of .gitignore files to filter the build context is deprecated."
                           " Use the dockerignore-only ignore mode to consider only the"
                           " .dockerignore file at the root of the project.") % list,
             libshipyard::LogLevel::WARN);
}

void ContextPackager::printLog(const boost::format& message, libshipyard::LogLevel level,
                               std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
