/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_context_FileIgnorer_hpp
#define shipyard_context_FileIgnorer_hpp

#include <memory>
#include <string>
#include <vector>

#include <archive.h> // libarchive
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libshipyard/LogLevel.hpp"


namespace shipyard {
namespace context {

enum class IgnoreFileType { None, DockerIgnore, GitIgnore };

enum class IgnoreMode {
    Legacy,             // root .dockerignore plus every .gitignore of the tree
    DockerIgnoreOnly    // root .dockerignore only
};

/**
 * Classifies ignore files and filters the files of a build context.
 * All paths are relative to the root of the context.
 */
class FileIgnorer {
public:
    virtual ~FileIgnorer() = default;
    virtual IgnoreFileType getIgnoreFileType(const boost::filesystem::path& relativePath) const = 0;
    virtual void addIgnoreFile(const boost::filesystem::path& relativePath, IgnoreFileType type) = 0;
    // returns true if the file must be kept in the context
    virtual bool filter(const boost::filesystem::path& relativePath) const = 0;
};

/**
 * FileIgnorer based on libarchive's pattern matcher. Patterns of a .gitignore
 * file are rooted at the directory that holds it. The last matching pattern
 * decides, a leading '!' turns a pattern into an exception.
 */
class ArchiveMatchIgnorer : public FileIgnorer {
public:
    ArchiveMatchIgnorer(const boost::filesystem::path& rootDirectory, IgnoreMode mode);
    ArchiveMatchIgnorer(const ArchiveMatchIgnorer&) = delete;
    ArchiveMatchIgnorer& operator=(const ArchiveMatchIgnorer&) = delete;
    ~ArchiveMatchIgnorer();

    IgnoreFileType getIgnoreFileType(const boost::filesystem::path& relativePath) const override;
    void addIgnoreFile(const boost::filesystem::path& relativePath, IgnoreFileType type) override;
    bool filter(const boost::filesystem::path& relativePath) const override;

    void addPattern(const std::string& pattern, const boost::filesystem::path& baseDirectory = {});
    std::vector<std::string> getPatterns() const;

private:
    struct Rule {
        std::string pattern;
        bool isException;
        ::archive* match;
    };

    Rule makeRule(const std::string& pattern, const boost::filesystem::path& baseDirectory) const;
    static bool matches(const Rule& rule, ::archive_entry* entry);
    void printLog(const boost::format& message, libshipyard::LogLevel) const;

private:
    boost::filesystem::path rootDirectory;
    IgnoreMode mode;
    std::vector<Rule> rules;
    std::vector<Rule> trailingRules; // evaluated after the patterns of the ignore files
    std::string sysname = "FileIgnorer";
};

}
}

#endif
