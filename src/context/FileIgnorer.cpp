/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FileIgnorer.hpp"

#include <sstream>

#include <archive_entry.h> // libarchive
#include <boost/algorithm/string.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace context {

ArchiveMatchIgnorer::ArchiveMatchIgnorer(const boost::filesystem::path& rootDirectory, IgnoreMode mode)
    : rootDirectory{rootDirectory}
    , mode{mode}
{
    if(mode == IgnoreMode::DockerIgnoreOnly) {
        rules.push_back(makeRule("**/.git", {}));
        for(const auto* pattern : {"!**/.shipyard", "!**/Dockerfile", "!**/Dockerfile.*", "!**/docker-compose.yml"}) {
            trailingRules.push_back(makeRule(pattern, {}));
        }
    }
}

ArchiveMatchIgnorer::~ArchiveMatchIgnorer() {
    for(auto* ruleSet : {&rules, &trailingRules}) {
        for(auto& rule : *ruleSet) {
            archive_match_free(rule.match);
        }
    }
}

IgnoreFileType ArchiveMatchIgnorer::getIgnoreFileType(const boost::filesystem::path& relativePath) const {
    if(relativePath == ".dockerignore") {
        return IgnoreFileType::DockerIgnore;
    }
    if(mode == IgnoreMode::Legacy && relativePath.filename() == ".gitignore") {
        return IgnoreFileType::GitIgnore;
    }
    return IgnoreFileType::None;
}

void ArchiveMatchIgnorer::addIgnoreFile(const boost::filesystem::path& relativePath, IgnoreFileType type) {
    if(type == IgnoreFileType::None) {
        return;
    }
    printLog(boost::format("reading ignore patterns from %s") % relativePath, libshipyard::LogLevel::DEBUG);

    auto baseDirectory = type == IgnoreFileType::GitIgnore ? relativePath.parent_path() : boost::filesystem::path{};
    auto content = libshipyard::filesystem::readFile(rootDirectory / relativePath);
    auto is = std::istringstream{content};
    auto line = std::string{};
    while(std::getline(is, line)) {
        boost::algorithm::trim(line);
        if(line.empty() || line[0] == '#') {
            continue;
        }
        addPattern(line, baseDirectory);
    }
}

void ArchiveMatchIgnorer::addPattern(const std::string& pattern, const boost::filesystem::path& baseDirectory) {
    rules.push_back(makeRule(pattern, baseDirectory));
}

std::vector<std::string> ArchiveMatchIgnorer::getPatterns() const {
    auto patterns = std::vector<std::string>{};
    for(const auto* ruleSet : {&rules, &trailingRules}) {
        for(const auto& rule : *ruleSet) {
            patterns.push_back((rule.isException ? "!" : "") + rule.pattern);
        }
    }
    return patterns;
}

bool ArchiveMatchIgnorer::filter(const boost::filesystem::path& relativePath) const {
    ::archive_entry* entry = archive_entry_new();
    archive_entry_copy_pathname(entry, relativePath.generic_string().c_str());

    bool isIgnored = false;
    for(const auto* ruleSet : {&rules, &trailingRules}) {
        for(const auto& rule : *ruleSet) {
            if(matches(rule, entry)) {
                isIgnored = !rule.isException;
            }
        }
    }

    archive_entry_free(entry);

    if(isIgnored) {
        printLog(boost::format("ignoring %s") % relativePath, libshipyard::LogLevel::DEBUG);
    }
    return !isIgnored;
}

// libarchive exclusion patterns are not anchored at the start, i.e. they already
// match at any directory depth. Leading "/" and "**/" are hence dropped.
ArchiveMatchIgnorer::Rule ArchiveMatchIgnorer::makeRule(const std::string& pattern,
                                                        const boost::filesystem::path& baseDirectory) const {
    auto rule = Rule{};
    auto normalized = pattern;
    rule.isException = boost::starts_with(normalized, "!");
    if(rule.isException) {
        normalized.erase(0, 1);
    }
    if(boost::starts_with(normalized, "**/")) {
        normalized.erase(0, 3);
    }
    else if(boost::starts_with(normalized, "/")) {
        normalized.erase(0, 1);
    }
    while(boost::ends_with(normalized, "/")) {
        normalized.pop_back();
    }
    if(!baseDirectory.empty()) {
        normalized = (baseDirectory / normalized).generic_string();
    }
    if(normalized.empty()) {
        auto message = boost::format("invalid ignore pattern '%s'") % pattern;
        SHIPYARD_THROW_ERROR(message.str());
    }
    rule.pattern = normalized;

    rule.match = archive_match_new();
    if(rule.match == nullptr) {
        SHIPYARD_THROW_ERROR("failed to allocate libarchive matcher");
    }
    if(archive_match_exclude_pattern(rule.match, rule.pattern.c_str()) != ARCHIVE_OK) {
        archive_match_free(rule.match);
        auto message = boost::format("invalid libarchive exclude pattern: %s") % pattern;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return rule;
}

bool ArchiveMatchIgnorer::matches(const Rule& rule, ::archive_entry* entry) {
    return archive_match_path_excluded(rule.match, entry) == 1;
}

void ArchiveMatchIgnorer::printLog(const boost::format& message, libshipyard::LogLevel level) const {
    libshipyard::Logger::getInstance().log(message, sysname, level);
}

}
}
