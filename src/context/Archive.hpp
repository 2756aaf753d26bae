/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_context_Archive_hpp
#define shipyard_context_Archive_hpp

#include <ctime>
#include <string>
#include <unordered_set>
#include <sys/types.h>

#include <archive.h> // libarchive
#include <boost/filesystem.hpp>


namespace shipyard {
namespace context {

/**
 * A regular file stored in (or to be stored into) a tar archive.
 */
struct ArchiveEntry {
    std::string name;
    std::string data;
    mode_t mode = 0644;
    time_t mtime = 0;
};

/**
 * Writes a POSIX tar archive to a file. Entry names are stored as given,
 * i.e. the caller is responsible for passing forward-slash relative paths.
 */
class ArchiveWriter {
public:
    ArchiveWriter(const boost::filesystem::path& file);
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;
    ~ArchiveWriter();

    void addEntry(const ArchiveEntry& entry);
    bool hasEntry(const std::string& name) const;
    void finalize();

private:
    boost::filesystem::path file;
    ::archive* arc = nullptr;
    std::unordered_set<std::string> names;
    bool isFinalized = false;
};

/**
 * Reads the regular file entries of an archive (any format and compression
 * filter supported by libarchive). Other entry types are skipped.
 */
class ArchiveReader {
public:
    ArchiveReader(const boost::filesystem::path& file);
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ~ArchiveReader();

    bool nextEntry(ArchiveEntry& entry);

private:
    std::string readEntryData(::archive_entry* entry);

private:
    boost::filesystem::path file;
    ::archive* arc = nullptr;
};

}
}

#endif
