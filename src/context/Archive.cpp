/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Archive.hpp"

#include <sys/stat.h>

#include <archive_entry.h> // libarchive
#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace context {

ArchiveWriter::ArchiveWriter(const boost::filesystem::path& file)
    : file{file}
{
    arc = archive_write_new();
    if(arc == nullptr) {
        SHIPYARD_THROW_ERROR("failed to allocate libarchive writer");
    }
    archive_write_set_format_pax_restricted(arc);
    if(archive_write_open_filename(arc, file.string().c_str()) != ARCHIVE_OK) {
        auto message = boost::format("failed to open archive %s for writing (%s)")
            % file % archive_error_string(arc);
        archive_write_free(arc);
        SHIPYARD_THROW_ERROR(message.str());
    }
}

ArchiveWriter::~ArchiveWriter() {
    if(!isFinalized) {
        archive_write_close(arc);
    }
    archive_write_free(arc);
}

void ArchiveWriter::addEntry(const ArchiveEntry& entry) {
    if(isFinalized) {
        auto message = boost::format("archive %s: cannot add entry %s to finalized archive") % file % entry.name;
        SHIPYARD_THROW_ERROR(message.str());
    }

    ::archive_entry* header = archive_entry_new();
    archive_entry_set_pathname(header, entry.name.c_str());
    archive_entry_set_size(header, entry.data.size());
    archive_entry_set_filetype(header, AE_IFREG);
    archive_entry_set_perm(header, entry.mode & 07777);
    archive_entry_set_mtime(header, entry.mtime, 0);

    if(archive_write_header(arc, header) < ARCHIVE_OK) {
        auto message = boost::format("archive %s: error while writing header of entry %s (%s)")
            % file % entry.name % archive_error_string(arc);
        archive_entry_free(header);
        SHIPYARD_THROW_ERROR(message.str());
    }
    archive_entry_free(header);

    if(!entry.data.empty()) {
        auto written = archive_write_data(arc, entry.data.data(), entry.data.size());
        if(written < 0 || static_cast<size_t>(written) != entry.data.size()) {
            auto message = boost::format("archive %s: error while writing data of entry %s (%s)")
                % file % entry.name % archive_error_string(arc);
            SHIPYARD_THROW_ERROR(message.str());
        }
    }

    names.insert(entry.name);
}

bool ArchiveWriter::hasEntry(const std::string& name) const {
    return names.find(name) != names.cend();
}

void ArchiveWriter::finalize() {
    if(isFinalized) {
        return;
    }
    isFinalized = true;
    if(archive_write_close(arc) != ARCHIVE_OK) {
        auto message = boost::format("archive %s: error while finalizing (%s)")
            % file % archive_error_string(arc);
        SHIPYARD_THROW_ERROR(message.str());
    }
}

ArchiveReader::ArchiveReader(const boost::filesystem::path& file)
    : file{file}
{
    arc = archive_read_new();
    if(arc == nullptr) {
        SHIPYARD_THROW_ERROR("failed to allocate libarchive reader");
    }
    archive_read_support_format_all(arc);
    archive_read_support_filter_all(arc);

    if (archive_read_open_filename(arc, file.string().c_str(), 10240) != ARCHIVE_OK) {
        auto message = boost::format("failed to open archive %s (%s)") % file % archive_error_string(arc);
        archive_read_free(arc);
        SHIPYARD_THROW_ERROR(message.str());
    }
}

ArchiveReader::~ArchiveReader() {
    archive_read_close(arc);
    archive_read_free(arc);
}

bool ArchiveReader::nextEntry(ArchiveEntry& entry) {
    while(true) {
        ::archive_entry* header;
        int r = archive_read_next_header(arc, &header);
        if (r == ARCHIVE_EOF) {
            return false;
        }
        else if (r < ARCHIVE_WARN) {
            auto message = boost::format("archive %s: error while reading header of next entry (%s)")
                        % file % archive_error_string(arc);
            SHIPYARD_THROW_ERROR(message.str());
        }
        else if (r < ARCHIVE_OK) {
            libshipyard::logMessage(boost::format("archive: warning while reading header of entry %s (%s)")
                                    % archive_entry_pathname(header) % archive_error_string(arc),
                                    libshipyard::LogLevel::INFO);
        }

        if(archive_entry_filetype(header) != AE_IFREG) {
            libshipyard::logMessage(boost::format("archive: skipping non-regular entry %s")
                                    % archive_entry_pathname(header),
                                    libshipyard::LogLevel::DEBUG);
            continue;
        }

        entry.name = archive_entry_pathname(header);
        entry.mode = archive_entry_perm(header);
        entry.mtime = archive_entry_mtime(header);
        entry.data = readEntryData(header);
        return true;
    }
}

std::string ArchiveReader::readEntryData(::archive_entry* header) {
    auto data = std::string{};
    if(archive_entry_size_is_set(header) && archive_entry_size(header) > 0) {
        data.reserve(archive_entry_size(header));
    }

    char buffer[16384];
    while(true) {
        auto size = archive_read_data(arc, buffer, sizeof(buffer));
        if(size == 0) {
            break;
        }
        else if(size < 0) {
            auto message = boost::format("archive %s: error while reading data of entry %s (%s)")
                % file % archive_entry_pathname(header) % archive_error_string(arc);
            SHIPYARD_THROW_ERROR(message.str());
        }
        data.append(buffer, size);
    }
    return data;
}

}
}
