/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_context_eolConversion_hpp
#define shipyard_context_eolConversion_hpp

#include <string>

#include <boost/filesystem.hpp>


namespace shipyard {
namespace context {

// Whether line ending conversion applies to the files of this host
bool isEolConversionPlatform();

// Heuristic: a file containing a NUL byte in its first 8000 bytes is binary
bool isBinaryContent(const std::string& content);

std::string convertCrlfToLf(const std::string& content);

/**
 * Reads a file, converting CRLF line endings to LF when 'convertEol' is set and
 * the file is not binary. Without conversion, a warning is logged for text files
 * that contain CRLF line endings.
 */
std::string readFileWithEolConversion(const boost::filesystem::path& file, bool convertEol);

}
}

#endif
