/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "eolConversion.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace context {

bool isEolConversionPlatform() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

bool isBinaryContent(const std::string& content) {
    const size_t bytesToCheck = 8000;
    auto end = content.cbegin() + std::min(content.size(), bytesToCheck);
    return std::find(content.cbegin(), end, '\0') != end;
}

std::string convertCrlfToLf(const std::string& content) {
    auto converted = content;
    libshipyard::string::replace(converted, "\r\n", "\n");
    return converted;
}

std::string readFileWithEolConversion(const boost::filesystem::path& file, bool convertEol) {
    auto content = libshipyard::filesystem::readFile(file);

    if(isBinaryContent(content) || content.find("\r\n") == std::string::npos) {
        return content;
    }

    if(convertEol) {
        libshipyard::logMessage(boost::format("Converting line endings CRLF -> LF for file: %s") % file,
                                libshipyard::LogLevel::INFO);
        return convertCrlfToLf(content);
    }

    libshipyard::logMessage(boost::format("CRLF (Windows) line endings detected in file: %s."
                                          " Consider using the --convert-eol option.") % file,
                            libshipyard::LogLevel::WARN);
    return content;
}

}
}
