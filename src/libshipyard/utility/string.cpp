/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <vector>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/utility/logging.hpp"


namespace libshipyard {
namespace string {

std::string replace(std::string &buf, const std::string& from, const std::string& to) {
    std::string::size_type pos = buf.find(from);
    while(pos != std::string::npos){
        buf.replace(pos, from.size(), to);
        pos = buf.find(from, pos + to.size());
    }
    return buf;
}

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator) {
    auto keyEnd = std::find(pairString.cbegin(), pairString.cend(), separator);
    auto key = std::string(pairString.cbegin(), keyEnd);
    auto value = keyEnd != pairString.cend() ? std::string(keyEnd+1, pairString.cend()) : std::string{};
    if(key.empty()) {
        auto message = boost::format("Failed to parse key-value pair '%s': key is empty") % pairString;
        SHIPYARD_THROW_ERROR(message.str())
    }
    return std::pair<std::string, std::string>{key, value};
}

static std::string generateRandomFromAlphabet(size_t size, const std::string& alphabet) {
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, alphabet.size() - 1);
    std::mt19937 generator;
    generator.seed(std::random_device()());

    auto string = std::string(size, '.');

    for(size_t i=0; i<string.size(); ++i) {
        string[i] = alphabet[dist(generator)];
    }

    return string;
}

std::string generateRandom(size_t size) {
    return generateRandomFromAlphabet(size, "abcdefghijklmnopqrstuvwxyz");
}

std::string generateRandomHex(size_t size) {
    return generateRandomFromAlphabet(size, "0123456789abcdef");
}

std::string toLower(const std::string& s) {
    return boost::algorithm::to_lower_copy(s);
}

std::string createSizeString(size_t size) {
    const std::vector<std::string> suffix = {"B", "KB", "MB", "GB", "TB"};
    const double unit(1024);

    double size_d(size);
    size_t i = 0;

    while ( (size_d > unit) && (i < (suffix.size() - 1) ) )
    {
        size_d = size_d / unit;
        ++i;
    }
    return ( boost::format("%.2f%s") % size_d % suffix[i] ).str();
}

// Percent-encodes everything but the unreserved characters of RFC 3986
std::string urlEncode(const std::string& s) {
    auto encoded = std::string{};
    for(auto c : s) {
        auto uc = static_cast<unsigned char>(c);
        if(std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += c;
        }
        else {
            encoded += (boost::format("%%%02X") % static_cast<unsigned>(uc)).str();
        }
    }
    return encoded;
}

}}
