/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libshipyard_utility_string_hpp
#define libshipyard_utility_string_hpp

#include <string>
#include <tuple>
#include <sys/types.h>


namespace libshipyard {
namespace string {

std::string replace(std::string &buf, const std::string& from, const std::string& to);
std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator = '=');
std::string generateRandom(size_t size);
std::string generateRandomHex(size_t size);
std::string toLower(const std::string&);
std::string createSizeString(size_t size);
std::string urlEncode(const std::string&);

}}

#endif
