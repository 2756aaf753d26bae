/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libshipyard_utility_json_hpp
#define libshipyard_utility_json_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace libshipyard {
namespace json {

rapidjson::Document parse(const std::string& string);
rapidjson::Document read(const boost::filesystem::path& filename);
void write(const rapidjson::Value& json, const boost::filesystem::path& filename);
std::string serialize(const rapidjson::Value& json);

/**
 * Recursively merges 'source' into 'target'. Members that are objects on both
 * sides are merged member by member, any other member of 'source' replaces the
 * homonymous member of 'target'.
 */
void deepMerge(rapidjson::Value& target, const rapidjson::Value& source, rapidjson::Document::AllocatorType& allocator);

}}

#endif
