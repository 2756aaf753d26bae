/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "json.hpp"

#include <boost/format.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "libshipyard/Error.hpp"
#include "libshipyard/utility/filesystem.hpp"


namespace libshipyard {
namespace json {

namespace {

rapidjson::Document parseText(const std::string& text, const std::string& origin) {
    auto json = rapidjson::Document{};
    json.Parse(text.c_str(), text.size());
    if(json.HasParseError()) {
        auto message = boost::format("Failed to parse %s: invalid JSON at offset %u: %s")
            % origin
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        SHIPYARD_THROW_ERROR(message.str());
    }
    return json;
}

}

rapidjson::Document parse(const std::string& string) {
    return parseText(string, "JSON string '" + string + "'");
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    return parseText(filesystem::readFile(filename), "JSON file " + filename.string());
}

void write(const rapidjson::Value& json, const boost::filesystem::path& filename) {
    auto buffer = rapidjson::StringBuffer{};
    auto writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>{buffer};
    writer.SetIndent(' ', 2);
    json.Accept(writer);
    try {
        filesystem::writeTextFile(buffer.GetString(), filename);
    }
    catch(const libshipyard::Error& e) {
        auto message = boost::format("Failed to write JSON to %s") % filename;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }
}

std::string serialize(const rapidjson::Value& json) {
    auto buffer = rapidjson::StringBuffer{};
    auto writer = rapidjson::Writer<rapidjson::StringBuffer>{buffer};
    json.Accept(writer);
    return buffer.GetString();
}

void deepMerge(rapidjson::Value& target, const rapidjson::Value& source, rapidjson::Document::AllocatorType& allocator) {
    if(!source.IsObject()) {
        SHIPYARD_THROW_ERROR("Failed to merge JSON values: source is not an object");
    }
    if(!target.IsObject()) {
        target.SetObject();
    }

    for(auto it = source.MemberBegin(); it != source.MemberEnd(); ++it) {
        auto existing = target.FindMember(it->name);
        if(existing == target.MemberEnd()) {
            target.AddMember(rapidjson::Value{it->name, allocator},
                             rapidjson::Value{it->value, allocator},
                             allocator);
        }
        else if(existing->value.IsObject() && it->value.IsObject()) {
            deepMerge(existing->value, it->value, allocator);
        }
        else {
            existing->value.CopyFrom(it->value, allocator);
        }
    }
}

}}
