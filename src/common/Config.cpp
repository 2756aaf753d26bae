/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace common {

static boost::filesystem::path getDefaultBinDirectory() {
    auto home = libshipyard::environment::getOptionalVariable("HOME");
    if(!home) {
        SHIPYARD_THROW_ERROR("Failed to determine default bin directory: HOME is not set");
    }
    return boost::filesystem::path{*home} / ".shipyard/bin";
}

static const rapidjson::Value* findMember(const rapidjson::Value& object, const char* key) {
    if(!object.IsObject()) {
        return nullptr;
    }
    auto it = object.FindMember(key);
    if(it == object.MemberEnd()) {
        return nullptr;
    }
    return &it->value;
}

static std::string getString(const rapidjson::Value& object, const char* key, const std::string& defaultValue) {
    const auto* value = findMember(object, key);
    if(!value) {
        return defaultValue;
    }
    if(!value->IsString()) {
        auto message = boost::format("Invalid configuration: '%s' must be a string") % key;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return value->GetString();
}

Config::Config() {
    initialize();
}

Config::Config(const boost::filesystem::path& configFilename)
    : json{ libshipyard::json::read(configFilename) }
{
    if(!json.IsObject()) {
        auto message = boost::format("Invalid configuration file %s: expected a JSON object") % configFilename;
        SHIPYARD_THROW_ERROR(message.str());
    }
    try {
        initialize();
    }
    catch(libshipyard::Error& e) {
        auto message = boost::format("Failed to load configuration file %s") % configFilename;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }
}

void Config::initialize() {
    program_start = std::chrono::high_resolution_clock::now();

    if(findMember(json, "binDirectory")) {
        directories.bin = getString(json, "binDirectory", "");
    }
    else {
        directories.bin = getDefaultBinDirectory();
    }
    directories.temp = getString(json, "tempDirectory", "/tmp");
    dockerPath = getString(json, "dockerPath", dockerPath);

    if(const auto* emulatorJSON = findMember(json, "emulator")) {
        emulator.version = getString(*emulatorJSON, "version", emulator.version);
        emulator.downloadBaseUrl = getString(*emulatorJSON, "downloadBaseUrl", emulator.downloadBaseUrl);
    }

    if(const auto* pushJSON = findMember(json, "push")) {
        if(const auto* value = findMember(*pushJSON, "maxAttempts")) {
            if(!value->IsUint() || value->GetUint() == 0) {
                SHIPYARD_THROW_ERROR("Invalid configuration: 'push.maxAttempts' must be a positive integer");
            }
            push.maxAttempts = value->GetUint();
        }
        if(const auto* value = findMember(*pushJSON, "initialDelayMs")) {
            if(!value->IsUint()) {
                SHIPYARD_THROW_ERROR("Invalid configuration: 'push.initialDelayMs' must be a non-negative integer");
            }
            push.initialDelay = std::chrono::milliseconds{ value->GetUint() };
        }
        if(const auto* value = findMember(*pushJSON, "backoffScaler")) {
            if(!value->IsNumber() || value->GetDouble() < 1.0) {
                SHIPYARD_THROW_ERROR("Invalid configuration: 'push.backoffScaler' must be a number >= 1");
            }
            push.backoffScaler = value->GetDouble();
        }
    }

    if (!boost::filesystem::is_directory(directories.temp)) {
        auto message = boost::format("Invalid temporary directory %s") % directories.temp;
        SHIPYARD_THROW_ERROR(message.str(), libshipyard::LogLevel::INFO);
    }
}

boost::filesystem::path Config::makeTemporaryPath(const std::string& prefix) const {
    return libshipyard::filesystem::makeUniquePathWithRandomSuffix(directories.temp / prefix);
}

}} // namespaces
