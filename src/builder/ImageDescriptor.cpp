/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageDescriptor.hpp"

#include <set>
#include <string>

#include <boost/format.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"


namespace shipyard {
namespace builder {

bool ImageDescriptor::isExternal() const {
    return boost::get<std::string>(&image) != nullptr;
}

const std::string& ImageDescriptor::getImageReference() const {
    const auto* reference = boost::get<std::string>(&image);
    if(reference == nullptr) {
        auto message = boost::format("Service %s has no image reference, it is built") % serviceName;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return *reference;
}

const BuildSpecification& ImageDescriptor::getBuild() const {
    const auto* build = boost::get<BuildSpecification>(&image);
    if(build == nullptr) {
        auto message = boost::format("Service %s has no build specification, it uses an external image")
            % serviceName;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return *build;
}

BuildSpecification& ImageDescriptor::getBuild() {
    const auto& self = *this;
    return const_cast<BuildSpecification&>(self.getBuild());
}

std::string ImageDescriptor::getImageName() const {
    if(isExternal()) {
        return getImageReference();
    }
    return getBuild().tag ? *getBuild().tag : std::string{};
}

static std::string getString(const rapidjson::Value& json, const char* member, const std::string& serviceName) {
    const auto& value = json[member];
    if(!value.IsString()) {
        auto message = boost::format("Invalid composition: '%s' of service %s is not a string") % member % serviceName;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return value.GetString();
}

static BuildSpecification parseBuildSpecification(const rapidjson::Value& json, const std::string& serviceName) {
    auto build = BuildSpecification{};

    if(json.IsString()) {
        build.context = json.GetString();
        return build;
    }
    if(!json.IsObject()) {
        auto message = boost::format("Invalid composition: 'build' of service %s is neither a string nor an object")
            % serviceName;
        SHIPYARD_THROW_ERROR(message.str());
    }

    build.context = json.HasMember("context") ? getString(json, "context", serviceName) : std::string{"."};
    if(json.HasMember("dockerfile")) {
        build.dockerfile = getString(json, "dockerfile", serviceName);
    }
    if(json.HasMember("args")) {
        const auto& args = json["args"];
        if(!args.IsObject()) {
            auto message = boost::format("Invalid composition: 'args' of service %s is not an object") % serviceName;
            SHIPYARD_THROW_ERROR(message.str());
        }
        for(auto it = args.MemberBegin(); it != args.MemberEnd(); ++it) {
            if(it->value.IsString()) {
                build.args[it->name.GetString()] = it->value.GetString();
            }
            else {
                build.args[it->name.GetString()] = libshipyard::json::serialize(it->value);
            }
        }
    }
    return build;
}

static ImageDescriptor parseDescriptor(const std::string& serviceName, const rapidjson::Value& json) {
    if(!json.IsObject()) {
        auto message = boost::format("Invalid composition: service %s is not an object") % serviceName;
        SHIPYARD_THROW_ERROR(message.str());
    }

    auto descriptor = ImageDescriptor{};
    descriptor.serviceName = serviceName;

    if(json.HasMember("build")) {
        auto build = parseBuildSpecification(json["build"], serviceName);
        // with a build, the image names the resulting image
        if(json.HasMember("image")) {
            build.tag = getString(json, "image", serviceName);
        }
        descriptor.image = build;
    }
    else if(json.HasMember("image")) {
        descriptor.image = getString(json, "image", serviceName);
    }
    else {
        auto message = boost::format("Invalid composition: service %s has neither 'image' nor 'build'") % serviceName;
        SHIPYARD_THROW_ERROR(message.str());
    }

    return descriptor;
}

Project makeProject(const boost::filesystem::path& directory,
                    const rapidjson::Value& composition,
                    const boost::optional<std::string>& name) {
    if(!composition.IsObject() || !composition.HasMember("services") || !composition["services"].IsObject()) {
        SHIPYARD_THROW_ERROR("Invalid composition: expected an object with a 'services' object");
    }

    auto project = Project{};
    project.directory = directory;
    if(name) {
        project.name = *name;
    }
    else if(composition.HasMember("name") && composition["name"].IsString()) {
        project.name = composition["name"].GetString();
    }
    else {
        project.name = boost::filesystem::absolute(directory).lexically_normal().filename().string();
        if(project.name == "." || project.name.empty()) {
            project.name = boost::filesystem::absolute(directory).lexically_normal().parent_path().filename().string();
        }
    }
    project.composition.CopyFrom(composition, project.composition.GetAllocator());

    const auto& services = composition["services"];
    auto serviceNames = std::set<std::string>{};
    for(auto it = services.MemberBegin(); it != services.MemberEnd(); ++it) {
        auto serviceName = std::string{it->name.GetString()};
        if(!serviceNames.insert(serviceName).second) {
            auto message = boost::format("Invalid composition: service %s is defined more than once") % serviceName;
            SHIPYARD_THROW_ERROR(message.str());
        }
        project.descriptors.push_back(parseDescriptor(serviceName, it->value));
    }

    if(project.descriptors.empty()) {
        SHIPYARD_THROW_ERROR("Invalid composition: no services defined");
    }

    libshipyard::logMessage(boost::format("Loaded project %s with %d services")
                            % project.name % project.descriptors.size(),
                            libshipyard::LogLevel::DEBUG);
    return project;
}

Project readProject(const boost::filesystem::path& directory,
                    const boost::filesystem::path& compositionFile,
                    const boost::optional<std::string>& name) {
    try {
        auto composition = libshipyard::json::read(compositionFile);
        return makeProject(directory, composition, name);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to read project from %s") % compositionFile;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }
}

}
}
