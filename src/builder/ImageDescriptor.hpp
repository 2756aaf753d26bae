/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_builder_ImageDescriptor_hpp
#define shipyard_builder_ImageDescriptor_hpp

#include <map>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <rapidjson/document.h>


namespace shipyard {
namespace builder {

struct BuildSpecification {
    // relative to the project directory
    boost::filesystem::path context;
    std::map<std::string, std::string> args;
    boost::optional<std::string> tag;
    boost::optional<std::string> dockerfile;
};

/**
 * The image of a service: either a reference to a pre-built (external) image
 * or the specification of a build.
 */
struct ImageDescriptor {
    std::string serviceName;
    boost::variant<std::string, BuildSpecification> image;

    bool isExternal() const;
    const std::string& getImageReference() const;
    const BuildSpecification& getBuild() const;
    BuildSpecification& getBuild();
    // the image reference, or the tag of the build once assigned
    std::string getImageName() const;
};

struct Project {
    std::string name;
    boost::filesystem::path directory;
    rapidjson::Document composition;
    std::vector<ImageDescriptor> descriptors;
};

/**
 * Creates a project out of a composition of the form
 *
 * {
 *     "name": "myapp",
 *     "services": {
 *         "frontend": { "build": { "context": "frontend", "args": { "KEY": "value" } } },
 *         "cache": { "build": "cache", "image": "myapp/cache" },
 *         "db": { "image": "postgres:15" }
 *     }
 * }
 *
 * The project name defaults to the "name" member of the composition, then to
 * the name of the project directory.
 */
Project makeProject(const boost::filesystem::path& directory,
                    const rapidjson::Value& composition,
                    const boost::optional<std::string>& name = boost::none);

Project readProject(const boost::filesystem::path& directory,
                    const boost::filesystem::path& compositionFile,
                    const boost::optional<std::string>& name = boost::none);

}
}

#endif
