/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "BuildTaskFactory.hpp"

#include "context/Archive.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"


namespace shipyard {
namespace builder {

ProjectType resolveProjectType(const std::set<std::string>& files,
                               const std::string& architecture,
                               const std::string& deviceType,
                               const boost::optional<std::string>& dockerfile) {
    if(dockerfile) {
        if(files.count(*dockerfile) == 0) {
            auto message = boost::format("Specified Dockerfile not found: %s") % *dockerfile;
            SHIPYARD_THROW_ERROR(message.str());
        }
        return ProjectType{*dockerfile, "Standard Dockerfile"};
    }

    auto deviceSpecific = "Dockerfile." + deviceType;
    if(!deviceType.empty() && files.count(deviceSpecific) != 0) {
        return ProjectType{deviceSpecific, "Device-specific Dockerfile"};
    }
    auto architectureSpecific = "Dockerfile." + architecture;
    if(!architecture.empty() && files.count(architectureSpecific) != 0) {
        return ProjectType{architectureSpecific, "Architecture-specific Dockerfile"};
    }
    if(files.count("Dockerfile") != 0) {
        return ProjectType{"Dockerfile", "Standard Dockerfile"};
    }

    SHIPYARD_THROW_ERROR("Could not resolve the project type: no Dockerfile found");
}

std::string getContextPrefix(const boost::filesystem::path& context) {
    auto raw = context.generic_string();
    while(raw.size() > 1 && raw.back() == '/') {
        raw.pop_back();
    }
    auto normalized = boost::filesystem::path{raw}.lexically_normal().generic_string();
    while(normalized.size() > 1 && normalized.compare(normalized.size() - 2, 2, "/.") == 0) {
        normalized.resize(normalized.size() - 2);
    }
    if(normalized == "." || normalized.empty()) {
        return "";
    }
    if(context.is_absolute() || normalized == ".." || normalized.compare(0, 3, "../") == 0) {
        auto message = boost::format("Build context %s is outside of the project directory") % context;
        SHIPYARD_THROW_ERROR(message.str());
    }
    if(normalized.compare(0, 2, "./") == 0) {
        normalized = normalized.substr(2);
    }
    return normalized + "/";
}

BuildTaskFactory::BuildTaskFactory(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

std::vector<BuildTask> BuildTaskFactory::makeBuildTasks(const Project& project,
                                                        const boost::filesystem::path& projectArchive,
                                                        const std::string& architecture,
                                                        const std::string& deviceType,
                                                        const boost::optional<std::string>& dockerfilePath) const {
    auto tasks = std::vector<BuildTask>{};
    tasks.reserve(project.descriptors.size());

    for(const auto& descriptor : project.descriptors) {
        auto task = BuildTask{};
        task.serviceName = descriptor.serviceName;

        if(descriptor.isExternal()) {
            task.external = true;
            task.imageName = descriptor.getImageReference();
            printLog(boost::format("Service %s uses the external image %s") % task.serviceName % task.imageName,
                     libshipyard::LogLevel::DEBUG);
        }
        else {
            const auto& build = descriptor.getBuild();
            task.context = build.context;
            task.tag = build.tag;
            makeBuildContext(task, build, projectArchive, architecture, deviceType, dockerfilePath);
        }

        tasks.push_back(std::move(task));
    }

    return tasks;
}

void BuildTaskFactory::makeBuildContext(BuildTask& task,
                                        const BuildSpecification& build,
                                        const boost::filesystem::path& projectArchive,
                                        const std::string& architecture,
                                        const std::string& deviceType,
                                        const boost::optional<std::string>& dockerfilePath) const {
    auto prefix = std::string{};
    auto files = std::set<std::string>{};
    auto projectType = ProjectType{};
    try {
        prefix = getContextPrefix(build.context);
    }
    catch(const libshipyard::Error& e) {
        // reported as the failure of this service only
        task.resolutionError = e.what();
        return;
    }

    auto archivePath = config->makeTemporaryPath("shipyard-" + task.serviceName);
    archivePath += ".tar";
    task.buildArchive = libshipyard::PathRAII{archivePath};
    files = extractContext(projectArchive, prefix, task.buildArchive.getPath());

    try {
        auto dockerfile = dockerfilePath ? dockerfilePath : build.dockerfile;
        projectType = resolveProjectType(files, architecture, deviceType, dockerfile);
    }
    catch(const libshipyard::Error& e) {
        task.resolutionError = e.what();
        printLog(boost::format("Cannot build service %s: %s") % task.serviceName % e.what(),
                 libshipyard::LogLevel::DEBUG);
        return;
    }

    task.dockerfile = projectType.dockerfile;
    task.projectType = projectType.description;
    if(task.dockerfile != "Dockerfile") {
        task.dockerOptions.AddMember("dockerfile",
                                     rapidjson::Value{task.dockerfile.c_str(), task.dockerOptions.GetAllocator()},
                                     task.dockerOptions.GetAllocator());
    }
    printLog(boost::format("Service %s: %s (%s), %d files in context %s")
             % task.serviceName % task.projectType % task.dockerfile % files.size() % build.context,
             libshipyard::LogLevel::DEBUG);
}

// Writes the entries below the prefix into destination, stripping the prefix.
// Returns the names of the re-rooted entries.
std::set<std::string> BuildTaskFactory::extractContext(const boost::filesystem::path& projectArchive,
                                                       const std::string& prefix,
                                                       const boost::filesystem::path& destination) const {
    auto names = std::set<std::string>{};
    auto reader = context::ArchiveReader{projectArchive};
    auto writer = context::ArchiveWriter{destination};

    auto entry = context::ArchiveEntry{};
    while(reader.nextEntry(entry)) {
        if(entry.name.compare(0, prefix.size(), prefix) != 0 || entry.name.size() == prefix.size()) {
            continue;
        }
        entry.name = entry.name.substr(prefix.size());
        names.insert(entry.name);
        writer.addEntry(entry);
    }
    writer.finalize();

    return names;
}

void BuildTaskFactory::printLog(const boost::format& message, libshipyard::LogLevel level,
                                std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
