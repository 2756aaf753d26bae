/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "BuildScheduler.hpp"

#include <algorithm>
#include <future>
#include <map>

#include "builder/BuildTaskFactory.hpp"
#include "context/ContextPackager.hpp"
#include "emulation/DockerfileTransposer.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"
#include "renderer/InlineRenderer.hpp"
#include "renderer/InteractiveRenderer.hpp"


namespace shipyard {
namespace builder {

namespace {

// Ends the renderer on every exit path
class RendererGuard {
public:
    explicit RendererGuard(renderer::Renderer& renderer)
        : renderer(renderer)
    {}
    ~RendererGuard() {
        renderer.end();
    }

private:
    renderer::Renderer& renderer;
};

}

std::string makeDefaultTag(const std::string& projectName, const std::string& serviceName) {
    return libshipyard::string::toLower(projectName + "_" + serviceName);
}

void throwServiceBuildError(const std::string& serviceName, std::exception_ptr error) {
    auto message = boost::format("Failed to build service %s") % serviceName;
    try {
        std::rethrow_exception(error);
    }
    catch(const libshipyard::Error& e) {
        auto serviceError = ServiceBuildError{serviceName, e};
        serviceError.appendErrorTraceEntry(SHIPYARD_MAKE_ERROR_TRACE_ENTRY(message.str()));
        throw serviceError;
    }
    catch(const std::exception& e) {
        auto serviceError = ServiceBuildError{serviceName, libshipyard::Error::fromException(e, libshipyard::LogLevel::ERROR)};
        serviceError.appendErrorTraceEntry(SHIPYARD_MAKE_ERROR_TRACE_ENTRY(message.str()));
        throw serviceError;
    }
}

BuildScheduler::BuildScheduler(std::shared_ptr<const common::Config> config,
                               std::shared_ptr<const daemon::Daemon> daemon,
                               std::shared_ptr<const emulation::ArchiveFetcher> fetcher,
                               std::shared_ptr<renderer::Terminal> terminal)
    : config{config}
    , daemon{std::move(daemon)}
    , terminal{std::move(terminal)}
    , provisioner{config, std::move(fetcher)}
{}

std::vector<BuiltImage> BuildScheduler::buildProject(Project& project, const BuildParameters& parameters) const {
    printLog(boost::format("Building for %s/%s") % parameters.architecture % parameters.deviceType,
             libshipyard::LogLevel::INFO);

    auto renderer = makeRenderer(project, parameters.inlineLogs);
    auto rendererGuard = RendererGuard{*renderer};
    renderer->start();

    auto needsEmulation = provisioner.installIfNeeded(parameters.emulated, parameters.architecture, *daemon);
    if(needsEmulation) {
        printLog(boost::format("Emulation is enabled"), libshipyard::LogLevel::INFO);
        provisionEmulation(project, parameters.architecture);
    }

    auto packageOptions = context::PackageOptions{};
    packageOptions.ignoreMode = parameters.ignoreMode;
    packageOptions.convertEol = parameters.convertEol;
    auto projectArchive = context::ContextPackager{config}.packageContext(project.directory, packageOptions);

    auto tasks = BuildTaskFactory{config}.makeBuildTasks(project,
                                                         projectArchive.getPath(),
                                                         parameters.architecture,
                                                         parameters.deviceType,
                                                         parameters.dockerfilePath);

    auto descriptors = std::map<std::string, ImageDescriptor*>{};
    for(auto& descriptor : project.descriptors) {
        descriptors[descriptor.serviceName] = &descriptor;
    }

    for(auto& task : tasks) {
        prepareTask(task, *descriptors.at(task.serviceName), project, parameters, *renderer, needsEmulation);
    }

    printLog(boost::format("Prepared tasks; building..."), libshipyard::LogLevel::DEBUG);

    auto futures = std::vector<std::future<TaskResult>>{};
    futures.reserve(tasks.size());
    for(auto& task : tasks) {
        futures.push_back(std::async(std::launch::async, [this, &task]() { return runTask(task); }));
    }
    auto results = std::vector<TaskResult>{};
    results.reserve(futures.size());
    for(auto& future : futures) {
        results.push_back(future.get());
    }

    auto images = std::vector<BuiltImage>{};
    auto summary = renderer::Renderer::Summary{};
    for(std::size_t i = 0; i < tasks.size(); ++i) {
        const auto& task = tasks[i];
        if(!results[i].successful) {
            throwServiceBuildError(task.serviceName, results[i].error);
        }
        images.push_back(makeBuiltImage(task, *descriptors.at(task.serviceName), results[i]));
        summary[task.serviceName] = "Image size: " + libshipyard::string::createSizeString(images.back().size);
    }

    renderer->end(summary);
    return images;
}

std::unique_ptr<renderer::Renderer> BuildScheduler::makeRenderer(const Project& project, bool inlineLogs) const {
    auto services = std::vector<std::string>{};
    for(const auto& descriptor : project.descriptors) {
        services.push_back(descriptor.serviceName);
    }

    if(inlineLogs) {
        return std::unique_ptr<renderer::Renderer>{ new renderer::InlineRenderer{services, *terminal} };
    }
    return std::unique_ptr<renderer::Renderer>{ new renderer::InteractiveRenderer{services, *terminal} };
}

void BuildScheduler::provisionEmulation(const Project& project, const std::string& architecture) const {
    for(const auto& descriptor : project.descriptors) {
        if(descriptor.isExternal()) {
            continue;
        }
        provisioner.copyToContext(project.directory / descriptor.getBuild().context, architecture);
    }
}

void BuildScheduler::prepareTask(BuildTask& task,
                                 ImageDescriptor& descriptor,
                                 const Project& project,
                                 const BuildParameters& parameters,
                                 renderer::Renderer& renderer,
                                 bool needsEmulation) const {
    if(!task.tag) {
        task.tag = makeDefaultTag(project.name, task.serviceName);
    }
    if(!descriptor.isExternal()) {
        descriptor.getBuild().tag = task.tag;
    }

    auto& allocator = task.dockerOptions.GetAllocator();
    libshipyard::json::deepMerge(task.dockerOptions, parameters.buildOptions, allocator);
    if(task.dockerOptions.HasMember("t")) {
        task.dockerOptions["t"].SetString(task.tag->c_str(), allocator);
    }
    else {
        task.dockerOptions.AddMember("t", rapidjson::Value{task.tag->c_str(), allocator}, allocator);
    }
    if(!descriptor.isExternal() && !descriptor.getBuild().args.empty()) {
        if(!task.dockerOptions.HasMember("buildargs") || !task.dockerOptions["buildargs"].IsObject()) {
            task.dockerOptions.RemoveMember("buildargs");
            task.dockerOptions.AddMember("buildargs", rapidjson::Value{rapidjson::kObjectType}, allocator);
        }
        auto& buildargs = task.dockerOptions["buildargs"];
        for(const auto& arg : descriptor.getBuild().args) {
            buildargs.RemoveMember(arg.first.c_str());
            buildargs.AddMember(rapidjson::Value{arg.first.c_str(), allocator},
                                rapidjson::Value{arg.second.c_str(), allocator},
                                allocator);
        }
    }

    task.logStream = renderer.getStream(task.serviceName);
    task.logBuffer = std::make_shared<progress::LogBuffer>();

    if(task.external) {
        task.progressHook = std::make_shared<PullHook>(*task.logStream, task.logBuffer);
        return;
    }

    auto containerEmulatorPath = boost::optional<std::string>{};
    if(needsEmulation && !task.resolutionError) {
        if(!task.buildArchive.hasPath()) {
            auto message = boost::format("No buildStream for task '%s'") % *task.tag;
            SHIPYARD_THROW_ERROR(message.str());
        }
        auto options = emulation::TransposeOptions{};
        options.hostEmulatorPath = emulation::pathInContext(project.directory / task.context);
        options.emulatorBinary = provisioner.getEmulatorPath(parameters.architecture);
        options.dockerfile = task.dockerfile;
        auto transposer = emulation::DockerfileTransposer{config, options};
        task.buildArchive = transposer.transposeArchive(task.buildArchive.getPath());
        containerEmulatorPath = options.containerEmulatorPath;
    }

    task.streamHook = std::make_shared<LocalBuildHook>(*task.logStream,
                                                       task.logBuffer,
                                                       parameters.inlineLogs,
                                                       containerEmulatorPath);
}

BuildScheduler::TaskResult BuildScheduler::runTask(BuildTask& task) const {
    auto result = TaskResult{};
    result.startTime = std::chrono::system_clock::now();

    try {
        if(task.resolutionError) {
            SHIPYARD_THROW_ERROR(*task.resolutionError);
        }

        if(task.external) {
            auto hook = task.progressHook;
            daemon->pull(task.imageName, [hook](const rapidjson::Value& json) { (*hook)(json); });
        }
        else {
            auto hook = task.streamHook;
            daemon->build(task.buildArchive.getPath(),
                          task.dockerOptions,
                          [hook](const std::string& output) { (*hook)(output); });
            hook->flush();
        }
        result.successful = true;
    }
    catch(const std::exception& e) {
        // the failure is raised by buildProject once all the workers are done
        task.logStream->write(progress::ErrorEvent{e.what()});
        result.error = std::current_exception();
    }

    result.endTime = std::chrono::system_clock::now();
    return result;
}

BuiltImage BuildScheduler::makeBuiltImage(const BuildTask& task,
                                          const ImageDescriptor& descriptor,
                                          const TaskResult& result) const {
    auto image = BuiltImage{};
    image.serviceName = descriptor.serviceName;
    image.successful = true;
    image.name = descriptor.getImageName();
    image.logs = task.logBuffer->truncated();
    image.startTime = result.startTime;
    image.endTime = result.endTime;
    image.dockerfile = task.dockerfile;
    image.projectType = task.projectType;

    try {
        image.size = daemon->inspectImageSize(image.name);
    }
    catch(const std::exception&) {
        throwServiceBuildError(descriptor.serviceName, std::current_exception());
    }

    printLog(boost::format("Built image %s of service %s (%d bytes)") % image.name % image.serviceName % image.size,
             libshipyard::LogLevel::DEBUG);
    return image;
}

void BuildScheduler::printLog(const boost::format& message, libshipyard::LogLevel level,
                              std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
