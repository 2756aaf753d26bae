/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ReleasePipeline.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>

#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"
#include "renderer/Spinner.hpp"


namespace shipyard {
namespace release {

namespace {

const std::string infoPrefix = libshipyard::Logger::getLevelTag(libshipyard::LogLevel::INFO);

// Removes the local registry tags on every exit path
class UntagGuard {
public:
    UntagGuard(std::function<void()> untag)
        : untag(std::move(untag))
    {}
    ~UntagGuard() {
        untag();
    }

private:
    std::function<void()> untag;
};

}

ReleasePipeline::ReleasePipeline(std::shared_ptr<const common::Config> config,
                                 std::shared_ptr<const daemon::Daemon> daemon,
                                 std::shared_ptr<const ReleaseBackend> backend,
                                 std::shared_ptr<renderer::Terminal> terminal,
                                 SleepFunction sleep)
    : config{std::move(config)}
    , daemon{std::move(daemon)}
    , backend{std::move(backend)}
    , terminal{std::move(terminal)}
    , sleep{std::move(sleep)}
{}

Release ReleasePipeline::deployProject(const rapidjson::Value& composition,
                                       const std::vector<builder::BuiltImage>& images,
                                       const DeployParameters& parameters) const {
    if(images.empty()) {
        SHIPYARD_THROW_ERROR("Cannot deploy a project without images");
    }

    auto release = createRelease(composition, parameters);

    auto error = std::exception_ptr{};
    try {
        auto taggedImages = std::vector<TaggedImage>{};
        auto untagGuard = UntagGuard{[this, &taggedImages]() { untagImages(taggedImages); }};

        printLog(boost::format("Tagging images..."), libshipyard::LogLevel::DEBUG);
        tagServiceImages(images, release, taggedImages);

        printLog(boost::format("Authorizing push..."), libshipyard::LogLevel::DEBUG);
        auto previousRepositories = getPreviousRepositories(parameters.applicationId);
        auto token = authorizePush(taggedImages.front().location.registry, taggedImages, previousRepositories);

        printLog(boost::format("Pushing images to registry..."), libshipyard::LogLevel::INFO);
        pushAndUpdateServiceImages(token, taggedImages, parameters.skipLogUpload);

        release.setStatus("success");
    }
    catch(const std::exception&) {
        // raised to the caller once the release is saved
        release.setStatus("failed");
        error = std::current_exception();
    }

    saveRelease(release);

    if(error) {
        std::rethrow_exception(error);
    }
    return release;
}

Release ReleasePipeline::createRelease(const rapidjson::Value& composition, const DeployParameters& parameters) const {
    auto spinner = renderer::SpinnerLine{*terminal, infoPrefix + "Creating release..."};

    auto commit = libshipyard::string::generateRandomHex(32);
    auto created = CreatedRelease{};
    try {
        created = backend->createRelease(parameters.userId, parameters.applicationId, composition, "local", commit);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to create release of application %d") % parameters.applicationId;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }

    auto release = Release{created.release};
    for(const auto& serviceImage : created.serviceImages) {
        release.serviceImages.emplace(serviceImage.first, ServiceImage{serviceImage.second});
    }

    printLog(boost::format("Created release %s (commit %s) with %d service images")
             % (release.getId() ? std::to_string(*release.getId()) : std::string{"without id"})
             % commit % release.serviceImages.size(),
             libshipyard::LogLevel::DEBUG);
    return release;
}

void ReleasePipeline::tagServiceImages(const std::vector<builder::BuiltImage>& images,
                                       Release& release,
                                       std::vector<TaggedImage>& taggedImages) const {
    taggedImages.reserve(images.size());
    for(const auto& image : images) {
        auto serviceImage = release.serviceImages.find(image.serviceName);
        if(serviceImage == release.serviceImages.end()) {
            auto message = boost::format("The release has no image for service %s") % image.serviceName;
            SHIPYARD_THROW_ERROR(message.str());
        }

        auto location = parseImageLocation(serviceImage->second.getImageLocation());
        daemon->tagImage(image.name, location.getName(), location.tag);
        taggedImages.push_back(TaggedImage{&image, &serviceImage->second, location});

        printLog(boost::format("Tagged %s as %s") % image.name % location.getReference(),
                 libshipyard::LogLevel::DEBUG);
    }
}

// Best effort: the repositories of the last successful release widen the scope of the
// token so that their layers can be mounted from the registry
std::vector<std::string> ReleasePipeline::getPreviousRepositories(std::int64_t applicationId) const {
    auto locations = std::vector<std::string>{};
    try {
        locations = backend->getLatestSuccessfulReleaseImageLocations(applicationId);
    }
    catch(const std::exception& e) {
        printLog(boost::format("Failed to access previously pushed image repo: %s") % e.what(),
                 libshipyard::LogLevel::DEBUG);
        return {};
    }

    auto repositories = std::vector<std::string>{};
    for(const auto& location : locations) {
        try {
            auto repository = parseImageLocation(location).repository;
            printLog(boost::format("Requesting access to previously pushed image repo (%s)") % repository,
                     libshipyard::LogLevel::DEBUG);
            repositories.push_back(repository);
        }
        catch(const libshipyard::Error& e) {
            printLog(boost::format("Failed to access previously pushed image repo: %s") % e.what(),
                     libshipyard::LogLevel::DEBUG);
        }
    }
    return repositories;
}

std::string ReleasePipeline::authorizePush(const std::string& registry,
                                           const std::vector<TaggedImage>& taggedImages,
                                           const std::vector<std::string>& previousRepositories) const {
    auto scopes = std::vector<std::string>{};
    for(const auto& taggedImage : taggedImages) {
        scopes.push_back("repository:" + taggedImage.location.repository + ":pull,push");
    }
    for(const auto& repository : previousRepositories) {
        scopes.push_back("repository:" + repository + ":pull,push");
    }

    try {
        return backend->getRegistryToken(registry, scopes);
    }
    catch(const std::exception& e) {
        // the pushes are attempted anyway, without authorization
        printLog(boost::format("Failed to authorize push to %s: %s") % registry % e.what(),
                 libshipyard::LogLevel::DEBUG);
        return "";
    }
}

void ReleasePipeline::pushAndUpdateServiceImages(const std::string& token,
                                                 std::vector<TaggedImage>& taggedImages,
                                                 bool skipLogUpload) const {
    auto progress = PushProgress{*terminal, taggedImages.size()};

    auto futures = std::vector<std::future<void>>{};
    futures.reserve(taggedImages.size());
    for(std::size_t i = 0; i < taggedImages.size(); ++i) {
        futures.push_back(std::async(std::launch::async, [this, &token, &taggedImages, &progress, skipLogUpload, i]() {
            auto& taggedImage = taggedImages[i];
            try {
                pushImage(token, taggedImage, progress, i);
            }
            catch(const std::exception& e) {
                taggedImage.serviceImage->setPushFailed(e.what());
                saveServiceImage(*taggedImage.serviceImage, skipLogUpload);
                throw;
            }
            saveServiceImage(*taggedImage.serviceImage, skipLogUpload);
        }));
    }

    // the pushes are isolated from each other, the first failure is raised once all are done
    auto error = std::exception_ptr{};
    for(auto& future : futures) {
        try {
            future.get();
        }
        catch(const std::exception&) {
            if(!error) {
                error = std::current_exception();
            }
        }
    }
    progress.end();

    if(error) {
        std::rethrow_exception(error);
    }
}

void ReleasePipeline::pushImage(const std::string& token,
                                TaggedImage& taggedImage,
                                PushProgress& progress,
                                std::size_t index) const {
    auto reference = taggedImage.location.getReference();
    auto size = daemon->inspectImageSize(reference);
    auto reporter = progress.getReporter(index);
    auto digest = retry([this, &reference, &token, &reporter]() {
                            return daemon->pushImage(reference, token, reporter);
                        },
                        config->push,
                        reference,
                        sleep);
    progress.complete(index);
    taggedImage.serviceImage->setPushSucceeded(*taggedImage.image, size, digest, std::chrono::system_clock::now());
}

void ReleasePipeline::saveServiceImage(ServiceImage& serviceImage, bool skipLogUpload) const {
    std::lock_guard<std::mutex> lock{updateMutex};
    printLog(boost::format("Saving image %s") % serviceImage.getImageLocation(), libshipyard::LogLevel::DEBUG);
    if(skipLogUpload) {
        serviceImage.removeBuildLog();
    }
    backend->updateImage(serviceImage.getId(), serviceImage.getRecord());
}

void ReleasePipeline::untagImages(const std::vector<TaggedImage>& taggedImages) const {
    printLog(boost::format("Untagging images..."), libshipyard::LogLevel::DEBUG);
    for(const auto& taggedImage : taggedImages) {
        auto reference = taggedImage.location.getReference();
        try {
            daemon->removeImage(reference);
        }
        catch(const std::exception& e) {
            printLog(boost::format("Failed to untag %s: %s") % reference % e.what(), libshipyard::LogLevel::WARN);
        }
    }
}

void ReleasePipeline::saveRelease(Release& release) const {
    auto spinner = renderer::SpinnerLine{*terminal, infoPrefix + "Saving release..."};
    release.setEndTimestamp(std::chrono::system_clock::now());

    auto id = release.getId();
    if(!id) {
        return;
    }
    try {
        backend->updateRelease(*id, release.getRecord());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to save release %d") % *id;
        SHIPYARD_RETHROW_ERROR(e, message.str());
    }
}

void ReleasePipeline::printLog(const boost::format& message, libshipyard::LogLevel level,
                               std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
