/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FakeDaemon.hpp"

#include <algorithm>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "context/Archive.hpp"
#include "libshipyard/Error.hpp"
#include "libshipyard/Utility.hpp"

namespace test_utility {
namespace daemon {

shipyard::daemon::DaemonInfo FakeDaemon::info() const {
    std::lock_guard<std::mutex> lock{mutex};
    ++infoCalls;
    return daemonInfo;
}

void FakeDaemon::build(const boost::filesystem::path& contextArchive,
                       const rapidjson::Value& options,
                       const shipyard::daemon::OutputHandler& outputHandler) const {
    auto record = BuildRecord{};
    record.tag = options.HasMember("t") ? options["t"].GetString() : "";
    record.options = libshipyard::json::serialize(options);

    auto reader = shipyard::context::ArchiveReader{contextArchive};
    auto entry = shipyard::context::ArchiveEntry{};
    while(reader.nextEntry(entry)) {
        record.files[entry.name] = entry.data;
    }

    std::vector<std::string> output;
    bool isFailing;
    {
        std::lock_guard<std::mutex> lock{mutex};
        builds.push_back(record);
        auto scripted = buildOutputs.find(record.tag);
        output = scripted != buildOutputs.cend() ? scripted->second : makeBuildOutput(record.tag);
        isFailing = failingBuilds.count(record.tag) > 0;
    }

    for(const auto& line : output) {
        outputHandler(line + "\n");
    }
    if(isFailing) {
        auto message = boost::format("The command '/bin/sh -c false' returned a non-zero code: 1 (%s)") % record.tag;
        SHIPYARD_THROW_ERROR(message.str());
    }
}

void FakeDaemon::pull(const std::string& image, const shipyard::daemon::ProgressHandler& progressHandler) const {
    {
        std::lock_guard<std::mutex> lock{mutex};
        pulls.push_back(image);
    }
    auto events = std::vector<std::string>{
        R"({"id": "latest", "status": "Pulling from library/alpine"})",
        R"({"id": "31e352740f53", "status": "Downloading", "progressDetail": {"current": 50, "total": 100}, "progress": "[==>   ]"})",
        R"({"id": "31e352740f53", "status": "Pull complete"})",
        (boost::format(R"({"status": "Status: Downloaded newer image for %s"})") % image).str()
    };
    for(const auto& event : events) {
        progressHandler(libshipyard::json::parse(event));
    }
}

std::size_t FakeDaemon::inspectImageSize(const std::string& image) const {
    std::lock_guard<std::mutex> lock{mutex};
    if(failingInspections.count(image) > 0) {
        auto message = boost::format("No such image: %s") % image;
        SHIPYARD_THROW_ERROR(message.str());
    }
    auto size = imageSizes.find(image);
    return size != imageSizes.cend() ? size->second : 1024 * 1024;
}

void FakeDaemon::tagImage(const std::string& image, const std::string& repository, const std::string& tag) const {
    std::lock_guard<std::mutex> lock{mutex};
    tags.push_back(image + " -> " + repository + ":" + tag);
}

std::string FakeDaemon::pushImage(const std::string& reference,
                                  const std::string& registryToken,
                                  const shipyard::daemon::ProgressHandler& progressHandler) const {
    bool isFailing;
    {
        std::lock_guard<std::mutex> lock{mutex};
        auto attempt = std::count_if(pushes.cbegin(), pushes.cend(), [&reference](const PushRecord& push) {
            return push.reference == reference;
        });
        pushes.push_back(PushRecord{reference, registryToken});
        auto failing = failingPushAttempts.find(reference);
        isFailing = failing != failingPushAttempts.cend() && static_cast<unsigned int>(attempt) < failing->second;
    }

    if(isFailing) {
        progressHandler(libshipyard::json::parse(
            R"({"error": "unauthorized: authentication required", "errorDetail": {"message": "unauthorized: authentication required"}})"));
        SHIPYARD_THROW_ERROR("unauthorized: authentication required");
    }

    progressHandler(libshipyard::json::parse(R"({"id": "5f70bf18a086", "status": "Pushing", "progressDetail": {"current": 512, "total": 1024}})"));
    progressHandler(libshipyard::json::parse(R"({"id": "5f70bf18a086", "status": "Pushed"})"));

    auto digest = "sha256:" + libshipyard::string::generateRandomHex(64);
    std::lock_guard<std::mutex> lock{mutex};
    pushedDigests[reference] = digest;
    return digest;
}

void FakeDaemon::removeImage(const std::string& reference) const {
    std::lock_guard<std::mutex> lock{mutex};
    removedImages.push_back(reference);
}

std::vector<std::string> FakeDaemon::makeBuildOutput(const std::string& tag) {
    return {
        "Step 1/2 : FROM alpine",
        " ---> 14119a10abf4",
        "Step 2/2 : RUN echo hello",
        " ---> Running in 4b6f1e0c5d2a",
        "hello",
        " ---> 0d2e8c4a7b31",
        "Successfully built 0d2e8c4a7b31",
        "Successfully tagged " + tag + ":latest"
    };
}

}
}
