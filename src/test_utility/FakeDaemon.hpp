/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_test_utility_FakeDaemon_hpp
#define shipyard_test_utility_FakeDaemon_hpp

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "daemon/Daemon.hpp"

namespace test_utility {
namespace daemon {

/**
 * In-memory daemon. Output and failures are scripted per image, every call
 * is recorded so that tests can inspect it once the pipeline returned.
 */
class FakeDaemon : public shipyard::daemon::Daemon {
public:
    struct BuildRecord {
        std::string tag;
        std::string options;
        std::map<std::string, std::string> files;
    };

    struct PushRecord {
        std::string reference;
        std::string token;
    };

public:
    shipyard::daemon::DaemonInfo info() const override;
    void build(const boost::filesystem::path& contextArchive,
               const rapidjson::Value& options,
               const shipyard::daemon::OutputHandler& outputHandler) const override;
    void pull(const std::string& image, const shipyard::daemon::ProgressHandler& progressHandler) const override;
    std::size_t inspectImageSize(const std::string& image) const override;
    void tagImage(const std::string& image, const std::string& repository, const std::string& tag) const override;
    std::string pushImage(const std::string& reference,
                          const std::string& registryToken,
                          const shipyard::daemon::ProgressHandler& progressHandler) const override;
    void removeImage(const std::string& reference) const override;

    // default build output, as printed by the classic builder
    static std::vector<std::string> makeBuildOutput(const std::string& tag);

public:
    shipyard::daemon::DaemonInfo daemonInfo{ "Ubuntu 22.04.3 LTS", "x86_64" };
    std::map<std::string, std::vector<std::string>> buildOutputs;
    std::set<std::string> failingBuilds;
    std::map<std::string, std::size_t> imageSizes;
    std::set<std::string> failingInspections;
    // number of failing attempts before a push of the reference succeeds
    std::map<std::string, unsigned int> failingPushAttempts;

    mutable unsigned int infoCalls = 0;
    mutable std::vector<BuildRecord> builds;
    mutable std::vector<std::string> pulls;
    mutable std::vector<std::string> tags;
    mutable std::vector<PushRecord> pushes;
    mutable std::map<std::string, std::string> pushedDigests;
    mutable std::vector<std::string> removedImages;

private:
    mutable std::mutex mutex;
};

}
}

#endif
