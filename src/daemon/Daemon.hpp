/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_daemon_Daemon_hpp
#define shipyard_daemon_Daemon_hpp

#include <cstddef>
#include <functional>
#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace shipyard {
namespace daemon {

struct DaemonInfo {
    std::string operatingSystem;
    std::string architecture;
};

// receives one line of raw build output (terminating newline included)
using OutputHandler = std::function<void(const std::string&)>;
// receives one progress event of a pull or push, i.e. an object with
// the optional members "id", "status", "progress", "progressDetail",
// "error" and "errorDetail"
using ProgressHandler = std::function<void(const rapidjson::Value&)>;

/**
 * Abstract handle on a container daemon.
 *
 * Implementations must support concurrent calls on distinct images, since
 * the services of a project are built and pushed in parallel.
 * All the methods throw libshipyard::Error on failure.
 */
class Daemon {
public:
    virtual ~Daemon() = default;

    virtual DaemonInfo info() const = 0;

    /**
     * Builds the tar build context in contextArchive. The options are a JSON object
     * with the members of the daemon's build API ("t", "buildargs", "dockerfile", ...).
     */
    virtual void build(const boost::filesystem::path& contextArchive,
                       const rapidjson::Value& options,
                       const OutputHandler& outputHandler) const = 0;

    virtual void pull(const std::string& image, const ProgressHandler& progressHandler) const = 0;

    virtual std::size_t inspectImageSize(const std::string& image) const = 0;

    virtual void tagImage(const std::string& image, const std::string& repository, const std::string& tag) const = 0;

    /**
     * Pushes the image reference with the given registry token (empty for anonymous access).
     * Returns the content digest of the pushed manifest.
     */
    virtual std::string pushImage(const std::string& reference,
                                  const std::string& registryToken,
                                  const ProgressHandler& progressHandler) const = 0;

    virtual void removeImage(const std::string& reference) const = 0;
};

}
}

#endif
