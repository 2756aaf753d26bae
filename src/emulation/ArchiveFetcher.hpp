/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_emulation_ArchiveFetcher_hpp
#define shipyard_emulation_ArchiveFetcher_hpp

#include <iostream>
#include <memory>
#include <string>

#include <cpprest/http_client.h>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libshipyard/LogLevel.hpp"


namespace shipyard {
namespace emulation {

/**
 * Downloads a release archive of the emulator.
 */
class ArchiveFetcher {
public:
    virtual ~ArchiveFetcher() = default;
    virtual void fetch(const std::string& url, const boost::filesystem::path& destination) const = 0;
};

/**
 * ArchiveFetcher over HTTP(S). Redirects (e.g. to the storage backend of a
 * release page) are followed manually, since the target usually lives on a
 * different host.
 */
class HttpArchiveFetcher : public ArchiveFetcher {
public:
    HttpArchiveFetcher(std::shared_ptr<const common::Config> config);
    void fetch(const std::string& url, const boost::filesystem::path& destination) const override;

private:
    std::unique_ptr<web::http::client::http_client> setupHttpClient(const std::string& server) const;
    void setProxyIfNecessary(web::http::client::http_client_config& clientConfig) const;
    void downloadStream(const web::http::http_response& response, const boost::filesystem::path& filename) const;
    void printLog(const boost::format& message, libshipyard::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    const std::string sysname = "HttpArchiveFetcher";
    const int maxRedirects = 10;
};

}
}

#endif
