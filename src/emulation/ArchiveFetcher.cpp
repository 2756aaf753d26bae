/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ArchiveFetcher.hpp"

#include <cpprest/filestream.h>
#include <boost/regex.hpp>

#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"

using namespace web::http;                  // Common HTTP functionality
using namespace concurrency::streams;       // Asynchronous streams


namespace shipyard {
namespace emulation {

HttpArchiveFetcher::HttpArchiveFetcher(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

void HttpArchiveFetcher::fetch(const std::string& url, const boost::filesystem::path& destination) const {
    printLog(boost::format("Downloading %s") % url, libshipyard::LogLevel::INFO);

    static const boost::regex urlPattern("(https?://[^/]+)(/.*)?");
    auto location = url;
    std::string server;

    for(int redirect = 0; redirect <= maxRedirects; ++redirect) {
        std::string path;
        boost::smatch matches;
        if(boost::regex_match(location, matches, urlPattern)) {
            server = matches[1].str();
            path = matches[2].matched ? matches[2].str() : std::string{"/"};
        }
        else if(!location.empty() && location.front() == '/' && !server.empty()) {
            path = location;
        }
        else {
            auto message = boost::format("Failed to parse download location: %s") % location;
            SHIPYARD_THROW_ERROR(message.str());
        }

        web::http::http_response response;
        try {
            auto client = setupHttpClient(server);
            web::http::http_request request(methods::GET);
            request.set_request_uri(path);
            printLog(boost::format("httpclient: uri=%s, path=%s") % server % path, libshipyard::LogLevel::DEBUG);
            response = client->request(request).get();
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to download %s") % url;
            SHIPYARD_RETHROW_ERROR(e, message.str());
        }
        printLog(boost::format("Received HTTP response status code (%s): %s")
            % response.status_code() % response.reason_phrase(), libshipyard::LogLevel::DEBUG);

        if(response.status_code() == status_codes::OK) {
            downloadStream(response, destination);
            return;
        }
        else if(response.status_code() > 300 && response.status_code() < 309) {
            location = response.headers()[U("Location")];
            printLog(boost::format("Download redirected to %s") % location, libshipyard::LogLevel::DEBUG);
            continue;
        }

        auto message = boost::format("Failed to download %s: unexpected HTTP response status code (%s): %s")
            % url % response.status_code() % response.reason_phrase();
        SHIPYARD_THROW_ERROR(message.str());
    }

    auto message = boost::format("Failed to download %s: exceeded max number of redirects (%d)") % url % maxRedirects;
    SHIPYARD_THROW_ERROR(message.str());
}

std::unique_ptr<web::http::client::http_client> HttpArchiveFetcher::setupHttpClient(const std::string& server) const {
    web::http::client::http_client_config clientConfig;
    setProxyIfNecessary(clientConfig);
    return std::unique_ptr<web::http::client::http_client>(new web::http::client::http_client(server, clientConfig));
}

void HttpArchiveFetcher::setProxyIfNecessary(web::http::client::http_client_config& clientConfig) const {
    // Prefer lower case variable name like Python's urllib
    auto proxy = libshipyard::environment::getOptionalVariable("https_proxy");
    if(!proxy || proxy->empty()) {
        proxy = libshipyard::environment::getOptionalVariable("HTTPS_PROXY");
    }
    if(proxy && !proxy->empty()) {
        printLog(boost::format("Setting proxy for HTTP client: %s") % *proxy, libshipyard::LogLevel::DEBUG);
        clientConfig.set_proxy(web::web_proxy(*proxy));
    }
}

/**
 * Download the HTTP response body to a file
 *
 * @param response      The HTTP response whose body will be saved
 * @param filename      Path to the file where to save the response body
 */
void HttpArchiveFetcher::downloadStream(const web::http::http_response& response, const boost::filesystem::path& filename) const {
    printLog(boost::format("Starting download stream to %s") % filename, libshipyard::LogLevel::DEBUG);
    auto fileStream = std::make_shared<ostream>();
    // open stream
    pplx::task<void> downloadTask = fstream::open_ostream(U(filename.string())).then([=](ostream outFile) {
        *fileStream = outFile;
        return;
    })
    // handle response
    .then([=]() {
        return response.body().read_to_end(fileStream->streambuf());
    })
    // close stream
    .then([=](size_t) {
        return fileStream->close();
    });

    try {
        downloadTask.wait();
    }
    catch(const std::exception& e) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove(filename, ec);
        SHIPYARD_RETHROW_ERROR(e, "Download stream error");
    }

    printLog(boost::format("Finished download stream to %s") % filename, libshipyard::LogLevel::DEBUG);
}

void HttpArchiveFetcher::printLog(const boost::format& message, libshipyard::LogLevel level,
                                  std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
