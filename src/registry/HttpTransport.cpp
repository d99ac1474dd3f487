/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "registry/HttpTransport.hpp"

#include <vector>

#include <cpprest/http_client.h>
#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/logging.hpp"

using namespace web;                        // Common features like URIs.
using namespace web::http;                  // Common HTTP functionality


namespace stratum {
namespace registry {

boost::optional<std::string> HttpResponse::getHeader(const std::string& name) const {
    for(const auto& header : headers) {
        if(boost::iequals(header.first, name)) {
            return header.second;
        }
    }
    return boost::none;
}

CppRestTransport::CppRestTransport(std::chrono::seconds timeout)
    : timeout{timeout}
{}

HttpResponse CppRestTransport::send(const HttpRequest& request) {
    libstratum::logMessage(boost::format("httpclient: %s %s (%d bytes)")
                           % request.method % request.url % request.body.size(), libstratum::LogLevel::DEBUG);

    auto output = HttpResponse{};
    try {
        auto requestUri = uri{utility::conversions::to_string_t(request.url)};

        auto clientConfig = client::http_client_config{};
        clientConfig.set_timeout(timeout);
        auto httpClient = client::http_client{requestUri.authority(), clientConfig};

        auto httpRequest = http_request{utility::conversions::to_string_t(request.method)};
        httpRequest.set_request_uri(requestUri.resource());
        if(!request.body.empty()) {
            httpRequest.set_body(std::vector<unsigned char>(request.body.cbegin(), request.body.cend()));
        }
        for(const auto& header : request.headers) {
            httpRequest.headers()[utility::conversions::to_string_t(header.first)]
                = utility::conversions::to_string_t(header.second);
        }

        auto response = httpClient.request(httpRequest).get();
        output.status = response.status_code();
        for(const auto& header : response.headers()) {
            output.headers[utility::conversions::to_utf8string(header.first)]
                = utility::conversions::to_utf8string(header.second);
        }
        if(request.method != "HEAD") {
            auto body = response.extract_vector().get();
            output.body = std::string(body.cbegin(), body.cend());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("HTTP request %s %s failed: %s") % request.method % request.url % e.what();
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NetworkError, message.str());
    }

    libstratum::logMessage(boost::format("Received HTTP response status code (%d) for %s %s")
                           % output.status % request.method % request.url, libstratum::LogLevel::DEBUG);
    return output;
}

}
}
