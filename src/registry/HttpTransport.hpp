/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_registry_HttpTransport_hpp
#define stratum_registry_HttpTransport_hpp

#include <string>
#include <map>
#include <chrono>

#include <boost/optional.hpp>


namespace stratum {
namespace registry {

struct HttpRequest {
    std::string method;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    // header names are case insensitive
    boost::optional<std::string> getHeader(const std::string& name) const;
};

/**
 * Sends one HTTP request and returns the response, whatever its status code.
 * Failures to reach the server (connection refused, timeout, broken stream)
 * are reported as libstratum::Error with code NetworkError.
 *
 * Implementations must allow concurrent calls of send().
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * HttpTransport based on the cpprestsdk HTTP client. Redirects are not followed.
 */
class CppRestTransport : public HttpTransport {
public:
    explicit CppRestTransport(std::chrono::seconds timeout);
    HttpResponse send(const HttpRequest& request) override;

private:
    std::chrono::seconds timeout;
};

}
}

#endif
