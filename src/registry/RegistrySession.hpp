/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_registry_RegistrySession_hpp
#define stratum_registry_RegistrySession_hpp

#include <memory>
#include <string>
#include <mutex>
#include <iostream>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "registry/HttpTransport.hpp"


namespace stratum {
namespace registry {

/**
 * Conversation with the registry serving one repository. Takes care of the
 * concerns shared by all the requests: URLs, bearer tokens, retries.
 *
 * Network failures and 5xx responses are retried with exponential backoff, up
 * to the configured number of retries. Other responses are handed to the caller.
 * A 401 response carrying a Bearer challenge triggers a token request and one
 * more attempt. Safe to use from several threads.
 */
class RegistrySession {
public:
    RegistrySession(std::shared_ptr<HttpTransport> transport,
                    const common::ImageReference& reference,
                    const common::Config::Registry& settings);

    HttpResponse send(const HttpRequest& request, bool authorize = true) const;
    std::string makeUrl(const std::string& path) const;
    std::string resolveLocation(const std::string& location) const;
    const common::ImageReference& getReference() const { return reference; }
    const std::string& getEndpoint() const { return endpoint; }

private:
    HttpResponse sendWithRetries(HttpRequest request, bool authorize) const;
    bool authenticate(const HttpResponse& challenge) const;
    std::string getToken() const;
    void printLog(const boost::format& message, libstratum::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "RegistryClient";
    std::shared_ptr<HttpTransport> transport;
    common::ImageReference reference;
    common::Config::Registry settings;
    std::string endpoint;
    mutable std::mutex tokenMutex;
    mutable std::string token;
};

/**
 * Error raised for an unexpected response of the registry: 404 is NotFound,
 * anything else is Generic. The registry's error body is part of the message.
 */
[[noreturn]] void throwUnexpectedResponse(const HttpRequest& request, const HttpResponse& response);

}
}

#endif
