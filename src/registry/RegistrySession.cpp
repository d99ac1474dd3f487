/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "registry/RegistrySession.hpp"

#include <thread>

#include <boost/regex.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/json.hpp"


namespace stratum {
namespace registry {

    RegistrySession::RegistrySession(std::shared_ptr<HttpTransport> transport,
                                     const common::ImageReference& reference,
                                     const common::Config::Registry& settings)
        : transport{std::move(transport)}
        , reference{reference}
        , settings(settings)
        , endpoint{reference.getRegistryEndpoint(settings.insecureRegistries)}
    {}

    HttpResponse RegistrySession::send(const HttpRequest& request, bool authorize) const {
        auto response = sendWithRetries(request, authorize);
        if(response.status == 401 && authorize && authenticate(response)) {
            response = sendWithRetries(request, authorize);
        }
        return response;
    }

    /**
     * URL of a path below the repository, e.g. "/blobs/uploads/" becomes
     * "https://<registry>/v2/<repository>/blobs/uploads/".
     */
    std::string RegistrySession::makeUrl(const std::string& path) const {
        return endpoint + "/v2/" + reference.getRepositoryName() + path;
    }

    /**
     * The Location header of upload responses may be absolute or relative to the registry.
     */
    std::string RegistrySession::resolveLocation(const std::string& location) const {
        if(location.compare(0, 7, "http://") == 0 || location.compare(0, 8, "https://") == 0) {
            return location;
        }
        if(!location.empty() && location.front() == '/') {
            return endpoint + location;
        }
        return endpoint + "/" + location;
    }

    HttpResponse RegistrySession::sendWithRetries(HttpRequest request, bool authorize) const {
        auto authorizationToken = authorize ? getToken() : std::string{};
        if(!authorizationToken.empty()) {
            request.headers["Authorization"] = "Bearer " + authorizationToken;
        }

        auto backoff = settings.retryBackoff;
        for(int attempt = 0; ; ++attempt) {
            if(attempt > 0) {
                printLog(boost::format("> %-15.15s: %s %s (attempt %d of %d)")
                         % "retry" % request.method % request.url % (attempt + 1) % (settings.maxRetries + 1),
                         libstratum::LogLevel::GENERAL);
                std::this_thread::sleep_for(backoff);
                backoff *= 2;
            }

            try {
                auto response = transport->send(request);
                if(response.status < 500) {
                    return response;
                }
                auto message = boost::format("Registry answered %s %s with status %d")
                    % request.method % request.url % response.status;
                if(attempt >= settings.maxRetries) {
                    auto error = boost::format("%s. Exceeded max number of retries (%d).") % message % settings.maxRetries;
                    STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NetworkError, error.str());
                }
                printLog(message, libstratum::LogLevel::INFO);
            }
            catch(libstratum::Error& e) {
                if(e.getErrorCode() != libstratum::ErrorCode::NetworkError || attempt >= settings.maxRetries) {
                    STRATUM_RETHROW_ERROR(e, "Failed to communicate with the remote registry");
                }
                printLog(boost::format("%s") % e.what(), libstratum::LogLevel::INFO);
            }
        }
    }

    /**
     * Requests an anonymous bearer token from the authorization server named by
     * the challenge of a 401 response. Returns whether a token was obtained.
     */
    bool RegistrySession::authenticate(const HttpResponse& challenge) const {
        auto header = challenge.getHeader("WWW-Authenticate");
        if(!header || header->compare(0, 7, "Bearer ") != 0) {
            return false;
        }

        auto parameters = std::map<std::string, std::string>{};
        auto re = boost::regex{"(\\w+)=\"([^\"]*)\""};
        for(auto it = boost::sregex_iterator(header->cbegin(), header->cend(), re); it != boost::sregex_iterator{}; ++it) {
            parameters[(*it)[1].str()] = (*it)[2].str();
        }
        if(parameters.find("realm") == parameters.cend()) {
            return false;
        }

        auto url = parameters["realm"];
        auto separator = url.find('?') == std::string::npos ? '?' : '&';
        for(const auto& name : {"service", "scope"}) {
            if(parameters.find(name) != parameters.cend()) {
                url += separator + std::string{name} + "=" + parameters[name];
                separator = '&';
            }
        }

        printLog(boost::format("Requesting authorization token from %s") % url, libstratum::LogLevel::INFO);
        auto response = sendWithRetries(HttpRequest{"GET", url, {}, {}}, false);
        if(response.status != 200) {
            printLog(boost::format("Failed to get authorization token: status %d") % response.status,
                     libstratum::LogLevel::WARN);
            return false;
        }

        auto json = libstratum::json::parse(response.body);
        if(!json.IsObject()) {
            printLog(boost::format("Failed to get authorization token: response is not a JSON object"),
                     libstratum::LogLevel::WARN);
            return false;
        }
        auto newToken = std::string{};
        if(json.HasMember("token") && json["token"].IsString()) {
            newToken = json["token"].GetString();
        }
        else if(json.HasMember("access_token") && json["access_token"].IsString()) {
            newToken = json["access_token"].GetString();
        }
        else {
            return false;
        }

        std::lock_guard<std::mutex> lock{tokenMutex};
        token = newToken;
        return true;
    }

    std::string RegistrySession::getToken() const {
        std::lock_guard<std::mutex> lock{tokenMutex};
        return token;
    }

    void RegistrySession::printLog(const boost::format& message, libstratum::LogLevel logLevel,
                                   std::ostream& out, std::ostream& err) const {
        libstratum::Logger::getInstance().log(message, sysname, logLevel, out, err);
    }

    void throwUnexpectedResponse(const HttpRequest& request, const HttpResponse& response) {
        auto message = boost::format("Unexpected HTTP response status code (%d) for %s %s: %s")
            % response.status % request.method % request.url % response.body;
        if(response.status == 404) {
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
        }
        STRATUM_THROW_ERROR(message.str());
    }

}
}
