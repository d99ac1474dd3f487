/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_test_utility_FakeRegistry_hpp
#define stratum_test_utility_FakeRegistry_hpp

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <cstddef>
#include <cstdint>

#include "registry/HttpTransport.hpp"


namespace test_utility {
namespace registry {

/**
 * In-memory registry speaking the subset of the Docker Registry HTTP API v2 used
 * by the registry client, served at http://localhost:5000. Requests are answered
 * one at a time and logged.
 */
class FakeRegistry : public stratum::registry::HttpTransport {
public:
    static const std::string ENDPOINT;
    static const std::string CDN_ENDPOINT;
    static const std::string TOKEN;

public:
    stratum::registry::HttpResponse send(const stratum::registry::HttpRequest& request) override;

    // content
    std::string putBlob(const std::string& bytes);
    void putManifest(const std::string& repository, const std::string& reference,
                     const std::string& body, const std::string& mediaType);
    bool hasBlob(const std::string& digest) const;
    bool hasManifest(const std::string& repository, const std::string& reference) const;
    std::string getManifest(const std::string& repository, const std::string& reference) const;

    // misbehavior
    void corruptBlob(const std::string& digest);
    void failNextRequests(int count, int status = 503, const std::string& method = "");
    void failRequestsWith(const std::string& method, int status);
    void setCorruptUploads(bool value) { corruptUploads = value; }
    void setRequireToken(bool value) { requireToken = value; }
    void setRedirectBlobs(bool value) { redirectBlobs = value; }
    void setUnreachable(bool value) { unreachable = value; }
    void setTokenResponseBody(const std::string& body) { tokenResponseBody = body; }

    // bookkeeping
    std::vector<stratum::registry::HttpRequest> getRequests() const;
    std::size_t countRequests(const std::string& method, const std::string& urlFragment = "") const;
    int64_t getBytesReceived() const;

private:
    struct Url {
        std::string endpoint;
        std::string path;
        std::map<std::string, std::string> query;
    };

    struct Manifest {
        std::string body;
        std::string mediaType;
    };

    stratum::registry::HttpResponse handle(const stratum::registry::HttpRequest& request, const Url& url);
    stratum::registry::HttpResponse handleBlob(const stratum::registry::HttpRequest& request,
                                               const std::string& repository, const std::string& digest);
    stratum::registry::HttpResponse handleUpload(const stratum::registry::HttpRequest& request,
                                                 const std::string& repository, const std::string& uuid,
                                                 const Url& url);
    stratum::registry::HttpResponse handleManifest(const stratum::registry::HttpRequest& request,
                                                   const std::string& repository, const std::string& reference);
    stratum::registry::HttpResponse handleToken(const Url& url) const;
    bool isAuthorized(const stratum::registry::HttpRequest& request) const;
    static Url parseUrl(const std::string& url);
    static stratum::registry::HttpResponse makeError(int status, const std::string& code, const std::string& message);
    static std::string computeDigest(const std::string& bytes);

private:
    mutable std::mutex mutex;
    std::map<std::string, std::string> blobs;
    std::map<std::string, Manifest> manifests; // "<repository>@<reference>"
    std::map<std::string, std::string> uploads;
    std::size_t nextUpload = 0;

    std::vector<stratum::registry::HttpRequest> requests;
    int64_t bytesReceived = 0;

    int pendingFailures = 0;
    int pendingFailureStatus = 503;
    std::string pendingFailureMethod;
    std::map<std::string, int> failingMethods;
    bool corruptUploads = false;
    bool requireToken = false;
    bool redirectBlobs = false;
    bool unreachable = false;
    std::string tokenResponseBody;
};

}
}

#endif
