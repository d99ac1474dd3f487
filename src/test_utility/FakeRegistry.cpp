/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "test_utility/FakeRegistry.hpp"

#include <algorithm>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libstratum/Error.hpp"
#include "common/Digest.hpp"
#include "common/ImageSpec.hpp"


namespace test_utility {
namespace registry {

using stratum::registry::HttpRequest;
using stratum::registry::HttpResponse;

const std::string FakeRegistry::ENDPOINT{"http://localhost:5000"};
const std::string FakeRegistry::CDN_ENDPOINT{"http://cdn.localhost:8080"};
const std::string FakeRegistry::TOKEN{"fake-registry-token"};

HttpResponse FakeRegistry::send(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock{mutex};
    requests.push_back(request);

    if(unreachable) {
        auto message = boost::format("Failed to connect to %s: connection refused") % request.url;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NetworkError, message.str());
    }
    if(pendingFailures > 0 && (pendingFailureMethod.empty() || pendingFailureMethod == request.method)) {
        --pendingFailures;
        return makeError(pendingFailureStatus, "UNAVAILABLE", "injected failure");
    }
    auto failing = failingMethods.find(request.method);
    if(failing != failingMethods.cend()) {
        return makeError(failing->second, "DENIED", "injected failure");
    }

    return handle(request, parseUrl(request.url));
}

std::string FakeRegistry::putBlob(const std::string& bytes) {
    std::lock_guard<std::mutex> lock{mutex};
    auto digest = computeDigest(bytes);
    blobs[digest] = bytes;
    return digest;
}

void FakeRegistry::putManifest(const std::string& repository, const std::string& reference,
                               const std::string& body, const std::string& mediaType) {
    std::lock_guard<std::mutex> lock{mutex};
    manifests[repository + "@" + reference] = Manifest{body, mediaType};
    manifests[repository + "@" + computeDigest(body)] = Manifest{body, mediaType};
}

bool FakeRegistry::hasBlob(const std::string& digest) const {
    std::lock_guard<std::mutex> lock{mutex};
    return blobs.find(digest) != blobs.cend();
}

bool FakeRegistry::hasManifest(const std::string& repository, const std::string& reference) const {
    std::lock_guard<std::mutex> lock{mutex};
    return manifests.find(repository + "@" + reference) != manifests.cend();
}

std::string FakeRegistry::getManifest(const std::string& repository, const std::string& reference) const {
    std::lock_guard<std::mutex> lock{mutex};
    return manifests.at(repository + "@" + reference).body;
}

void FakeRegistry::corruptBlob(const std::string& digest) {
    std::lock_guard<std::mutex> lock{mutex};
    blobs.at(digest) += "corrupted";
}

void FakeRegistry::failNextRequests(int count, int status, const std::string& method) {
    std::lock_guard<std::mutex> lock{mutex};
    pendingFailures = count;
    pendingFailureStatus = status;
    pendingFailureMethod = method;
}

void FakeRegistry::failRequestsWith(const std::string& method, int status) {
    std::lock_guard<std::mutex> lock{mutex};
    failingMethods[method] = status;
}

std::vector<HttpRequest> FakeRegistry::getRequests() const {
    std::lock_guard<std::mutex> lock{mutex};
    return requests;
}

std::size_t FakeRegistry::countRequests(const std::string& method, const std::string& urlFragment) const {
    std::lock_guard<std::mutex> lock{mutex};
    return std::count_if(requests.cbegin(), requests.cend(), [&](const HttpRequest& request) {
        return request.method == method && request.url.find(urlFragment) != std::string::npos;
    });
}

int64_t FakeRegistry::getBytesReceived() const {
    std::lock_guard<std::mutex> lock{mutex};
    return bytesReceived;
}

HttpResponse FakeRegistry::handle(const HttpRequest& request, const Url& url) {
    if(url.endpoint == CDN_ENDPOINT) {
        // pre-signed download URLs reject the registry's credentials
        if(request.headers.find("Authorization") != request.headers.cend()) {
            return makeError(400, "INVALID_ARGUMENT", "unexpected Authorization header");
        }
        auto blob = blobs.find(url.path.substr(std::string{"/blobs/"}.size()));
        if(request.method != "GET" || blob == blobs.cend()) {
            return makeError(404, "NOT_FOUND", url.path);
        }
        return HttpResponse{200, {{"Content-Type", "application/octet-stream"}}, blob->second};
    }

    if(url.endpoint != ENDPOINT) {
        auto message = boost::format("Failed to resolve host of %s") % request.url;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NetworkError, message.str());
    }

    if(url.path == "/token") {
        return handleToken(url);
    }

    boost::smatch matches;
    auto repository = std::string{};
    if(boost::regex_match(url.path, matches, boost::regex{"^/v2/(.+)/(blobs|manifests)/.*$"})) {
        repository = matches[1].str();
    }
    if(requireToken && !isAuthorized(request)) {
        auto challenge = boost::format("Bearer realm=\"%s/token\",service=\"fake-registry\",scope=\"repository:%s:pull,push\"")
            % ENDPOINT % repository;
        auto response = makeError(401, "UNAUTHORIZED", "authentication required");
        response.headers["WWW-Authenticate"] = challenge.str();
        return response;
    }

    if(url.path == "/v2/" || url.path == "/v2") {
        return HttpResponse{200, {}, "{}"};
    }
    if(boost::regex_match(url.path, matches, boost::regex{"^/v2/(.+)/blobs/uploads/?$"})) {
        if(request.method != "POST") {
            return makeError(405, "UNSUPPORTED", request.method);
        }
        auto uuid = std::to_string(nextUpload++);
        uploads[uuid] = std::string{};
        auto location = "/v2/" + matches[1].str() + "/blobs/uploads/" + uuid;
        return HttpResponse{202, {{"Location", location}, {"Range", "0-0"}, {"Docker-Upload-UUID", uuid}}, {}};
    }
    if(boost::regex_match(url.path, matches, boost::regex{"^/v2/(.+)/blobs/uploads/([^/]+)$"})) {
        return handleUpload(request, matches[1].str(), matches[2].str(), url);
    }
    if(boost::regex_match(url.path, matches, boost::regex{"^/v2/(.+)/blobs/([^/]+)$"})) {
        return handleBlob(request, matches[1].str(), matches[2].str());
    }
    if(boost::regex_match(url.path, matches, boost::regex{"^/v2/(.+)/manifests/([^/]+)$"})) {
        return handleManifest(request, matches[1].str(), matches[2].str());
    }

    return makeError(404, "NOT_FOUND", url.path);
}

HttpResponse FakeRegistry::handleBlob(const HttpRequest& request, const std::string&, const std::string& digest) {
    auto blob = blobs.find(digest);
    if(blob == blobs.cend()) {
        return makeError(404, "BLOB_UNKNOWN", "blob unknown to registry");
    }

    auto headers = std::map<std::string, std::string>{
        {"Docker-Content-Digest", digest},
        {"Content-Length", std::to_string(blob->second.size())}};

    if(request.method == "HEAD") {
        return HttpResponse{200, headers, {}};
    }
    if(request.method == "GET") {
        if(redirectBlobs) {
            return HttpResponse{307, {{"Location", CDN_ENDPOINT + "/blobs/" + digest}}, {}};
        }
        return HttpResponse{200, headers, blob->second};
    }
    return makeError(405, "UNSUPPORTED", request.method);
}

HttpResponse FakeRegistry::handleUpload(const HttpRequest& request, const std::string& repository,
                                        const std::string& uuid, const Url& url) {
    auto upload = uploads.find(uuid);
    if(upload == uploads.end()) {
        return makeError(404, "BLOB_UPLOAD_UNKNOWN", "blob upload unknown to registry");
    }
    auto& data = upload->second;
    auto location = "/v2/" + repository + "/blobs/uploads/" + uuid;

    if(request.method == "PATCH") {
        auto range = request.headers.find("Content-Range");
        if(range != request.headers.cend()) {
            auto start = std::stoull(range->second.substr(0, range->second.find('-')));
            if(start != data.size()) {
                return makeError(416, "BLOB_UPLOAD_INVALID", "content range out of order");
            }
        }
        data += request.body;
        bytesReceived += static_cast<int64_t>(request.body.size());
        auto rangeHeader = (boost::format("0-%d") % (data.empty() ? 0 : data.size() - 1)).str();
        return HttpResponse{202, {{"Location", location}, {"Range", rangeHeader}}, {}};
    }

    if(request.method == "PUT") {
        data += request.body;
        bytesReceived += static_cast<int64_t>(request.body.size());

        auto expected = url.query.find("digest");
        if(expected == url.query.cend()) {
            return makeError(400, "DIGEST_INVALID", "missing digest parameter");
        }
        auto stored = corruptUploads ? data + "\n" : data;
        auto actual = computeDigest(stored);
        if(actual != expected->second) {
            uploads.erase(upload);
            return makeError(400, "DIGEST_INVALID", "provided digest did not match uploaded content");
        }

        blobs[actual] = stored;
        uploads.erase(upload);
        return HttpResponse{201, {{"Location", "/v2/" + repository + "/blobs/" + actual},
                                  {"Docker-Content-Digest", actual}}, {}};
    }

    return makeError(405, "UNSUPPORTED", request.method);
}

HttpResponse FakeRegistry::handleManifest(const HttpRequest& request, const std::string& repository,
                                          const std::string& reference) {
    auto key = repository + "@" + reference;

    if(request.method == "PUT") {
        auto contentType = request.headers.find("Content-Type");
        auto mediaType = contentType != request.headers.cend() ? contentType->second : std::string{};

        // all the blobs of a manifest must be pushed before the manifest
        if(stratum::common::mediaType::isManifest(mediaType)) {
            auto manifest = stratum::common::ImageManifest::parse(request.body);
            auto referenced = manifest.layers;
            referenced.push_back(manifest.config);
            for(const auto& descriptor : referenced) {
                if(blobs.find(descriptor.digest.string()) == blobs.cend()) {
                    return makeError(400, "MANIFEST_BLOB_UNKNOWN", descriptor.digest.string());
                }
            }
        }

        auto digest = computeDigest(request.body);
        if(reference.compare(0, 7, "sha256:") == 0 && reference != digest) {
            return makeError(400, "DIGEST_INVALID", "manifest digest did not match");
        }
        manifests[key] = Manifest{request.body, mediaType};
        manifests[repository + "@" + digest] = Manifest{request.body, mediaType};
        return HttpResponse{201, {{"Location", "/v2/" + repository + "/manifests/" + digest},
                                  {"Docker-Content-Digest", digest}}, {}};
    }

    auto manifest = manifests.find(key);
    if(manifest == manifests.cend()) {
        return makeError(404, "MANIFEST_UNKNOWN", "manifest unknown");
    }
    auto headers = std::map<std::string, std::string>{
        {"Content-Type", manifest->second.mediaType},
        {"Docker-Content-Digest", computeDigest(manifest->second.body)}};
    if(request.method == "HEAD") {
        return HttpResponse{200, headers, {}};
    }
    if(request.method == "GET") {
        return HttpResponse{200, headers, manifest->second.body};
    }
    return makeError(405, "UNSUPPORTED", request.method);
}

HttpResponse FakeRegistry::handleToken(const Url& url) const {
    if(url.query.find("service") == url.query.cend() || url.query.find("scope") == url.query.cend()) {
        return makeError(400, "INVALID_REQUEST", "missing service or scope");
    }
    if(!tokenResponseBody.empty()) {
        return HttpResponse{200, {{"Content-Type", "application/json"}}, tokenResponseBody};
    }
    return HttpResponse{200, {{"Content-Type", "application/json"}}, "{\"token\": \"" + TOKEN + "\"}"};
}

bool FakeRegistry::isAuthorized(const HttpRequest& request) const {
    auto authorization = request.headers.find("Authorization");
    return authorization != request.headers.cend() && authorization->second == "Bearer " + TOKEN;
}

FakeRegistry::Url FakeRegistry::parseUrl(const std::string& url) {
    auto parsed = Url{};
    auto schemeEnd = url.find("://");
    auto pathStart = url.find('/', schemeEnd == std::string::npos ? 0 : schemeEnd + 3);
    parsed.endpoint = url.substr(0, pathStart);
    if(pathStart == std::string::npos) {
        parsed.path = "/";
        return parsed;
    }

    auto queryStart = url.find('?', pathStart);
    parsed.path = url.substr(pathStart, queryStart - pathStart);
    if(queryStart != std::string::npos) {
        auto parameters = std::vector<std::string>{};
        auto query = url.substr(queryStart + 1);
        boost::algorithm::split(parameters, query, boost::algorithm::is_any_of("&"));
        for(const auto& parameter : parameters) {
            auto equal = parameter.find('=');
            parsed.query[parameter.substr(0, equal)] = equal == std::string::npos ? std::string{} : parameter.substr(equal + 1);
        }
    }
    return parsed;
}

HttpResponse FakeRegistry::makeError(int status, const std::string& code, const std::string& message) {
    auto body = boost::format("{\"errors\": [{\"code\": \"%s\", \"message\": \"%s\"}]}") % code % message;
    return HttpResponse{status, {{"Content-Type", "application/json"}}, body.str()};
}

std::string FakeRegistry::computeDigest(const std::string& bytes) {
    return stratum::common::Digest::compute(bytes).string();
}

}
}
