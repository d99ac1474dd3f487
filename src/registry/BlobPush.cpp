/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "registry/BlobPush.hpp"

#include <algorithm>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/json.hpp"


namespace stratum {
namespace registry {

    std::string blobPushStateToString(BlobPushState state) {
        switch(state) {
            case BlobPushState::NotChecked: return "NotChecked";
            case BlobPushState::Checked: return "Checked";
            case BlobPushState::Uploading: return "Uploading";
            case BlobPushState::Uploaded: return "Uploaded";
        }
        return "Unknown";
    }

    bool hasRegistryErrorCode(const HttpResponse& response, const std::string& code) {
        try {
            auto json = libstratum::json::parse(response.body);
            if(!json.IsObject() || !json.HasMember("errors") || !json["errors"].IsArray()) {
                return false;
            }
            for(const auto& error : json["errors"].GetArray()) {
                if(error.IsObject() && error.HasMember("code") && error["code"].IsString()
                   && code == error["code"].GetString()) {
                    return true;
                }
            }
        }
        catch(const libstratum::Error& e) {
            // not a JSON error body
            libstratum::logMessage(boost::format("Could not parse registry error body: %s") % e.what(),
                                   libstratum::LogLevel::DEBUG);
        }
        return false;
    }

    BlobPush::BlobPush(const RegistrySession& session,
                       const storage::ContentStore& contentStore,
                       const common::Descriptor& descriptor,
                       std::size_t chunkSize)
        : session(session)
        , contentStore(contentStore)
        , descriptor{descriptor}
        , chunkSize{std::max<std::size_t>(chunkSize, 1)}
    {}

    void BlobPush::run() {
        auto logContext = libstratum::Logger::Context{"blob " + descriptor.digest.getHex().substr(0, 12)};
        if(!check()) {
            upload();
        }
    }

    /**
     * Asks the registry whether the repository already has the blob.
     */
    bool BlobPush::check() {
        if(state != BlobPushState::NotChecked) {
            auto message = boost::format("Cannot check blob %s in state %s")
                % descriptor.digest % blobPushStateToString(state);
            STRATUM_THROW_ERROR(message.str());
        }

        auto request = HttpRequest{"HEAD", session.makeUrl("/blobs/" + descriptor.digest.string()), {}, {}};
        auto response = session.send(request);

        if(response.status == 200) {
            printLog(boost::format("> %-15.15s: %s") % "exists" % descriptor.digest, libstratum::LogLevel::GENERAL);
            skipped = true;
            state = BlobPushState::Uploaded;
            return true;
        }
        if(response.status != 404) {
            throwUnexpectedResponse(request, response);
        }

        state = BlobPushState::Checked;
        return false;
    }

    void BlobPush::upload() {
        if(state != BlobPushState::Checked) {
            auto message = boost::format("Cannot upload blob %s in state %s")
                % descriptor.digest % blobPushStateToString(state);
            STRATUM_THROW_ERROR(message.str());
        }

        auto blob = readVerifiedBlob();

        printLog(boost::format("> %-15.15s: %s") % "pushing" % descriptor.digest, libstratum::LogLevel::GENERAL);
        state = BlobPushState::Uploading;
        auto location = startSession();

        if(blob.size() <= chunkSize) {
            finalize(location, blob);
        }
        else {
            location = uploadChunks(location, blob);
            finalize(location, {});
        }

        bytesUploaded = static_cast<int64_t>(blob.size());
        state = BlobPushState::Uploaded;
        printLog(boost::format("> %-15.15s: %s") % "pushed" % descriptor.digest, libstratum::LogLevel::GENERAL);
    }

    /**
     * Reads the blob from the content store and hashes it again: corrupt local
     * content must never reach the registry.
     */
    std::string BlobPush::readVerifiedBlob() const {
        auto blob = contentStore.get(descriptor.digest);
        auto actual = common::Digest::compute(blob);
        if(actual != descriptor.digest) {
            auto message = boost::format("Content of blob %s in the content store hashes to %s")
                % descriptor.digest % actual;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
        }
        return blob;
    }

    std::string BlobPush::startSession() const {
        auto request = HttpRequest{"POST", session.makeUrl("/blobs/uploads/"), {}, {}};
        auto response = session.send(request);
        if(response.status != 202) {
            throwUnexpectedResponse(request, response);
        }

        auto location = response.getHeader("Location");
        if(!location) {
            auto message = boost::format("Registry did not return an upload location for blob %s") % descriptor.digest;
            STRATUM_THROW_ERROR(message.str());
        }
        printLog(boost::format("Upload session for %s at %s") % descriptor.digest % *location,
                 libstratum::LogLevel::DEBUG);
        return session.resolveLocation(*location);
    }

    std::string BlobPush::uploadChunks(std::string location, const std::string& blob) {
        for(std::size_t offset = 0; offset < blob.size(); offset += chunkSize) {
            auto length = std::min(chunkSize, blob.size() - offset);
            auto request = HttpRequest{"PATCH", location, {}, blob.substr(offset, length)};
            request.headers["Content-Type"] = "application/octet-stream";
            request.headers["Content-Range"] = (boost::format("%d-%d") % offset % (offset + length - 1)).str();

            auto response = session.send(request);
            if(response.status != 202) {
                throwUnexpectedResponse(request, response);
            }
            auto nextLocation = response.getHeader("Location");
            if(nextLocation) {
                location = session.resolveLocation(*nextLocation);
            }
            printLog(boost::format("Uploaded chunk %d-%d of %s")
                     % offset % (offset + length - 1) % descriptor.digest, libstratum::LogLevel::DEBUG);
        }
        return location;
    }

    void BlobPush::finalize(const std::string& location, const std::string& body) {
        auto request = HttpRequest{"PUT", appendDigestParameter(location, descriptor.digest), {}, body};
        request.headers["Content-Type"] = "application/octet-stream";
        auto response = session.send(request);

        if(response.status == 400 && hasRegistryErrorCode(response, "DIGEST_INVALID")) {
            auto message = boost::format("Registry rejected blob %s: digest mismatch (%s)")
                % descriptor.digest % response.body;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
        }
        if(response.status != 201) {
            throwUnexpectedResponse(request, response);
        }

        auto registryDigest = response.getHeader("Docker-Content-Digest");
        if(registryDigest && *registryDigest != descriptor.digest.string()) {
            auto message = boost::format("Registry stored blob %s under digest %s")
                % descriptor.digest % *registryDigest;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
        }
    }

    std::string BlobPush::appendDigestParameter(const std::string& location, const common::Digest& digest) {
        auto separator = location.find('?') == std::string::npos ? "?" : "&";
        return location + separator + "digest=" + digest.string();
    }

    void BlobPush::printLog(const boost::format& message, libstratum::LogLevel logLevel,
                            std::ostream& out, std::ostream& err) const {
        libstratum::Logger::getInstance().log(message, sysname, logLevel, out, err);
    }

}
}
