/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


/**
 * Pushing and pulling container images to and from registry services
 */

#include "registry/RegistryClient.hpp"

#include <future>
#include <functional>
#include <algorithm>
#include <chrono>

#include <boost/algorithm/string.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/json.hpp"
#include "registry/BlobPush.hpp"


namespace stratum {
namespace registry {

    namespace {
        // maximum number of redirects followed to download a blob
        const int MAX_REDIRECTS = 5;

        std::string makeAcceptHeader() {
            return boost::algorithm::join(std::vector<std::string>{
                common::mediaType::OCI_MANIFEST,
                common::mediaType::DOCKER_MANIFEST,
                common::mediaType::OCI_INDEX,
                common::mediaType::DOCKER_MANIFEST_LIST}, ", ");
        }
    }

    RegistryClient::RegistryClient(std::shared_ptr<const common::Config> config,
                                   std::shared_ptr<const storage::ContentStore> contentStore,
                                   std::shared_ptr<HttpTransport> transport)
        : config{std::move(config)}
        , contentStore{std::move(contentStore)}
        , transport{std::move(transport)}
    {}

    /**
     * Push the image whose manifest is stored in the content store
     *
     * @param reference     The remote repository and tag to publish the manifest under
     * @param manifest      The descriptor of the manifest blob
     */
    PushReport RegistryClient::push(const common::ImageReference& reference, const common::Descriptor& manifest) const {
        printLog(boost::format("Pushing image %s (%s)") % reference % manifest.digest, libstratum::LogLevel::INFO);

        std::chrono::system_clock::time_point start, end;
        start = std::chrono::system_clock::now();

        auto session = RegistrySession{transport, reference, config->registry};
        printLog(boost::format("# registry endpoint : %s") % session.getEndpoint(), libstratum::LogLevel::GENERAL);
        printLog(boost::format("# repository        : %s") % reference.getRepositoryName(), libstratum::LogLevel::GENERAL);

        auto imageManifest = common::ImageManifest{};
        try {
            imageManifest = common::ImageManifest::parse(contentStore->get(manifest.digest));
        }
        catch(libstratum::Error& e) {
            auto message = boost::format("Failed to read manifest %s from the content store") % manifest.digest;
            STRATUM_RETHROW_ERROR(e, message.str());
        }

        auto blobs = imageManifest.layers;
        blobs.push_back(imageManifest.config);

        auto report = PushReport{};
        pushBlobs(session, blobs, report);
        pushManifest(session, manifest);
        report.manifestDigest = manifest.digest;

        end = std::chrono::system_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() / double(1000);
        printLog(boost::format("Elapsed time on pushing    : %s [sec]") % elapsed, libstratum::LogLevel::INFO);
        printLog(boost::format("Pushed %s: %d blob(s) uploaded (%d bytes), %d already present")
                 % reference % report.blobsUploaded % report.bytesUploaded % report.blobsSkipped,
                 libstratum::LogLevel::INFO);
        return report;
    }

    void RegistryClient::pushBlobs(const RegistrySession& session, const std::vector<common::Descriptor>& blobs,
                                   PushReport& report) const {
        printLog(boost::format("Create upload threads."), libstratum::LogLevel::DEBUG);

        std::vector<std::unique_ptr<BlobPush>> pushes;
        for(const auto& blob : blobs) {
            auto duplicate = std::find_if(pushes.cbegin(), pushes.cend(), [&blob](const std::unique_ptr<BlobPush>& push) {
                return push->getDescriptor().digest == blob.digest;
            });
            if(duplicate == pushes.cend()) {
                pushes.push_back(std::unique_ptr<BlobPush>{
                    new BlobPush{session, *contentStore, blob, config->registry.chunkSize}});
            }
        }

        std::vector<std::future<void>> results;
        for(auto& push : pushes) {
            results.push_back(std::async(std::launch::async, &BlobPush::run, push.get()));
        }

        try {
            // check that all upload threads exited normally (without throwing exceptions)
            for(auto& result : results) {
                result.get();
            }
        }
        catch(libstratum::Error& e) {
            STRATUM_RETHROW_ERROR(e, "Failed to push image. An error occurred in one of the upload threads.");
        }

        for(const auto& push : pushes) {
            if(push->isSkipped()) {
                ++report.blobsSkipped;
            }
            else {
                ++report.blobsUploaded;
                report.bytesUploaded += push->getBytesUploaded();
            }
        }
    }

    void RegistryClient::pushManifest(const RegistrySession& session, const common::Descriptor& manifest) const {
        auto body = contentStore->get(manifest.digest);
        if(common::Digest::compute(body) != manifest.digest) {
            auto message = boost::format("Content of manifest %s in the content store is corrupt") % manifest.digest;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
        }

        const auto& reference = session.getReference();
        auto request = HttpRequest{"PUT", session.makeUrl("/manifests/" + reference.getRegistryReference()), {}, body};
        request.headers["Content-Type"] = manifest.mediaType;

        printLog(boost::format("> %-15.15s: %s") % "manifest" % manifest.digest, libstratum::LogLevel::GENERAL);
        auto response = session.send(request);

        if(response.status == 400 && hasRegistryErrorCode(response, "DIGEST_INVALID")) {
            auto message = boost::format("Registry rejected manifest %s: digest mismatch") % manifest.digest;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
        }
        if(response.status != 201) {
            throwUnexpectedResponse(request, response);
        }
        printLog(boost::format("Published manifest %s as %s") % manifest.digest % reference, libstratum::LogLevel::INFO);
    }

    /**
     * Pull the image into the content store
     *
     * @return the descriptor of the image manifest, ready to be tagged
     */
    common::Descriptor RegistryClient::pull(const common::ImageReference& reference) const {
        printLog(boost::format("Pulling image %s") % reference, libstratum::LogLevel::INFO);

        auto session = RegistrySession{transport, reference, config->registry};
        auto manifest = pullManifest(session, reference.getRegistryReference());
        auto imageManifest = common::ImageManifest::parse(contentStore->get(manifest.digest));

        pullBlob(session, imageManifest.config);

        printLog(boost::format("> save image layers ..."), libstratum::LogLevel::GENERAL);
        std::vector<std::future<void>> results;
        for(const auto& layer : imageManifest.layers) {
            results.push_back(std::async(std::launch::async, &RegistryClient::pullBlob, this, std::cref(session), layer));
        }

        try {
            // check that all download threads exited normally (without throwing exceptions)
            for(auto& result : results) {
                result.get();
            }
        }
        catch(libstratum::Error& e) {
            STRATUM_RETHROW_ERROR(e, "Failed to pull image. An error occurred in one of the download threads.");
        }

        printLog(boost::format("Successfully pulled image %s (%s)") % reference % manifest.digest,
                 libstratum::LogLevel::INFO);
        return manifest;
    }

    /**
     * Fetch the manifest and store it. An image index is resolved to the manifest
     * of the configured platform.
     */
    common::Descriptor RegistryClient::pullManifest(const RegistrySession& session, const std::string& reference) const {
        auto request = HttpRequest{"GET", session.makeUrl("/manifests/" + reference), {}, {}};
        request.headers["Accept"] = makeAcceptHeader();
        auto response = session.send(request);
        if(response.status != 200) {
            throwUnexpectedResponse(request, response);
        }

        auto mediaType = response.getHeader("Content-Type").value_or(common::mediaType::OCI_MANIFEST);
        mediaType = mediaType.substr(0, mediaType.find(';'));
        auto digest = common::Digest::compute(response.body);

        if(reference.compare(0, 7, "sha256:") == 0 && digest.string() != reference) {
            auto message = boost::format("Manifest %s received from the registry hashes to %s") % reference % digest;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
        }

        if(common::mediaType::isIndex(mediaType)) {
            auto selected = selectPlatformManifest(response.body);
            printLog(boost::format("Selected manifest %s for platform %s/%s")
                     % selected.digest % config->platform.os % config->platform.architecture,
                     libstratum::LogLevel::INFO);
            return pullManifest(session, selected.digest.string());
        }

        contentStore->put(response.body);
        printLog(boost::format("> %-15.15s: %s") % "manifest" % digest, libstratum::LogLevel::GENERAL);

        auto descriptor = common::Descriptor{};
        descriptor.mediaType = mediaType;
        descriptor.digest = digest;
        descriptor.size = static_cast<int64_t>(response.body.size());
        return descriptor;
    }

    common::Descriptor RegistryClient::selectPlatformManifest(const std::string& index) const {
        auto json = libstratum::json::parse(index);
        const auto& manifests = libstratum::json::getMember(json, "manifests");
        if(!manifests.IsArray()) {
            STRATUM_THROW_ERROR("Malformed image index: 'manifests' is not an array");
        }
        for(const auto& manifest : manifests.GetArray()) {
            if(!manifest.IsObject() || !manifest.HasMember("platform") || !manifest["platform"].IsObject()) {
                continue;
            }
            const auto& platform = manifest["platform"];
            if(libstratum::json::getString(platform, "os") == config->platform.os
               && libstratum::json::getString(platform, "architecture") == config->platform.architecture) {
                return common::Descriptor::fromJSON(manifest);
            }
        }
        auto message = boost::format("The image index has no manifest for platform %s/%s")
            % config->platform.os % config->platform.architecture;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }

    /**
     * Download one blob (following redirects) and store it after verifying its digest
     */
    void RegistryClient::pullBlob(const RegistrySession& session, const common::Descriptor& blob) const {
        if(contentStore->has(blob.digest)) {
            printLog(boost::format("> %-15.15s: %s") % "found in store" % blob.digest, libstratum::LogLevel::GENERAL);
            return;
        }

        printLog(boost::format("> %-15.15s: %s") % "pulling" % blob.digest, libstratum::LogLevel::GENERAL);
        auto request = HttpRequest{"GET", session.makeUrl("/blobs/" + blob.digest.string()), {}, {}};
        auto response = session.send(request);

        // handle redirect to download blob
        for(int redirects = 0; response.status > 300 && response.status < 309; ++redirects) {
            auto location = response.getHeader("Location");
            if(!location || redirects >= MAX_REDIRECTS) {
                auto message = boost::format("Failed to follow redirected download of blob %s") % blob.digest;
                STRATUM_THROW_ERROR(message.str());
            }
            printLog(boost::format("Blob %s: download redirected to %s") % blob.digest % *location,
                     libstratum::LogLevel::DEBUG);
            request = HttpRequest{"GET", session.resolveLocation(*location), {}, {}};
            response = session.send(request, false);
        }

        if(response.status != 200) {
            throwUnexpectedResponse(request, response);
        }

        try {
            contentStore->putVerified(response.body, blob.digest);
        }
        catch(libstratum::Error& e) {
            printLog(boost::format("> %-15.15s: %s") % "bad checksum" % blob.digest, libstratum::LogLevel::GENERAL);
            STRATUM_RETHROW_ERROR(e, "Failed to verify downloaded blob");
        }
        printLog(boost::format("> %-15.15s: %s") % "completed" % blob.digest, libstratum::LogLevel::GENERAL);
    }

    void RegistryClient::printLog(const boost::format& message, libstratum::LogLevel logLevel,
                                  std::ostream& out, std::ostream& err) const {
        libstratum::Logger::getInstance().log(message, sysname, logLevel, out, err);
    }

}
}
