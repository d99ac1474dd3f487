/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_registry_RegistryClient_hpp
#define stratum_registry_RegistryClient_hpp

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <iostream>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "common/ImageSpec.hpp"
#include "storage/ContentStore.hpp"
#include "registry/HttpTransport.hpp"
#include "registry/RegistrySession.hpp"


namespace stratum {
namespace registry {

struct PushReport {
    std::size_t blobsUploaded = 0;
    std::size_t blobsSkipped = 0;
    int64_t bytesUploaded = 0;
    common::Digest manifestDigest;
};

/**
 * Client side of the Docker Registry HTTP API v2.
 *
 * push() transfers the blobs of an image from the content store to a remote
 * repository, concurrently, and publishes the manifest only after every blob
 * is known to be present. pull() does the opposite way and stores everything
 * in the content store after verifying its digest.
 */
class RegistryClient {
public:
    RegistryClient(std::shared_ptr<const common::Config> config,
                   std::shared_ptr<const storage::ContentStore> contentStore,
                   std::shared_ptr<HttpTransport> transport);

    PushReport push(const common::ImageReference& reference, const common::Descriptor& manifest) const;
    common::Descriptor pull(const common::ImageReference& reference) const;

private:
    void pushBlobs(const RegistrySession& session, const std::vector<common::Descriptor>& blobs,
                   PushReport& report) const;
    void pushManifest(const RegistrySession& session, const common::Descriptor& manifest) const;
    common::Descriptor pullManifest(const RegistrySession& session, const std::string& reference) const;
    common::Descriptor selectPlatformManifest(const std::string& index) const;
    void pullBlob(const RegistrySession& session, const common::Descriptor& blob) const;
    void printLog(const boost::format& message, libstratum::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "RegistryClient";
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<const storage::ContentStore> contentStore;
    std::shared_ptr<HttpTransport> transport;
};

}
}

#endif
