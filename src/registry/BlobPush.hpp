/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_registry_BlobPush_hpp
#define stratum_registry_BlobPush_hpp

#include <string>
#include <cstdint>
#include <iostream>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/ImageSpec.hpp"
#include "storage/ContentStore.hpp"
#include "registry/RegistrySession.hpp"


namespace stratum {
namespace registry {

enum class BlobPushState {NotChecked, Checked, Uploading, Uploaded};

std::string blobPushStateToString(BlobPushState state);

/**
 * Push of one blob from the content store to the remote repository.
 *
 * NotChecked -> Checked: existence check (HEAD). A blob the registry already
 * has goes straight to Uploaded and nothing is transferred.
 * Checked -> Uploading -> Uploaded: upload session, transfer, finalization
 * with the expected digest. Blobs up to the chunk size are sent with a single
 * PUT, larger ones as a sequence of PATCH requests.
 *
 * A digest rejected by the registry fails with DigestMismatch and is not retried.
 */
class BlobPush {
public:
    BlobPush(const RegistrySession& session,
             const storage::ContentStore& contentStore,
             const common::Descriptor& descriptor,
             std::size_t chunkSize);

    void run();
    bool check();
    void upload();

    BlobPushState getState() const { return state; }
    bool isSkipped() const { return skipped; }
    int64_t getBytesUploaded() const { return bytesUploaded; }
    const common::Descriptor& getDescriptor() const { return descriptor; }

private:
    std::string readVerifiedBlob() const;
    std::string startSession() const;
    std::string uploadChunks(std::string location, const std::string& blob);
    void finalize(const std::string& location, const std::string& body);
    static std::string appendDigestParameter(const std::string& location, const common::Digest& digest);
    void printLog(const boost::format& message, libstratum::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "RegistryClient";
    const RegistrySession& session;
    const storage::ContentStore& contentStore;
    common::Descriptor descriptor;
    std::size_t chunkSize;
    BlobPushState state = BlobPushState::NotChecked;
    bool skipped = false;
    int64_t bytesUploaded = 0;
};

/**
 * Whether the error body of a registry response carries the given error code,
 * e.g. "DIGEST_INVALID".
 */
bool hasRegistryErrorCode(const HttpResponse& response, const std::string& code);

}
}

#endif
