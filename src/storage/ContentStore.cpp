/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "storage/ContentStore.hpp"

#include <algorithm>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/filesystem.hpp"
#include "libstratum/utility/string.hpp"


namespace stratum {
namespace storage {

    ContentStore::ContentStore(const boost::filesystem::path& rootDirectory)
        : rootDirectory{rootDirectory}
        , blobsDirectory{rootDirectory / "blobs"}
    {
        libstratum::filesystem::createFoldersIfNecessary(blobsDirectory / common::Digest::SHA256);
    }

    /**
     * Stores the bytes and returns their digest. Storing content that is already
     * present performs no write.
     */
    common::Digest ContentStore::put(const std::string& bytes) const {
        auto digest = common::Digest::compute(bytes);
        store(bytes, digest);
        return digest;
    }

    /**
     * Stores the bytes only if they hash to the expected digest,
     * e.g. content downloaded from a registry.
     */
    void ContentStore::putVerified(const std::string& bytes, const common::Digest& expectedDigest) const {
        auto actualDigest = common::Digest::compute(bytes);
        if(actualDigest != expectedDigest) {
            auto message = boost::format("Content digest mismatch: expected %s, computed %s") % expectedDigest % actualDigest;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
        }
        store(bytes, actualDigest);
    }

    void ContentStore::store(const std::string& bytes, const common::Digest& digest) const {
        if(has(digest)) {
            printLog(boost::format("Blob %s already present, skipping write") % digest, libstratum::LogLevel::DEBUG);
            return;
        }

        auto path = getBlobPath(digest);
        try {
            libstratum::filesystem::createFoldersIfNecessary(path.parent_path());
            libstratum::filesystem::writeFileAtomically(bytes, path);
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to store blob %s in %s") % digest % blobsDirectory;
            STRATUM_RETHROW_ERROR(e, message.str());
        }

        printLog(boost::format("Stored blob %s (%d bytes)") % digest % bytes.size(), libstratum::LogLevel::DEBUG);
    }

    std::string ContentStore::get(const common::Digest& digest) const {
        if(!has(digest)) {
            auto message = boost::format("Blob %s not found in content store %s") % digest % rootDirectory;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
        }
        return libstratum::filesystem::readFile(getBlobPath(digest));
    }

    bool ContentStore::has(const common::Digest& digest) const {
        return boost::filesystem::is_regular_file(getBlobPath(digest));
    }

    int64_t ContentStore::size(const common::Digest& digest) const {
        if(!has(digest)) {
            auto message = boost::format("Blob %s not found in content store %s") % digest % rootDirectory;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
        }
        return static_cast<int64_t>(libstratum::filesystem::getFileSize(getBlobPath(digest)));
    }

    /**
     * Lists the digests of the stored blobs. Temporary files of
     * writes in progress are not blobs and are skipped.
     */
    std::vector<common::Digest> ContentStore::list() const {
        auto digests = std::vector<common::Digest>{};
        auto directory = blobsDirectory / common::Digest::SHA256;
        for(auto it = boost::filesystem::directory_iterator{directory}; it != boost::filesystem::directory_iterator{}; ++it) {
            auto name = it->path().filename().string();
            if(boost::filesystem::is_regular_file(it->path()) && name.size() == 64 && libstratum::string::isHex(name)) {
                digests.emplace_back(common::Digest::SHA256, name);
            }
        }
        std::sort(digests.begin(), digests.end());
        return digests;
    }

    boost::filesystem::path ContentStore::getBlobPath(const common::Digest& digest) const {
        if(digest.empty()) {
            STRATUM_THROW_ERROR("Cannot locate a blob with an empty digest");
        }
        return blobsDirectory / digest.getAlgorithm() / digest.getHex();
    }

    void ContentStore::printLog(const boost::format& message, libstratum::LogLevel logLevel,
                                std::ostream& out, std::ostream& err) const {
        libstratum::Logger::getInstance().log(message, sysname, logLevel, out, err);
    }

} // namespace
} // namespace
