/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_storage_ContentStore_hpp
#define stratum_storage_ContentStore_hpp

#include <string>
#include <vector>
#include <cstdint>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/Digest.hpp"


namespace stratum {
namespace storage {

/**
 * Content-addressable blob store laid out as the "blobs" directory of an OCI image
 * layout: each blob lives in <root>/blobs/<algorithm>/<hex>.
 *
 * A blob is written to a temporary file and renamed into place, so a blob file is
 * either absent or complete. Concurrent puts of the same content converge to one file.
 */
class ContentStore {
public:
    explicit ContentStore(const boost::filesystem::path& rootDirectory);

    common::Digest put(const std::string& bytes) const;
    void putVerified(const std::string& bytes, const common::Digest& expectedDigest) const;
    std::string get(const common::Digest& digest) const;
    bool has(const common::Digest& digest) const;
    int64_t size(const common::Digest& digest) const;
    std::vector<common::Digest> list() const;
    boost::filesystem::path getBlobPath(const common::Digest& digest) const;
    const boost::filesystem::path& getRootDirectory() const { return rootDirectory; }

private:
    void store(const std::string& bytes, const common::Digest& digest) const;
    void printLog(const boost::format& message, libstratum::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "ContentStore";
    boost::filesystem::path rootDirectory;
    boost::filesystem::path blobsDirectory;
};

}
}

#endif
