/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_Layer_hpp
#define stratum_build_engine_Layer_hpp

#include <string>
#include <memory>
#include <cstdint>

#include "common/Digest.hpp"
#include "common/ImageSpec.hpp"
#include "build_engine/FilesystemState.hpp"


namespace stratum {
namespace build_engine {

/**
 * One filesystem changeset in its serialized form. 'digest' identifies the compressed
 * blob, 'diffID' the uncompressed tar. A layer is immutable once created and shared
 * read-only between the stages and images that reference it.
 */
struct Layer {
    common::Digest digest;
    common::Digest diffID;
    int64_t size = 0;
    std::string mediaType = common::mediaType::OCI_LAYER_TAR_GZIP;
    std::string createdBy;
    // compressed bytes, only kept until the blob is stored
    std::shared_ptr<const std::string> blob;

    common::Descriptor getDescriptor() const;

    static Layer create(const Changeset& changeset, const std::string& createdBy);
};

}
}

#endif
