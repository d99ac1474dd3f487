/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_image_manager_StoredImage_hpp
#define stratum_image_manager_StoredImage_hpp

#include <string>
#include <cstdint>

#include "common/ImageReference.hpp"
#include "common/ImageSpec.hpp"


namespace stratum {
namespace image_manager {

struct StoredImage {
    common::ImageReference reference;  // the tag in the local OCI layout

    common::Descriptor manifest;       // the manifest the tag points to, its digest is the image's identity

    common::Digest id;                 // The sha256 hash of the image configuration JSON,
                                       // as defined by the OCI Image specification

    int64_t size = 0;                  // manifest + config + layer blobs, in bytes

    static std::string createSizeString(int64_t size);
};

bool operator==(const StoredImage&, const StoredImage&);

}
}

#endif
