/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/Layer.hpp"

#include "build_engine/archive.hpp"


namespace stratum {
namespace build_engine {

common::Descriptor Layer::getDescriptor() const {
    auto descriptor = common::Descriptor{};
    descriptor.mediaType = mediaType;
    descriptor.digest = digest;
    descriptor.size = size;
    return descriptor;
}

Layer Layer::create(const Changeset& changeset, const std::string& createdBy) {
    auto tar = archive::createTar(changeset);
    auto compressed = std::make_shared<const std::string>(archive::gzip(tar));

    auto layer = Layer{};
    layer.diffID = common::Digest::compute(tar);
    layer.digest = common::Digest::compute(*compressed);
    layer.size = static_cast<int64_t>(compressed->size());
    layer.createdBy = createdBy;
    layer.blob = compressed;
    return layer;
}

}
}
