/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_image_manager_ImageAssembler_hpp
#define stratum_image_manager_ImageAssembler_hpp

#include <memory>
#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/Digest.hpp"
#include "common/ImageSpec.hpp"
#include "storage/ContentStore.hpp"
#include "build_engine/Stage.hpp"


namespace stratum {
namespace image_manager {

struct AssembledImage {
    common::ImageConfiguration configuration;
    common::ImageManifest manifest;
    common::Descriptor manifestDescriptor;

    // canonical identity of the image: the digest of its manifest
    const common::Digest& getDigest() const { return manifestDescriptor.digest; }
};

/**
 * Packages the layers and the runtime configuration of a completed stage into an
 * OCI image configuration and manifest. All the blobs the manifest references,
 * and the manifest itself, are stored in the content store.
 */
class ImageAssembler {
public:
    ImageAssembler(std::shared_ptr<const common::Config> config,
                   std::shared_ptr<const storage::ContentStore> contentStore);

    AssembledImage assemble(const build_engine::Stage& stage) const;

private:
    void storeLayers(const build_engine::Stage& stage) const;
    common::ImageConfiguration makeConfiguration(const build_engine::Stage& stage) const;
    common::Descriptor storeBlob(const std::string& blob, const std::string& mediaType) const;
    void printLog(const boost::format& message, libstratum::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "ImageAssembler";
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<const storage::ContentStore> contentStore;
};

}
}

#endif
