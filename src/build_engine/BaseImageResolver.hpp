/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_BaseImageResolver_hpp
#define stratum_build_engine_BaseImageResolver_hpp

#include <string>
#include <map>
#include <memory>
#include <mutex>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/ImageSpec.hpp"
#include "storage/ContentStore.hpp"
#include "storage/ImageLayout.hpp"
#include "build_engine/Stage.hpp"


namespace stratum {
namespace build_engine {

/**
 * Loads images of the local OCI layout (built or pulled earlier) as base images:
 * the filesystem is rebuilt by applying the layers in order, layers, history and
 * runtime configuration are taken over from the image. Loaded images are cached,
 * so stages sharing a base load it once.
 */
class BaseImageResolver {
public:
    BaseImageResolver(std::shared_ptr<const storage::ContentStore> contentStore,
                      std::shared_ptr<const storage::ImageLayout> layout);

    std::shared_ptr<const ImageState> resolve(const std::string& reference) const;
    std::shared_ptr<const ImageState> load(const common::Descriptor& manifestDescriptor) const;

private:
    void printLog(const boost::format& message, libstratum::LogLevel level) const;

private:
    const std::string sysname = "BaseImageResolver";
    std::shared_ptr<const storage::ContentStore> contentStore;
    std::shared_ptr<const storage::ImageLayout> layout;
    mutable std::mutex cacheMutex;
    mutable std::map<common::Digest, std::shared_ptr<const ImageState>> cache;
};

}
}

#endif
