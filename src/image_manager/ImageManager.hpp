/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_image_manager_ImageManager_hpp
#define stratum_image_manager_ImageManager_hpp

#include <memory>
#include <vector>
#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/Config.hpp"
#include "storage/ContentStore.hpp"
#include "storage/ImageLayout.hpp"
#include "build_engine/CommandExecutor.hpp"
#include "registry/HttpTransport.hpp"
#include "registry/RegistryClient.hpp"
#include "image_manager/ImageAssembler.hpp"
#include "image_manager/StoredImage.hpp"


namespace stratum {
namespace image_manager {

/**
 * Entry point of the image operations offered by the command line: build an
 * image into the local OCI layout, push it to or pull it from a registry, list
 * and remove tags. The image reference and the directories come from the config.
 */
class ImageManager {
public:
    explicit ImageManager(std::shared_ptr<const common::Config> config);
    ImageManager(std::shared_ptr<const common::Config> config,
                 std::shared_ptr<registry::HttpTransport> transport,
                 std::shared_ptr<build_engine::CommandExecutor> executor);

    AssembledImage buildImage();
    registry::PushReport pushImage();
    common::Descriptor pullImage();
    std::vector<StoredImage> listImages() const;
    void removeImage();

    std::shared_ptr<const storage::ContentStore> getContentStore() const { return contentStore; }

private:
    boost::filesystem::path getDockerfilePath() const;
    int64_t computeImageSize(const common::Descriptor& manifest, common::Digest& configDigest) const;
    void printLog(const boost::format& message, libstratum::LogLevel LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void printLog(const std::string& message, libstratum::LogLevel LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<const storage::ContentStore> contentStore;
    std::shared_ptr<const storage::ImageLayout> imageLayout;
    std::shared_ptr<registry::HttpTransport> transport;
    std::shared_ptr<build_engine::CommandExecutor> executor;
    const std::string sysname = "ImageManager";  // system name for logger
};

} // namespace
} // namespace

#endif
