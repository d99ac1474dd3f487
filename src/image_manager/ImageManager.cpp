/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "image_manager/ImageManager.hpp"

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "dockerfile/Parser.hpp"
#include "build_engine/BuildContext.hpp"
#include "build_engine/BaseImageResolver.hpp"
#include "build_engine/BuildEngine.hpp"


namespace stratum {
namespace image_manager {

    ImageManager::ImageManager(std::shared_ptr<const common::Config> config)
        : ImageManager{config,
                       std::make_shared<registry::CppRestTransport>(config->registry.timeout),
                       std::make_shared<build_engine::SimulatedExecutor>()}
    {}

    ImageManager::ImageManager(std::shared_ptr<const common::Config> config,
                               std::shared_ptr<registry::HttpTransport> transport,
                               std::shared_ptr<build_engine::CommandExecutor> executor)
        : config(config)
        , contentStore{std::make_shared<storage::ContentStore>(config->directories.store)}
        , imageLayout{std::make_shared<storage::ImageLayout>(config->directories.store,
                                                             config->storeLock.timeout,
                                                             config->storeLock.warning)}
        , transport{std::move(transport)}
        , executor{std::move(executor)}
    {}

    /**
     * Build the Dockerfile and tag the resulting image in the local OCI layout
     */
    AssembledImage ImageManager::buildImage() {
        printLog(boost::format("Building image %s") % config->imageReference, libstratum::LogLevel::INFO);

        auto dockerfilePath = getDockerfilePath();
        printLog( boost::format("# image            : %s") % config->imageReference, libstratum::LogLevel::GENERAL);
        printLog( boost::format("# context          : %s") % config->commandBuild.contextDir, libstratum::LogLevel::GENERAL);
        printLog( boost::format("# dockerfile       : %s") % dockerfilePath, libstratum::LogLevel::GENERAL);
        printLog( boost::format("# output directory : %s") % config->directories.store, libstratum::LogLevel::GENERAL);
        printLog( boost::format("# executor         : %s") % executor->getName(), libstratum::LogLevel::GENERAL);

        // parse errors surface before any stage starts
        auto dockerfile = dockerfile::Parser{}.parseFile(dockerfilePath);

        auto context = std::make_shared<build_engine::BuildContext>(config->commandBuild.contextDir);
        auto baseImageResolver = std::make_shared<build_engine::BaseImageResolver>(contentStore, imageLayout);
        auto engine = build_engine::BuildEngine{config, contentStore, context, executor, baseImageResolver};
        auto target = engine.build(dockerfile);

        auto image = ImageAssembler{config, contentStore}.assemble(*target);
        imageLayout->tag(config->imageReference, image.manifestDescriptor);

        printLog(boost::format("Successfully built image %s: %s") % config->imageReference % image.getDigest(),
                 libstratum::LogLevel::INFO);
        return image;
    }

    /**
     * Push the image to its registry. An image missing from the local layout is
     * built first, provided a Dockerfile is available.
     */
    registry::PushReport ImageManager::pushImage() {
        printLog(boost::format("Pushing image %s") % config->imageReference, libstratum::LogLevel::INFO);

        auto manifest = imageLayout->find(config->imageReference);
        if(!manifest) {
            auto dockerfilePath = getDockerfilePath();
            if(!boost::filesystem::exists(dockerfilePath)) {
                auto message = boost::format("Image %s not found in %s and no Dockerfile to build it from")
                    % config->imageReference % config->directories.store;
                STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
            }
            printLog(boost::format("Image %s not found locally. Proceeding with build...") % config->imageReference,
                     libstratum::LogLevel::GENERAL);
            manifest = buildImage().manifestDescriptor;
        }

        auto client = registry::RegistryClient{config, contentStore, transport};
        return client.push(config->imageReference, *manifest);
    }

    /**
     * Pull the image from its registry and tag it in the local layout
     */
    common::Descriptor ImageManager::pullImage() {
        // Consistently with Docker, the tag is ignored when a digest is provided
        auto pullReference = config->imageReference.normalize();

        auto client = registry::RegistryClient{config, contentStore, transport};
        auto manifest = client.pull(pullReference);
        imageLayout->tag(pullReference, manifest);

        printLog(boost::format("Successfully pulled image %s: %s") % pullReference % manifest.digest,
                 libstratum::LogLevel::INFO);
        return manifest;
    }

    /**
     * Show the list of images tagged in the local layout
     */
    std::vector<StoredImage> ImageManager::listImages() const {
        auto images = std::vector<StoredImage>{};
        for(const auto& manifest : imageLayout->list()) {
            auto image = StoredImage{};
            image.reference = common::ImageReference::parse(storage::ImageLayout::getReferenceName(manifest));
            image.manifest = manifest;
            image.size = computeImageSize(manifest, image.id);
            images.push_back(image);
        }
        return images;
    }

    /**
     * Remove the tag from the local layout. The blobs stay in the content store.
     */
    void ImageManager::removeImage() {
        printLog(boost::format("removing image %s") % config->imageReference, libstratum::LogLevel::INFO);

        imageLayout->untag(config->imageReference);

        printLog(boost::format("removed image %s") % config->imageReference, libstratum::LogLevel::GENERAL);
        printLog("successfully removed image", libstratum::LogLevel::INFO);
    }

    boost::filesystem::path ImageManager::getDockerfilePath() const {
        if(!config->commandBuild.dockerfile.empty()) {
            return config->commandBuild.dockerfile;
        }
        return config->commandBuild.contextDir / "Dockerfile";
    }

    int64_t ImageManager::computeImageSize(const common::Descriptor& manifest, common::Digest& configDigest) const {
        auto size = manifest.size;
        if(!contentStore->has(manifest.digest)) {
            printLog(boost::format("Manifest %s is missing from the content store") % manifest.digest,
                     libstratum::LogLevel::WARN);
            return size;
        }
        auto imageManifest = common::ImageManifest::parse(contentStore->get(manifest.digest));
        configDigest = imageManifest.config.digest;
        size += imageManifest.config.size;
        for(const auto& layer : imageManifest.layers) {
            size += layer.size;
        }
        return size;
    }

    void ImageManager::printLog(const boost::format& message, libstratum::LogLevel LogLevel,
                                std::ostream& outStream, std::ostream& errStream) const {
        printLog(message.str(), LogLevel, outStream, errStream);
    }

    void ImageManager::printLog(const std::string& message, libstratum::LogLevel LogLevel,
                                std::ostream& outStream, std::ostream& errStream) const {
        libstratum::Logger::getInstance().log(message, sysname, LogLevel, outStream, errStream);
    }

} // namespace
} // namespace
