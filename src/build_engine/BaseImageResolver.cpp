/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/BaseImageResolver.hpp"

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "common/ImageReference.hpp"
#include "build_engine/archive.hpp"


namespace stratum {
namespace build_engine {

BaseImageResolver::BaseImageResolver(std::shared_ptr<const storage::ContentStore> contentStore,
                                     std::shared_ptr<const storage::ImageLayout> layout)
    : contentStore{std::move(contentStore)}
    , layout{std::move(layout)}
{}

std::shared_ptr<const ImageState> BaseImageResolver::resolve(const std::string& reference) const {
    auto imageReference = common::ImageReference::parse(reference);
    auto descriptor = layout->find(imageReference);
    if(!descriptor) {
        auto message = boost::format("Image '%s' not found in %s (pull it or build it first)")
            % imageReference % layout->getRootDirectory();
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }
    return load(*descriptor);
}

std::shared_ptr<const ImageState> BaseImageResolver::load(const common::Descriptor& manifestDescriptor) const {
    {
        std::lock_guard<std::mutex> lock{cacheMutex};
        auto it = cache.find(manifestDescriptor.digest);
        if(it != cache.cend()) {
            return it->second;
        }
    }

    printLog(boost::format("Loading image %s") % manifestDescriptor.digest, libstratum::LogLevel::INFO);

    auto image = std::make_shared<ImageState>();
    try {
        auto manifest = common::ImageManifest::parse(contentStore->get(manifestDescriptor.digest));
        auto configuration = common::ImageConfiguration::parse(contentStore->get(manifest.config.digest));

        if(configuration.diffIDs.size() != manifest.layers.size()) {
            auto message = boost::format("Image %s is inconsistent: %d layers in the manifest, %d diff_ids in the config")
                % manifestDescriptor.digest % manifest.layers.size() % configuration.diffIDs.size();
            STRATUM_THROW_ERROR(message.str());
        }

        // history entries of the layers, in the same order
        auto layerHistory = std::vector<std::string>{};
        for(const auto& entry : configuration.history) {
            if(!entry.emptyLayer) {
                layerHistory.push_back(entry.createdBy);
            }
        }

        for(std::size_t i = 0; i < manifest.layers.size(); ++i) {
            const auto& descriptor = manifest.layers[i];
            auto blob = contentStore->get(descriptor.digest);
            auto tar = common::mediaType::isGzipLayer(descriptor.mediaType) || archive::isGzip(blob)
                ? archive::gunzip(blob)
                : blob;

            auto diffID = common::Digest::compute(tar);
            if(diffID != configuration.diffIDs[i]) {
                auto message = boost::format("Layer %s of image %s has diff_id %s, the image config expects %s")
                    % descriptor.digest % manifestDescriptor.digest % diffID % configuration.diffIDs[i];
                STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
            }

            image->filesystem.apply(archive::readTar(tar));

            auto layer = Layer{};
            layer.digest = descriptor.digest;
            layer.diffID = diffID;
            layer.size = descriptor.size;
            layer.mediaType = descriptor.mediaType;
            layer.createdBy = i < layerHistory.size() ? layerHistory[i] : std::string{};
            image->layers.push_back(layer);
        }

        image->metadata = configuration.config;
        image->history = configuration.history;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to load image %s from %s") % manifestDescriptor.digest % contentStore->getRootDirectory();
        STRATUM_RETHROW_ERROR(e, message.str());
    }

    std::lock_guard<std::mutex> lock{cacheMutex};
    cache[manifestDescriptor.digest] = image;
    return image;
}

void BaseImageResolver::printLog(const boost::format& message, libstratum::LogLevel level) const {
    libstratum::Logger::getInstance().log(message, sysname, level);
}

}
}
