/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "image_manager/ImageAssembler.hpp"

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "build_engine/BuildEngine.hpp"


namespace stratum {
namespace image_manager {

    ImageAssembler::ImageAssembler(std::shared_ptr<const common::Config> config,
                                   std::shared_ptr<const storage::ContentStore> contentStore)
        : config{std::move(config)}
        , contentStore{std::move(contentStore)}
    {}

    AssembledImage ImageAssembler::assemble(const build_engine::Stage& stage) const {
        printLog(boost::format("Assembling image from stage %s") % stage.getDisplayName(),
                 libstratum::LogLevel::INFO);

        if(stage.getStatus() != build_engine::StageStatus::Completed) {
            auto message = boost::format("Cannot assemble image from stage %s in state %s")
                % stage.getDisplayName() % build_engine::stageStatusToString(stage.getStatus());
            STRATUM_THROW_ERROR(message.str());
        }

        storeLayers(stage);

        auto image = AssembledImage{};
        image.configuration = makeConfiguration(stage);
        image.manifest.config = storeBlob(image.configuration.serialize(), common::mediaType::OCI_CONFIG);
        for(const auto& layer : stage.getLayers()) {
            image.manifest.layers.push_back(layer.getDescriptor());
        }

        if(image.manifest.layers.size() != image.configuration.diffIDs.size()) {
            auto message = boost::format("Manifest lists %d layers but the configuration has %d diff_ids")
                % image.manifest.layers.size() % image.configuration.diffIDs.size();
            STRATUM_THROW_ERROR(message.str());
        }

        image.manifestDescriptor = storeBlob(image.manifest.serialize(), image.manifest.mediaType);

        printLog(boost::format("Assembled image %s (config %s, %d layers)")
                 % image.getDigest() % image.manifest.config.digest % image.manifest.layers.size(),
                 libstratum::LogLevel::INFO);
        return image;
    }

    /**
     * Makes sure the content store has every layer of the stage. Layers produced
     * by the engine are normally stored already, base layers come from the store.
     */
    void ImageAssembler::storeLayers(const build_engine::Stage& stage) const {
        for(const auto& layer : stage.getLayers()) {
            if(contentStore->has(layer.digest)) {
                printLog(boost::format("Layer %s already in content store") % layer.digest,
                         libstratum::LogLevel::DEBUG);
                continue;
            }
            if(!layer.blob) {
                auto message = boost::format("Layer %s (%s) is missing from the content store")
                    % layer.digest % layer.createdBy;
                STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
            }
            contentStore->putVerified(*layer.blob, layer.digest);
        }
    }

    common::ImageConfiguration ImageAssembler::makeConfiguration(const build_engine::Stage& stage) const {
        auto configuration = common::ImageConfiguration{};
        configuration.created = build_engine::BuildEngine::getCreatedTimestamp();
        configuration.architecture = config->platform.architecture;
        configuration.os = config->platform.os;
        configuration.config = stage.getMetadata();
        for(const auto& layer : stage.getLayers()) {
            configuration.diffIDs.push_back(layer.diffID);
        }
        configuration.history = stage.getHistory();
        return configuration;
    }

    common::Descriptor ImageAssembler::storeBlob(const std::string& blob, const std::string& mediaType) const {
        auto descriptor = common::Descriptor{};
        descriptor.mediaType = mediaType;
        descriptor.digest = contentStore->put(blob);
        descriptor.size = static_cast<int64_t>(blob.size());
        printLog(boost::format("Stored %s %s (%d bytes)") % mediaType % descriptor.digest % descriptor.size,
                 libstratum::LogLevel::DEBUG);
        return descriptor;
    }

    void ImageAssembler::printLog(const boost::format& message, libstratum::LogLevel logLevel,
                                  std::ostream& out, std::ostream& err) const {
        libstratum::Logger::getInstance().log(message, sysname, logLevel, out, err);
    }

}
}
