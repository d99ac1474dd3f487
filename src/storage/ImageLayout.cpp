/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "storage/ImageLayout.hpp"

#include "libstratum/Error.hpp"
#include "libstratum/Flock.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/filesystem.hpp"
#include "libstratum/utility/json.hpp"


namespace rj = rapidjson;

namespace stratum {
namespace storage {

    const std::string ImageLayout::REF_NAME_ANNOTATION{"org.opencontainers.image.ref.name"};

    ImageLayout::ImageLayout(const boost::filesystem::path& rootDirectory,
                             std::chrono::milliseconds lockTimeout,
                             std::chrono::milliseconds lockWarning)
        : rootDirectory{rootDirectory}
        , indexFile{rootDirectory / "index.json"}
        , lockFile{rootDirectory / ".index.lock"}
        , lockTimeout{lockTimeout}
        , lockWarning{lockWarning}
    {
        initialize();
    }

    void ImageLayout::initialize() const {
        try {
            libstratum::filesystem::createFoldersIfNecessary(rootDirectory / "blobs");

            libstratum::Flock lock{lockFile, libstratum::Flock::Type::writeLock, lockTimeout, lockWarning};

            auto layoutMarker = rootDirectory / "oci-layout";
            if(!boost::filesystem::exists(layoutMarker)) {
                libstratum::filesystem::writeFileAtomically("{\"imageLayoutVersion\":\"1.0.0\"}", layoutMarker);
            }

            if(!boost::filesystem::exists(indexFile)) {
                auto index = rj::Document{rj::kObjectType};
                index.AddMember("schemaVersion", 2, index.GetAllocator());
                index.AddMember("mediaType",
                                libstratum::json::makeString(common::mediaType::OCI_INDEX, index.GetAllocator()),
                                index.GetAllocator());
                index.AddMember("manifests", rj::kArrayType, index.GetAllocator());
                writeIndex(index);
                printLog(boost::format("Initialized OCI image layout in %s") % rootDirectory, libstratum::LogLevel::INFO);
            }
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to initialize OCI image layout in %s") % rootDirectory;
            STRATUM_RETHROW_ERROR(e, message.str());
        }
    }

    /**
     * Points the tag at the manifest, replacing any previous manifest with the same tag.
     */
    void ImageLayout::tag(const common::ImageReference& reference, const common::Descriptor& manifest) const {
        auto name = reference.string();
        printLog(boost::format("Tagging manifest %s as %s") % manifest.digest % name, libstratum::LogLevel::INFO);

        try {
            libstratum::Flock lock{lockFile, libstratum::Flock::Type::writeLock, lockTimeout, lockWarning};
            auto index = readIndex();
            auto& manifests = index["manifests"];

            for(auto it = manifests.Begin(); it != manifests.End(); ) {
                if(getReferenceName(common::Descriptor::fromJSON(*it)) == name) {
                    it = manifests.Erase(it);
                }
                else {
                    ++it;
                }
            }

            auto descriptor = manifest;
            descriptor.annotations[REF_NAME_ANNOTATION] = name;
            manifests.PushBack(descriptor.toJSON(index.GetAllocator()), index.GetAllocator());

            writeIndex(index);
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to tag image %s in %s") % name % indexFile;
            STRATUM_RETHROW_ERROR(e, message.str());
        }
    }

    boost::optional<common::Descriptor> ImageLayout::find(const common::ImageReference& reference) const {
        auto name = reference.string();
        printLog(boost::format("Looking for reference '%s' in %s") % name % indexFile, libstratum::LogLevel::DEBUG);

        for(const auto& descriptor : list()) {
            if(getReferenceName(descriptor) == name) {
                return descriptor;
            }
        }
        return boost::none;
    }

    std::vector<common::Descriptor> ImageLayout::list() const {
        auto descriptors = std::vector<common::Descriptor>{};
        try {
            libstratum::Flock lock{lockFile, libstratum::Flock::Type::readLock, lockTimeout, lockWarning};
            auto index = readIndex();
            for(const auto& manifest : index["manifests"].GetArray()) {
                descriptors.push_back(common::Descriptor::fromJSON(manifest));
            }
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to list images in %s") % indexFile;
            STRATUM_RETHROW_ERROR(e, message.str());
        }
        return descriptors;
    }

    /**
     * Removes the tag from the index. The blobs stay in the content store.
     */
    void ImageLayout::untag(const common::ImageReference& reference) const {
        auto name = reference.string();
        printLog(boost::format("Removing tag %s") % name, libstratum::LogLevel::INFO);

        libstratum::Flock lock{lockFile, libstratum::Flock::Type::writeLock, lockTimeout, lockWarning};
        auto index = readIndex();
        auto& manifests = index["manifests"];

        bool found = false;
        for(auto it = manifests.Begin(); it != manifests.End(); ) {
            if(getReferenceName(common::Descriptor::fromJSON(*it)) == name) {
                it = manifests.Erase(it);
                found = true;
            }
            else {
                ++it;
            }
        }

        if(!found) {
            auto message = boost::format("Cannot find image '%s'") % name;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
        }

        writeIndex(index);
    }

    std::string ImageLayout::getReferenceName(const common::Descriptor& descriptor) {
        auto it = descriptor.annotations.find(REF_NAME_ANNOTATION);
        return it != descriptor.annotations.cend() ? it->second : std::string{};
    }

    rapidjson::Document ImageLayout::readIndex() const {
        auto index = libstratum::json::read(indexFile);
        if(!index.IsObject() || !index.HasMember("manifests") || !index["manifests"].IsArray()) {
            auto message = boost::format("Malformed OCI image index %s: missing 'manifests' array") % indexFile;
            STRATUM_THROW_ERROR(message.str());
        }
        return index;
    }

    void ImageLayout::writeIndex(const rapidjson::Document& index) const {
        libstratum::filesystem::writeFileAtomically(libstratum::json::serialize(index), indexFile);
    }

    void ImageLayout::printLog(const boost::format& message, libstratum::LogLevel logLevel,
                               std::ostream& out, std::ostream& err) const {
        libstratum::Logger::getInstance().log(message, sysname, logLevel, out, err);
    }

} // namespace
} // namespace
