/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/ImageSpec.hpp"

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/json.hpp"

namespace stratum {
namespace common {

namespace mediaType {

const std::string OCI_MANIFEST{"application/vnd.oci.image.manifest.v1+json"};
const std::string OCI_INDEX{"application/vnd.oci.image.index.v1+json"};
const std::string OCI_CONFIG{"application/vnd.oci.image.config.v1+json"};
const std::string OCI_LAYER_TAR{"application/vnd.oci.image.layer.v1.tar"};
const std::string OCI_LAYER_TAR_GZIP{"application/vnd.oci.image.layer.v1.tar+gzip"};
const std::string DOCKER_MANIFEST{"application/vnd.docker.distribution.manifest.v2+json"};
const std::string DOCKER_MANIFEST_LIST{"application/vnd.docker.distribution.manifest.list.v2+json"};
const std::string DOCKER_CONFIG{"application/vnd.docker.container.image.v1+json"};
const std::string DOCKER_LAYER_TAR_GZIP{"application/vnd.docker.image.rootfs.diff.tar.gzip"};

bool isManifest(const std::string& mediaType) {
    return mediaType == OCI_MANIFEST || mediaType == DOCKER_MANIFEST;
}

bool isIndex(const std::string& mediaType) {
    return mediaType == OCI_INDEX || mediaType == DOCKER_MANIFEST_LIST;
}

bool isGzipLayer(const std::string& mediaType) {
    return mediaType == OCI_LAYER_TAR_GZIP || mediaType == DOCKER_LAYER_TAR_GZIP;
}

}

namespace json = libstratum::json;

static rapidjson::Value makeAnnotations(const std::map<std::string, std::string>& annotations,
                                        rapidjson::Document::AllocatorType& allocator) {
    auto object = rapidjson::Value{rapidjson::kObjectType};
    for(const auto& annotation : annotations) {
        object.AddMember(json::makeString(annotation.first, allocator), json::makeString(annotation.second, allocator), allocator);
    }
    return object;
}

static std::map<std::string, std::string> parseAnnotations(const rapidjson::Value& object) {
    auto annotations = std::map<std::string, std::string>{};
    if(object.HasMember("annotations") && object["annotations"].IsObject()) {
        for(const auto& annotation : object["annotations"].GetObject()) {
            annotations[annotation.name.GetString()] = annotation.value.GetString();
        }
    }
    return annotations;
}

rapidjson::Value Descriptor::toJSON(rapidjson::Document::AllocatorType& allocator) const {
    auto object = rapidjson::Value{rapidjson::kObjectType};
    object.AddMember("mediaType", json::makeString(mediaType, allocator), allocator);
    object.AddMember("digest", json::makeString(digest.string(), allocator), allocator);
    object.AddMember("size", rapidjson::Value{size}, allocator);
    if(!annotations.empty()) {
        object.AddMember("annotations", makeAnnotations(annotations, allocator), allocator);
    }
    return object;
}

Descriptor Descriptor::fromJSON(const rapidjson::Value& object) {
    auto descriptor = Descriptor{};
    try {
        descriptor.mediaType = object.HasMember("mediaType") ? json::getString(object, "mediaType") : std::string{};
        descriptor.digest = Digest::parse(json::getString(object, "digest"));
        descriptor.size = json::getInt64(object, "size");
        descriptor.annotations = parseAnnotations(object);
    }
    catch(const std::exception& e) {
        STRATUM_RETHROW_ERROR(e, "Failed to parse OCI descriptor");
    }
    return descriptor;
}

bool operator==(const Descriptor& lhs, const Descriptor& rhs) {
    return lhs.mediaType == rhs.mediaType
        && lhs.digest == rhs.digest
        && lhs.size == rhs.size
        && lhs.annotations == rhs.annotations;
}

std::string ImageConfiguration::serialize() const {
    auto document = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = document.GetAllocator();

    document.AddMember("created", json::makeString(created, allocator), allocator);
    document.AddMember("architecture", json::makeString(architecture, allocator), allocator);
    document.AddMember("os", json::makeString(os, allocator), allocator);
    document.AddMember("config", config.toJSON(allocator), allocator);

    auto rootfs = rapidjson::Value{rapidjson::kObjectType};
    rootfs.AddMember("type", "layers", allocator);
    auto diffIDsArray = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& diffID : diffIDs) {
        diffIDsArray.PushBack(json::makeString(diffID.string(), allocator), allocator);
    }
    rootfs.AddMember("diff_ids", diffIDsArray, allocator);
    document.AddMember("rootfs", rootfs, allocator);

    auto historyArray = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& entry : history) {
        auto object = rapidjson::Value{rapidjson::kObjectType};
        object.AddMember("created", json::makeString(entry.created, allocator), allocator);
        object.AddMember("created_by", json::makeString(entry.createdBy, allocator), allocator);
        if(!entry.comment.empty()) {
            object.AddMember("comment", json::makeString(entry.comment, allocator), allocator);
        }
        if(entry.emptyLayer) {
            object.AddMember("empty_layer", true, allocator);
        }
        historyArray.PushBack(object, allocator);
    }
    document.AddMember("history", historyArray, allocator);

    return json::serialize(document);
}

ImageConfiguration ImageConfiguration::parse(const std::string& string) {
    auto configuration = ImageConfiguration{};
    try {
        auto document = json::parse(string);
        configuration.created = document.HasMember("created") ? json::getString(document, "created") : std::string{};
        configuration.architecture = json::getString(document, "architecture");
        configuration.os = json::getString(document, "os");
        if(document.HasMember("config")) {
            configuration.config = ImageMetadata{document["config"]};
        }

        const auto& rootfs = json::getMember(document, "rootfs");
        for(const auto& diffID : json::getMember(rootfs, "diff_ids").GetArray()) {
            configuration.diffIDs.push_back(Digest::parse(diffID.GetString()));
        }

        if(document.HasMember("history") && document["history"].IsArray()) {
            for(const auto& object : document["history"].GetArray()) {
                auto entry = HistoryEntry{};
                entry.created = object.HasMember("created") ? json::getString(object, "created") : std::string{};
                entry.createdBy = object.HasMember("created_by") ? json::getString(object, "created_by") : std::string{};
                entry.comment = object.HasMember("comment") ? json::getString(object, "comment") : std::string{};
                entry.emptyLayer = object.HasMember("empty_layer") && object["empty_layer"].IsBool() && object["empty_layer"].GetBool();
                configuration.history.push_back(entry);
            }
        }
    }
    catch(const std::exception& e) {
        STRATUM_RETHROW_ERROR(e, "Failed to parse OCI image configuration");
    }
    return configuration;
}

std::string ImageManifest::serialize() const {
    auto document = rapidjson::Document{rapidjson::kObjectType};
    auto& allocator = document.GetAllocator();

    document.AddMember("schemaVersion", 2, allocator);
    document.AddMember("mediaType", json::makeString(mediaType, allocator), allocator);
    document.AddMember("config", config.toJSON(allocator), allocator);
    auto layersArray = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& layer : layers) {
        layersArray.PushBack(layer.toJSON(allocator), allocator);
    }
    document.AddMember("layers", layersArray, allocator);
    if(!annotations.empty()) {
        document.AddMember("annotations", makeAnnotations(annotations, allocator), allocator);
    }

    return json::serialize(document);
}

ImageManifest ImageManifest::parse(const std::string& string) {
    auto manifest = ImageManifest{};
    try {
        auto document = json::parse(string);
        if(document.HasMember("schemaVersion") && document["schemaVersion"].IsInt() && document["schemaVersion"].GetInt() != 2) {
            auto message = boost::format("Unsupported manifest schema version %d") % document["schemaVersion"].GetInt();
            STRATUM_THROW_ERROR(message.str());
        }
        if(document.HasMember("mediaType")) {
            manifest.mediaType = json::getString(document, "mediaType");
        }
        if(mediaType::isIndex(manifest.mediaType) || document.HasMember("manifests")) {
            STRATUM_THROW_ERROR("Image indexes (multi-platform manifest lists) are not supported");
        }
        manifest.config = Descriptor::fromJSON(json::getMember(document, "config"));
        for(const auto& layer : json::getMember(document, "layers").GetArray()) {
            manifest.layers.push_back(Descriptor::fromJSON(layer));
        }
        manifest.annotations = parseAnnotations(document);
    }
    catch(const std::exception& e) {
        STRATUM_RETHROW_ERROR(e, "Failed to parse OCI image manifest");
    }
    return manifest;
}

}
}
