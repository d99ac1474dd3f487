/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_common_ImageSpec_hpp
#define stratum_common_ImageSpec_hpp

#include <string>
#include <vector>
#include <map>
#include <cstdint>

#include <rapidjson/document.h>

#include "common/Digest.hpp"
#include "common/ImageMetadata.hpp"

/**
 * Data types of the OCI image specification produced and consumed by Stratum:
 * descriptors, image configuration and image manifest.
 */

namespace stratum {
namespace common {

namespace mediaType {

extern const std::string OCI_MANIFEST;
extern const std::string OCI_INDEX;
extern const std::string OCI_CONFIG;
extern const std::string OCI_LAYER_TAR;
extern const std::string OCI_LAYER_TAR_GZIP;
extern const std::string DOCKER_MANIFEST;
extern const std::string DOCKER_MANIFEST_LIST;
extern const std::string DOCKER_CONFIG;
extern const std::string DOCKER_LAYER_TAR_GZIP;

bool isManifest(const std::string& mediaType);
bool isIndex(const std::string& mediaType);
bool isGzipLayer(const std::string& mediaType);

}

struct Descriptor {
    std::string mediaType;
    Digest digest;
    int64_t size = 0;
    std::map<std::string, std::string> annotations;

    rapidjson::Value toJSON(rapidjson::Document::AllocatorType& allocator) const;
    static Descriptor fromJSON(const rapidjson::Value& json);
};

bool operator==(const Descriptor&, const Descriptor&);

struct HistoryEntry {
    std::string created;
    std::string createdBy;
    std::string comment;
    bool emptyLayer = false;
};

struct ImageConfiguration {
    std::string created;
    std::string architecture;
    std::string os;
    ImageMetadata config;
    std::vector<Digest> diffIDs;
    std::vector<HistoryEntry> history;

    std::string serialize() const;
    static ImageConfiguration parse(const std::string& json);
};

struct ImageManifest {
    std::string mediaType = mediaType::OCI_MANIFEST;
    Descriptor config;
    std::vector<Descriptor> layers;
    std::map<std::string, std::string> annotations;

    std::string serialize() const;
    static ImageManifest parse(const std::string& json);
};

}
}

#endif
