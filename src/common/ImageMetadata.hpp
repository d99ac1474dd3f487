/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_common_ImageMetadata_hpp
#define stratum_common_ImageMetadata_hpp

#include <string>
#include <vector>
#include <map>
#include <set>
#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "libstratum/CLIArguments.hpp"

namespace stratum {
namespace common {

/**
 * Runtime settings of an image, i.e. the "config" object of the OCI image
 * configuration. Dockerfile instructions such as ENV, CMD or EXPOSE only
 * change these settings, not the filesystem.
 */
class ImageMetadata {
public:
    ImageMetadata() = default;
    explicit ImageMetadata(const rapidjson::Value& metadata);

    boost::optional<std::string> user;
    std::set<std::string> exposedPorts;
    // "KEY=value" entries, kept in definition order as in Docker image configs
    std::vector<std::string> env;
    boost::optional<libstratum::CLIArguments> entry;
    boost::optional<libstratum::CLIArguments> cmd;
    std::set<std::string> volumes;
    boost::optional<boost::filesystem::path> workdir;
    /**
     * The OCI image configuration names arbitrary key-value metadata "Labels"
     * (a legacy of Docker image configs), while OCI bundles and manifests use "annotations".
     */
    std::map<std::string, std::string> labels;
    boost::optional<std::string> stopSignal;

    void setEnvironmentVariable(const std::string& key, const std::string& value);
    boost::optional<std::string> getEnvironmentVariable(const std::string& key) const;
    std::map<std::string, std::string> getEnvironment() const;

    rapidjson::Value toJSON(rapidjson::Document::AllocatorType& allocator) const;

private:
    void parseJSON(const rapidjson::Value& json);
};

bool operator==(const ImageMetadata&, const ImageMetadata&);

}
}

#endif
