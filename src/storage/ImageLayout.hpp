/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_storage_ImageLayout_hpp
#define stratum_storage_ImageLayout_hpp

#include <string>
#include <vector>
#include <chrono>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libstratum/LogLevel.hpp"
#include "common/ImageSpec.hpp"
#include "common/ImageReference.hpp"


namespace stratum {
namespace storage {

/**
 * The tag side of an OCI image layout: the "oci-layout" marker and the "index.json"
 * listing one manifest descriptor per tag. The tag is stored in the
 * "org.opencontainers.image.ref.name" annotation of the descriptor.
 *
 * The index is rewritten atomically under an exclusive flock(2), so that concurrent
 * stratum processes sharing an output directory never lose each other's updates.
 */
class ImageLayout {
public:
    static const std::string REF_NAME_ANNOTATION;

public:
    ImageLayout(const boost::filesystem::path& rootDirectory,
                std::chrono::milliseconds lockTimeout = std::chrono::milliseconds{60000},
                std::chrono::milliseconds lockWarning = std::chrono::milliseconds{10000});

    void tag(const common::ImageReference& reference, const common::Descriptor& manifest) const;
    boost::optional<common::Descriptor> find(const common::ImageReference& reference) const;
    std::vector<common::Descriptor> list() const;
    void untag(const common::ImageReference& reference) const;
    const boost::filesystem::path& getRootDirectory() const { return rootDirectory; }

    static std::string getReferenceName(const common::Descriptor& descriptor);

private:
    void initialize() const;
    rapidjson::Document readIndex() const;
    void writeIndex(const rapidjson::Document& index) const;
    void printLog(const boost::format& message, libstratum::LogLevel logLevel,
                  std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

private:
    const std::string sysname = "ImageLayout";
    boost::filesystem::path rootDirectory;
    boost::filesystem::path indexFile;
    boost::filesystem::path lockFile;
    std::chrono::milliseconds lockTimeout;
    std::chrono::milliseconds lockWarning;
};

}
}

#endif
