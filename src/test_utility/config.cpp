/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "test_utility/config.hpp"

#include <utility>

#include "libstratum/Utility.hpp"

namespace rj = rapidjson;
using namespace stratum;

namespace test_utility {
namespace config {

ConfigRAII::ConfigRAII(ConfigRAII&& other)
    : config{std::move(other.config)}
    , prefixDir{std::move(other.prefixDir)}
{
    other.prefixDir.clear();
}

ConfigRAII::~ConfigRAII() {
    if(!prefixDir.empty()) {
        boost::system::error_code ec;
        boost::filesystem::remove_all(prefixDir, ec);
    }
}

static void populateJSON(rj::Document& document, const boost::filesystem::path& prefixDir) {
    auto& allocator = document.GetAllocator();
    auto storeDir = prefixDir / "store";

    document.AddMember( "storeDir",
                        rj::Value{storeDir.c_str(), allocator},
                        allocator);
    document.AddMember( "tempDir",
                        rj::Value{"/tmp", allocator},
                        allocator);
    document.AddMember( "os",
                        rj::Value{"linux", allocator},
                        allocator);
    document.AddMember( "architecture",
                        rj::Value{"amd64", allocator},
                        allocator);
}

void installConfigFiles(const boost::filesystem::path& prefixDir) {
    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
    libstratum::filesystem::createFoldersIfNecessary(prefixDir / "etc");
    boost::filesystem::copy_file(repoRootDir / "etc/stratum.json", prefixDir / "etc/stratum.json",
                                 boost::filesystem::copy_options::overwrite_existing);
    boost::filesystem::copy_file(repoRootDir / "etc/stratum.schema.json", prefixDir / "etc/stratum.schema.json",
                                 boost::filesystem::copy_options::overwrite_existing);
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.prefixDir = libstratum::filesystem::makeUniquePathWithRandomSuffix(
        boost::filesystem::absolute("/tmp/stratum-test-prefix-dir"));
    libstratum::filesystem::createFoldersIfNecessary(raii.prefixDir);

    raii.config = std::make_shared<common::Config>();
    populateJSON(raii.config->json, raii.prefixDir);

    raii.config->platform.os = "linux";
    raii.config->platform.architecture = "amd64";

    // fast retries, small chunks: tests exercise the protocol, not the timing
    raii.config->registry.maxRetries = 2;
    raii.config->registry.retryBackoff = std::chrono::milliseconds{1};
    raii.config->registry.chunkSize = 1024 * 1024;

    raii.config->commandBuild.contextDir = raii.prefixDir / "context";
    libstratum::filesystem::createFoldersIfNecessary(raii.config->commandBuild.contextDir);

    raii.config->directories.initialize(*raii.config);
    raii.config->imageReference = common::ImageReference::parse("localhost:5000/test/app:1.0");

    return raii;
}

}
}
