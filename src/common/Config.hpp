/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_common_Config_hpp
#define stratum_common_Config_hpp

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <cstddef>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "common/ImageReference.hpp"


namespace stratum {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        explicit Config(const boost::filesystem::path& installationPrefixDir);

        static boost::filesystem::path getDefaultPrefixDir();

        struct BuildTime {
            BuildTime();
            std::string version;
            boost::filesystem::path prefixDir;
        };

        struct Directories {
            void initialize(const common::Config& config);
            boost::filesystem::path store;
            std::string storeFromCLI;
            boost::filesystem::path temp;
        };

        struct Platform {
            std::string os;
            std::string architecture;
        };

        struct Registry {
            int maxRetries = 3;
            std::chrono::milliseconds retryBackoff{500};
            std::chrono::seconds timeout{30};
            std::size_t chunkSize = 5 * 1024 * 1024;
            std::vector<std::string> insecureRegistries;
        };

        struct StoreLock {
            std::chrono::milliseconds timeout{60000};
            std::chrono::milliseconds warning{10000};
        };

        struct CommandBuild {
            boost::filesystem::path contextDir = ".";
            boost::filesystem::path dockerfile;
            boost::optional<std::string> target;
            std::map<std::string, std::string> buildArgs;
            bool parallelStages = true;
        };

        BuildTime buildTime;
        Directories directories;
        rapidjson::Document json{ rapidjson::kObjectType };
        Platform platform;
        Registry registry;
        StoreLock storeLock;
        CommandBuild commandBuild;
        common::ImageReference imageReference;

    private:
        void initializeSettings();
};

}
}

#endif
