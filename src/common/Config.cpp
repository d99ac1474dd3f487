/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/filesystem.hpp"
#include "libstratum/utility/json.hpp"
#include "libstratum/utility/logging.hpp"
#include "libstratum/utility/process.hpp"

#ifndef STRATUM_VERSION
#define STRATUM_VERSION "unknown"
#endif

#ifndef STRATUM_INSTALL_PREFIX
#define STRATUM_INSTALL_PREFIX "/usr/local"
#endif


namespace stratum {
namespace common {

Config::BuildTime::BuildTime()
    : version{STRATUM_VERSION}
    , prefixDir{STRATUM_INSTALL_PREFIX}
{}

/**
 * The installation prefix where etc/stratum.json is looked up. The
 * STRATUM_CONFIG_PREFIX environment variable overrides the compiled-in one.
 */
boost::filesystem::path Config::getDefaultPrefixDir() {
    auto prefix = libstratum::process::getEnvironmentVariable("STRATUM_CONFIG_PREFIX");
    if(prefix) {
        return *prefix;
    }
    return BuildTime{}.prefixDir;
}

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/stratum.json", installationPrefixDir / "etc/stratum.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libstratum::json::readAndValidate(configFilename, configSchemaFilename) }
{
    initializeSettings();
}

void Config::initializeSettings() {
    platform.os = json.HasMember("os") ? json["os"].GetString() : "linux";
    platform.architecture = json.HasMember("architecture")
        ? std::string{json["architecture"].GetString()}
        : libstratum::process::getMachineArchitecture();

    if(json.HasMember("parallelStages")) {
        commandBuild.parallelStages = json["parallelStages"].GetBool();
    }
    if(json.HasMember("storeLockTimeoutMs")) {
        storeLock.timeout = std::chrono::milliseconds{json["storeLockTimeoutMs"].GetInt64()};
    }
    if(json.HasMember("storeLockWarningMs")) {
        storeLock.warning = std::chrono::milliseconds{json["storeLockWarningMs"].GetInt64()};
    }

    if(json.HasMember("registry")) {
        const auto& settings = json["registry"];
        if(settings.HasMember("maxRetries")) {
            registry.maxRetries = settings["maxRetries"].GetInt();
        }
        if(settings.HasMember("retryBackoffMs")) {
            registry.retryBackoff = std::chrono::milliseconds{settings["retryBackoffMs"].GetInt64()};
        }
        if(settings.HasMember("timeoutSeconds")) {
            registry.timeout = std::chrono::seconds{settings["timeoutSeconds"].GetInt64()};
        }
        if(settings.HasMember("chunkSizeBytes")) {
            registry.chunkSize = static_cast<std::size_t>(settings["chunkSizeBytes"].GetUint64());
        }
        if(settings.HasMember("insecureRegistries")) {
            for(const auto& host : settings["insecureRegistries"].GetArray()) {
                registry.insecureRegistries.push_back(host.GetString());
            }
        }
    }
}

void Config::Directories::initialize(const common::Config& config) {
    libstratum::logMessage(boost::format("initializing config's directories"), libstratum::LogLevel::DEBUG);

    bool storeDirWasSpecifiedThroughCLI = !storeFromCLI.empty();
    if(storeDirWasSpecifiedThroughCLI) {
        store = boost::filesystem::absolute(storeFromCLI);
    }
    else {
        store = boost::filesystem::absolute(config.json["storeDir"].GetString());
    }
    libstratum::filesystem::createFoldersIfNecessary(store);

    temp = boost::filesystem::path(config.json["tempDir"].GetString());
    if (!boost::filesystem::is_directory(temp)) {
        auto message = boost::format("Invalid temporary directory %s") % temp;
        libstratum::logMessage(message, libstratum::LogLevel::GENERAL, std::cerr);
        STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
    }
}

}} // namespaces
