/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include <boost/filesystem.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Utility.hpp"
#include "common/Config.hpp"
#include "test_utility/config.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace common {
namespace test {

TEST_GROUP(ConfigTestGroup) {
};

TEST(ConfigTestGroup, installedConfigurationFiles) {
    auto prefixDir = test_utility::filesystem::TemporaryDirectory{"stratum-test-prefix"};
    test_utility::config::installConfigFiles(prefixDir.getPath());

    auto config = Config{prefixDir.getPath()};
    CHECK_EQUAL(config.platform.os, std::string{"linux"});
    CHECK(!config.platform.architecture.empty());
    CHECK(config.commandBuild.parallelStages);
    CHECK_EQUAL(config.registry.maxRetries, 3);
    CHECK(config.registry.retryBackoff == std::chrono::milliseconds{500});
    CHECK(config.registry.timeout == std::chrono::seconds{30});
    CHECK_EQUAL(config.registry.chunkSize, 5242880);
    CHECK(config.storeLock.timeout == std::chrono::milliseconds{60000});
}

TEST(ConfigTestGroup, schemaViolation) {
    auto prefixDir = test_utility::filesystem::TemporaryDirectory{"stratum-test-prefix"};
    test_utility::config::installConfigFiles(prefixDir.getPath());
    test_utility::filesystem::createFile(prefixDir.getPath() / "etc/stratum.json",
        R"({"storeDir": "/tmp/store", "tempDir": "/tmp", "registry": {"maxRetries": -1}})");

    CHECK_THROWS(libstratum::Error, Config{prefixDir.getPath()});
}

TEST(ConfigTestGroup, directories) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;
    CHECK(boost::filesystem::is_directory(config.directories.store));
    CHECK(config.directories.temp == "/tmp");

    // store given on the command line has precedence
    config.directories.storeFromCLI = (configRAII.prefixDir / "cli-store").string();
    config.directories.initialize(config);
    CHECK(config.directories.store == configRAII.prefixDir / "cli-store");
    CHECK(boost::filesystem::is_directory(config.directories.store));

    // invalid temp dir
    config.json["tempDir"].SetString("/nonexistent/stratum/temp", config.json.GetAllocator());
    CHECK_THROWS(libstratum::Error, config.directories.initialize(config));
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
