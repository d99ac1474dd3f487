/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_test_utility_config_hpp
#define stratum_test_utility_config_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * Config whose store directory is a fresh temporary directory, removed on destruction.
 */
struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(ConfigRAII&&);
    ~ConfigRAII();
    std::shared_ptr<stratum::common::Config> config;
    boost::filesystem::path prefixDir;
};

ConfigRAII makeConfig();

// copies etc/stratum.json and etc/stratum.schema.json of the source tree into <prefixDir>/etc
void installConfigFiles(const boost::filesystem::path& prefixDir);

}
}

#endif
