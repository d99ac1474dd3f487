/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


/**
 * @brief Filesystem utility functions to be used in the tests.
 */

#include "test_utility/filesystem.hpp"

#include <sys/stat.h>

#include "libstratum/Utility.hpp"


namespace test_utility {
namespace filesystem {

void createFile(const boost::filesystem::path& path, const std::string& content, mode_t mode) {
    libstratum::filesystem::createFoldersIfNecessary(path.parent_path());
    libstratum::filesystem::writeFile(content, path);
    if(chmod(path.c_str(), mode) != 0) {
        auto message = boost::format("Failed to chmod %s") % path;
        STRATUM_THROW_ERROR(message.str());
    }
}

TemporaryDirectory::TemporaryDirectory(const std::string& name)
    : path{libstratum::filesystem::makeUniquePathWithRandomSuffix(boost::filesystem::path{"/tmp"} / name)}
{
    libstratum::filesystem::createFoldersIfNecessary(path);
}

TemporaryDirectory::~TemporaryDirectory() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(path, ec);
}

}
}
