/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_utility_filesystem_hpp
#define libstratum_utility_filesystem_hpp

#include <string>
#include <vector>
#include <sys/types.h>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem manipulation and investigation
 */

namespace libstratum {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
size_t getFileSize(const boost::filesystem::path& filename);
mode_t getPermissions(const boost::filesystem::path& path);
std::string readFile(const boost::filesystem::path& path);
void writeFile(const std::string& content, const boost::filesystem::path& filename);
void writeFileAtomically(const std::string& content, const boost::filesystem::path& filename);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);
boost::filesystem::path getSymlinkTarget(const boost::filesystem::path& path);
boost::filesystem::path appendPathsWithinRoot(  const boost::filesystem::path& root,
                                                const boost::filesystem::path& path0,
                                                const boost::filesystem::path& path1);
boost::filesystem::path realpathWithinRoot(const boost::filesystem::path& root, const boost::filesystem::path& path);
bool isSymlink(const boost::filesystem::path& path);

}}

#endif
