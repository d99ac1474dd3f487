/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_BuildContext_hpp
#define stratum_build_engine_BuildContext_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "build_engine/FilesystemState.hpp"


namespace stratum {
namespace build_engine {

/**
 * An entry found under a COPY/ADD source, with its path relative to the source
 * (empty for the source itself).
 */
struct SourceItem {
    std::string relativePath;
    FileEntry entry;
};

/**
 * Read access to the build context directory for COPY and ADD.
 *
 * Paths are interpreted relative to the context root. A path that climbs out of the
 * context with ".." is an error, symlinks are resolved as if the context was the root
 * directory, so they cannot escape it either.
 */
class BuildContext {
public:
    explicit BuildContext(const boost::filesystem::path& directory);

    std::string read(const std::string& path) const;
    std::vector<std::string> expandSources(const std::string& pattern) const;
    std::vector<SourceItem> collect(const std::string& path) const;
    bool isDirectory(const std::string& path) const;
    const boost::filesystem::path& getDirectory() const { return directory; }

private:
    std::string checkPath(const std::string& path) const;
    boost::filesystem::path resolve(const std::string& path) const;
    FileEntry makeEntry(const boost::filesystem::path& hostPath) const;

private:
    boost::filesystem::path directory;
};

}
}

#endif
