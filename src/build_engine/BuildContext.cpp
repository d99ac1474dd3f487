/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/BuildContext.hpp"

#include <algorithm>
#include <fnmatch.h>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/filesystem.hpp"


namespace stratum {
namespace build_engine {

BuildContext::BuildContext(const boost::filesystem::path& directory) {
    if(!boost::filesystem::is_directory(directory)) {
        auto message = boost::format("Build context %s is not a directory") % directory;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }
    this->directory = boost::filesystem::canonical(directory);
}

std::string BuildContext::read(const std::string& path) const {
    auto hostPath = resolve(path);
    if(!boost::filesystem::is_regular_file(hostPath)) {
        auto message = boost::format("Cannot read '%s' from the build context: not a regular file") % path;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ExecutionError, message.str());
    }
    return libstratum::filesystem::readFile(hostPath);
}

/**
 * Expands the wildcards ('*', '?', '[...]') in the last component of a source path.
 * Returns the matching context paths in lexical order.
 */
std::vector<std::string> BuildContext::expandSources(const std::string& pattern) const {
    auto normalized = checkPath(pattern);
    auto baseName = getBaseName(normalized);
    if(baseName.find_first_of("*?[") == std::string::npos) {
        resolve(normalized);
        return {normalized};
    }

    auto parent = getParentPath(normalized);
    auto hostParent = resolve(parent);
    auto matches = std::vector<std::string>{};
    for(auto it = boost::filesystem::directory_iterator{hostParent}; it != boost::filesystem::directory_iterator{}; ++it) {
        auto name = it->path().filename().string();
        if(fnmatch(baseName.c_str(), name.c_str(), FNM_PERIOD) == 0) {
            matches.push_back((parent == "/" ? std::string{} : parent) + "/" + name);
        }
    }

    if(matches.empty()) {
        auto message = boost::format("No source files were specified: '%s' matches nothing in the build context") % pattern;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

/**
 * Collects the source and, for a directory, its whole subtree. Symlinks inside a
 * directory are copied as symlinks.
 */
std::vector<SourceItem> BuildContext::collect(const std::string& path) const {
    auto hostPath = resolve(path);
    auto items = std::vector<SourceItem>{ SourceItem{"", makeEntry(hostPath)} };

    if(boost::filesystem::is_directory(hostPath)) {
        auto it = boost::filesystem::recursive_directory_iterator{hostPath};
        for(; it != boost::filesystem::recursive_directory_iterator{}; ++it) {
            auto relative = boost::filesystem::relative(it->path(), hostPath);
            items.push_back(SourceItem{relative.generic_string(), makeEntry(it->path())});
        }
        std::sort(items.begin(), items.end(), [](const SourceItem& lhs, const SourceItem& rhs) {
            return lhs.relativePath < rhs.relativePath;
        });
    }

    return items;
}

bool BuildContext::isDirectory(const std::string& path) const {
    return boost::filesystem::is_directory(resolve(path));
}

/**
 * Returns the path normalized relative to the context root, failing if its ".."
 * components climb out of the context.
 */
std::string BuildContext::checkPath(const std::string& path) const {
    auto components = std::vector<std::string>{};
    boost::algorithm::split(components, path, boost::algorithm::is_any_of("/"));

    int depth = 0;
    for(const auto& component : components) {
        if(component.empty() || component == ".") {
            continue;
        }
        depth += component == ".." ? -1 : 1;
        if(depth < 0) {
            auto message = boost::format("Path '%s' is outside of the build context %s") % path % directory;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ExecutionError, message.str());
        }
    }
    return normalizePath(path);
}

boost::filesystem::path BuildContext::resolve(const std::string& path) const {
    auto normalized = checkPath(path);
    auto hostPath = directory / libstratum::filesystem::realpathWithinRoot(directory, normalized);
    if(!boost::filesystem::exists(hostPath)) {
        auto message = boost::format("'%s' not found in the build context %s") % path % directory;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }
    return hostPath;
}

FileEntry BuildContext::makeEntry(const boost::filesystem::path& hostPath) const {
    auto status = boost::filesystem::symlink_status(hostPath);
    if(status.type() == boost::filesystem::symlink_file) {
        return FileEntry::makeSymlink(libstratum::filesystem::getSymlinkTarget(hostPath).string());
    }

    auto mode = libstratum::filesystem::getPermissions(hostPath);
    if(status.type() == boost::filesystem::directory_file) {
        return FileEntry::makeDirectory(mode);
    }
    if(status.type() == boost::filesystem::regular_file) {
        return FileEntry::makeFile(libstratum::filesystem::readFile(hostPath), mode);
    }

    auto message = boost::format("Unsupported file type for %s in the build context") % hostPath;
    STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ExecutionError, message.str());
}

}
}
