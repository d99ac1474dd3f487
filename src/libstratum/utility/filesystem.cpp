/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/logging.hpp"
#include "libstratum/utility/string.hpp"

/**
 * Utility functions for filesystem manipulation
 */

namespace libstratum {
namespace filesystem {

size_t getFileSize(const boost::filesystem::path& filename) {
    struct stat st;
    if(stat(filename.c_str(), &st) != 0) {
        auto message = boost::format("Failed to retrieve size of file %s. Stat failed: %s")
            % filename % strerror(errno);
        STRATUM_THROW_ERROR(message.str());
    }
    return st.st_size;
}

mode_t getPermissions(const boost::filesystem::path& path) {
    struct stat st;
    if(stat(path.c_str(), &st) != 0) {
        auto message = boost::format("Failed to retrieve permissions of file %s. Stat failed: %s")
            % path % strerror(errno);
        STRATUM_THROW_ERROR(message.str());
    }
    return st.st_mode & 07777;
}

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    auto currentPath = boost::filesystem::path("");

    if(!boost::filesystem::exists(path)) {
        logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);
    }

    for(const auto& element : path) {
        currentPath /= element;
        if(!boost::filesystem::exists(currentPath)) {
            bool created = false;
            try {
                created = boost::filesystem::create_directory(currentPath);
            } catch(const std::exception& e) {
                auto message = boost::format("Failed to create directory %s") % currentPath;
                STRATUM_RETHROW_ERROR(e, message.str());
            }
            if(!created) {
                // the creation might have failed because another thread or process
                // concurrently created the same directory
                if(!boost::filesystem::is_directory(currentPath)) {
                    auto message = boost::format("Failed to create directory %s") % currentPath;
                    STRATUM_THROW_ERROR(message.str());
                }
            }
        }
    }
}

std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string(), std::ios::binary);
    if(!ifs) {
        auto message = boost::format("Failed to open file %s for reading") % path;
        STRATUM_THROW_ERROR(message.str());
    }
    auto s = std::string(   std::istreambuf_iterator<char>(ifs),
                            std::istreambuf_iterator<char>());
    return s;
}

void writeFile(const std::string& content, const boost::filesystem::path& filename) {
    try {
        createFoldersIfNecessary(filename.parent_path());
        auto ofs = std::ofstream{filename.string(), std::ios::binary | std::ios::trunc};
        if (!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            STRATUM_THROW_ERROR(message.str());
        }
        ofs.write(content.data(), content.size());
        ofs.close();
        if(!ofs) {
            auto message = boost::format("Failed to write %d bytes to %s") % content.size() % filename;
            STRATUM_THROW_ERROR(message.str());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write file %s") % filename;
        STRATUM_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Writes the content into a temporary file next to the destination, then
 * renames the temporary file over the destination. Readers either see the
 * previous file or the complete new one.
 */
void writeFileAtomically(const std::string& content, const boost::filesystem::path& filename) {
    auto tempFile = makeUniquePathWithRandomSuffix(filename.string() + ".tmp");
    try {
        writeFile(content, tempFile);
        boost::filesystem::rename(tempFile, filename);
    }
    catch(const std::exception& e) {
        boost::system::error_code ec;
        boost::filesystem::remove(tempFile, ec);
        auto message = boost::format("Failed to atomically write file %s") % filename;
        STRATUM_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Generates a random suffix and append it to the given path. If the generated random
 * path exists, tries again with another suffix until the operation succeedes.
 *
 * Note: boost::filesystem::unique_path offers a similar functionality. However, it
 * fails (throws exception) when the locale configuration is invalid.
 */
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

boost::filesystem::path getSymlinkTarget(const boost::filesystem::path& path) {
    char buffer[PATH_MAX];
    auto count = readlink(path.string().c_str(), buffer, PATH_MAX-1);
    if(count < 0) {
        auto message = boost::format("Failed to read target of symlink %s: %s") % path % strerror(errno);
        STRATUM_THROW_ERROR(message.str());
    }
    buffer[count] = '\0';
    return buffer;
}

/*
    Appends path1 to path0 resolving symlinks within root. E.g.:

    root = /context
    path0 = /src
    path1 = app/main.c

    and in root we have:

    /context/src/app -> /vendor/app-1.0

    then:

    result = /vendor/app-1.0/main.c

    Symlinks and ".." components never lead outside of root: an absolute
    symlink target is interpreted relative to root and ".." stops at "/".
*/
boost::filesystem::path appendPathsWithinRoot(  const boost::filesystem::path& root,
                                                const boost::filesystem::path& path0,
                                                const boost::filesystem::path& path1) {
    auto current = path0;

    for(const auto& element : path1) {
        if(element == "/" || element == "." || element.empty()) {
            continue;
        }
        else if(element == "..") {
            if(current > "/") {
                current = current.remove_trailing_separator().parent_path();
            }
        }
        else if(isSymlink(root / current / element)) {
            auto target = getSymlinkTarget(root / current / element);
            if(target.is_absolute()) {
                current = appendPathsWithinRoot(root, "/", target);
            }
            else {
                current = appendPathsWithinRoot(root, current, target);
            }
        }
        else {
            current /= element;
        }
    }

    return current;
}

boost::filesystem::path realpathWithinRoot(const boost::filesystem::path& root, const boost::filesystem::path& path) {
    if(!path.is_absolute()) {
        auto message = boost::format("Failed to determine realpath within %s. %s is not an absolute path.") % root % path;
        STRATUM_THROW_ERROR(message.str());
    }

    return appendPathsWithinRoot(root, "/", path);
}

bool isSymlink(const boost::filesystem::path& path) {
    struct stat sb;
    if (lstat(path.c_str(), &sb) != 0) {
        return false;
    }
    return S_ISLNK(sb.st_mode);
}

}}
