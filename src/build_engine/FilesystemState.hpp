/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_FilesystemState_hpp
#define stratum_build_engine_FilesystemState_hpp

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <cstdint>
#include <sys/types.h>


namespace stratum {
namespace build_engine {

/**
 * Metadata of one filesystem entry plus a reference to its content. File content is
 * shared between the snapshots that contain the same file and never modified.
 */
struct FileEntry {
    enum class Type {regularFile, directory, symlink, hardlink};

    Type type = Type::regularFile;
    mode_t mode = 0644;
    uid_t uid = 0;
    gid_t gid = 0;
    std::shared_ptr<const std::string> content;
    // target of symlinks (as written in the link) and hardlinks (absolute path in the image)
    std::string linkTarget;

    std::size_t getSize() const;

    static FileEntry makeFile(std::string content, mode_t mode = 0644);
    static FileEntry makeDirectory(mode_t mode = 0755);
    static FileEntry makeSymlink(const std::string& target);
};

bool operator==(const FileEntry&, const FileEntry&);
bool operator!=(const FileEntry&, const FileEntry&);

/**
 * A filesystem mutation: entries created or replaced, paths removed together with their
 * subtree, and directories whose previous content is hidden before the upserts apply.
 */
struct Changeset {
    std::map<std::string, FileEntry> upserts;
    std::set<std::string> deletions;
    std::set<std::string> opaqueDirectories;

    bool empty() const { return upserts.empty() && deletions.empty() && opaqueDirectories.empty(); }
};

/**
 * Normalizes a path of the image filesystem to its absolute lexical form: POSIX separators,
 * no "." or ".." components, no trailing separator. Relative paths are resolved against
 * 'workdir'; ".." never climbs above "/".
 */
std::string normalizePath(const std::string& path, const std::string& workdir = "/");

std::string getParentPath(const std::string& normalizedPath);
std::string getBaseName(const std::string& normalizedPath);

/**
 * Snapshot of an image filesystem: a mapping from normalized absolute path to entry.
 * The root directory "/" is implicit. A path is only present together with all its
 * parent directories.
 */
class FilesystemState {
public:
    using Entries = std::map<std::string, FileEntry>;

public:
    const Entries& getEntries() const { return entries; }
    const FileEntry* find(const std::string& path) const;
    bool exists(const std::string& path) const;
    bool isDirectory(const std::string& path) const;
    std::size_t size() const { return entries.size(); }

    void put(const std::string& path, const FileEntry& entry);
    void remove(const std::string& path);
    void apply(const Changeset& changeset);
    Changeset diff(const FilesystemState& base) const;
    std::vector<std::string> listSubtree(const std::string& directory) const;

private:
    void makeParentDirectories(const std::string& path);
    void removeSubtree(const std::string& path);
    void resolveHardlinks();

private:
    Entries entries;
};

bool operator==(const FilesystemState&, const FilesystemState&);

}
}

#endif
