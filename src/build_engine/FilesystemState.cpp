/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/FilesystemState.hpp"

#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "libstratum/Error.hpp"


namespace stratum {
namespace build_engine {

std::size_t FileEntry::getSize() const {
    return content ? content->size() : 0;
}

FileEntry FileEntry::makeFile(std::string content, mode_t mode) {
    auto entry = FileEntry{};
    entry.type = Type::regularFile;
    entry.mode = mode;
    entry.content = std::make_shared<const std::string>(std::move(content));
    return entry;
}

FileEntry FileEntry::makeDirectory(mode_t mode) {
    auto entry = FileEntry{};
    entry.type = Type::directory;
    entry.mode = mode;
    return entry;
}

FileEntry FileEntry::makeSymlink(const std::string& target) {
    auto entry = FileEntry{};
    entry.type = Type::symlink;
    entry.mode = 0777;
    entry.linkTarget = target;
    return entry;
}

static bool haveSameContent(const FileEntry& lhs, const FileEntry& rhs) {
    if(lhs.content == rhs.content) {
        return true;
    }
    if(lhs.getSize() != rhs.getSize()) {
        return false;
    }
    if(!lhs.content || !rhs.content) {
        return true; // both empty
    }
    return *lhs.content == *rhs.content;
}

bool operator==(const FileEntry& lhs, const FileEntry& rhs) {
    return lhs.type == rhs.type
        && lhs.mode == rhs.mode
        && lhs.uid == rhs.uid
        && lhs.gid == rhs.gid
        && lhs.linkTarget == rhs.linkTarget
        && haveSameContent(lhs, rhs);
}

bool operator!=(const FileEntry& lhs, const FileEntry& rhs) {
    return !(lhs == rhs);
}

std::string normalizePath(const std::string& path, const std::string& workdir) {
    auto full = path;
    if(full.empty() || full.front() != '/') {
        full = workdir + "/" + full;
    }

    auto input = std::vector<std::string>{};
    boost::algorithm::split(input, full, boost::algorithm::is_any_of("/"));

    auto components = std::vector<std::string>{};
    for(const auto& component : input) {
        if(component.empty() || component == ".") {
            continue;
        }
        if(component == "..") {
            if(!components.empty()) {
                components.pop_back();
            }
            continue;
        }
        components.push_back(component);
    }

    return "/" + boost::algorithm::join(components, "/");
}

std::string getParentPath(const std::string& normalizedPath) {
    auto separator = normalizedPath.find_last_of('/');
    if(separator == 0 || separator == std::string::npos) {
        return "/";
    }
    return normalizedPath.substr(0, separator);
}

std::string getBaseName(const std::string& normalizedPath) {
    auto separator = normalizedPath.find_last_of('/');
    if(separator == std::string::npos) {
        return normalizedPath;
    }
    return normalizedPath.substr(separator + 1);
}

const FileEntry* FilesystemState::find(const std::string& path) const {
    auto it = entries.find(path);
    return it != entries.cend() ? &it->second : nullptr;
}

bool FilesystemState::exists(const std::string& path) const {
    return path == "/" || entries.find(path) != entries.cend();
}

bool FilesystemState::isDirectory(const std::string& path) const {
    if(path == "/") {
        return true;
    }
    auto entry = find(path);
    return entry && entry->type == FileEntry::Type::directory;
}

/**
 * Creates or replaces the entry at 'path'. Missing parent directories are created;
 * a non-directory replacing a directory removes the directory's subtree.
 */
void FilesystemState::put(const std::string& path, const FileEntry& entry) {
    if(path == "/") {
        return;
    }
    if(path.front() != '/' || normalizePath(path) != path) {
        auto message = boost::format("Cannot add entry with non-normalized path '%s'") % path;
        STRATUM_THROW_ERROR(message.str());
    }

    makeParentDirectories(path);
    if(entry.type != FileEntry::Type::directory) {
        removeSubtree(path);
    }
    entries[path] = entry;
}

void FilesystemState::remove(const std::string& path) {
    if(path == "/") {
        entries.clear();
        return;
    }
    entries.erase(path);
    removeSubtree(path);
}

void FilesystemState::apply(const Changeset& changeset) {
    for(const auto& directory : changeset.opaqueDirectories) {
        removeSubtree(directory);
    }
    for(const auto& path : changeset.deletions) {
        remove(path);
    }
    for(const auto& upsert : changeset.upserts) {
        put(upsert.first, upsert.second);
    }
    resolveHardlinks();
}

/**
 * Computes the changeset that turns 'base' into this state. A removed directory is
 * reported once, not together with each of its children.
 */
Changeset FilesystemState::diff(const FilesystemState& base) const {
    auto changeset = Changeset{};

    for(const auto& entry : entries) {
        auto baseEntry = base.find(entry.first);
        if(!baseEntry || *baseEntry != entry.second) {
            changeset.upserts.insert(entry);
        }
    }

    for(const auto& baseEntry : base.entries) {
        const auto& path = baseEntry.first;
        if(exists(path)) {
            continue;
        }
        auto parent = getParentPath(path);
        bool isCoveredByParent = !isDirectory(parent);
        if(!isCoveredByParent) {
            changeset.deletions.insert(path);
        }
    }

    return changeset;
}

std::vector<std::string> FilesystemState::listSubtree(const std::string& directory) const {
    auto paths = std::vector<std::string>{};
    auto prefix = directory == "/" ? std::string{"/"} : directory + "/";
    for(auto it = entries.lower_bound(prefix); it != entries.cend() && boost::algorithm::starts_with(it->first, prefix); ++it) {
        paths.push_back(it->first);
    }
    return paths;
}

void FilesystemState::makeParentDirectories(const std::string& path) {
    auto parent = getParentPath(path);
    if(parent == "/") {
        return;
    }
    auto it = entries.find(parent);
    if(it == entries.end()) {
        makeParentDirectories(parent);
        entries[parent] = FileEntry::makeDirectory();
    }
    else if(it->second.type != FileEntry::Type::directory) {
        // a file in the way of a new subtree is replaced by a directory
        it->second = FileEntry::makeDirectory();
    }
}

void FilesystemState::removeSubtree(const std::string& path) {
    auto prefix = path == "/" ? std::string{"/"} : path + "/";
    auto it = entries.lower_bound(prefix);
    while(it != entries.end() && boost::algorithm::starts_with(it->first, prefix)) {
        it = entries.erase(it);
    }
}

/**
 * Hardlinks become regular files sharing the content of their target, when the
 * target is part of the state.
 */
void FilesystemState::resolveHardlinks() {
    for(auto& entry : entries) {
        if(entry.second.type != FileEntry::Type::hardlink) {
            continue;
        }
        auto target = find(normalizePath(entry.second.linkTarget));
        if(target && target->type == FileEntry::Type::regularFile) {
            entry.second.type = FileEntry::Type::regularFile;
            entry.second.content = target->content;
            entry.second.mode = target->mode;
            entry.second.linkTarget.clear();
        }
    }
}

bool operator==(const FilesystemState& lhs, const FilesystemState& rhs) {
    return lhs.getEntries() == rhs.getEntries();
}

}
}
