/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_UserDatabase_hpp
#define stratum_build_engine_UserDatabase_hpp

#include <string>
#include <vector>
#include <istream>
#include <sys/types.h>

#include <boost/optional.hpp>

#include "build_engine/FilesystemState.hpp"


namespace stratum {
namespace build_engine {

/**
 * The users and groups defined by /etc/passwd and /etc/group of an image
 * filesystem, used to resolve the owner given to COPY --chown.
 */
class UserDatabase {
public:
    struct Ownership {
        uid_t uid;
        gid_t gid;
    };

public:
    explicit UserDatabase(const FilesystemState& state);

    Ownership resolveOwnership(const std::string& owner) const;
    boost::optional<uid_t> findUid(const std::string& loginName) const;
    boost::optional<gid_t> findGid(const std::string& groupName) const;

private:
    struct PasswdEntry {
        std::string loginName;
        uid_t uid;
        gid_t gid;
    };

    struct GroupEntry {
        std::string groupName;
        gid_t gid;
    };

    void readPasswd(std::istream&);
    void readGroup(std::istream&);

private:
    std::vector<PasswdEntry> users;
    std::vector<GroupEntry> groups;
};

}
}

#endif
