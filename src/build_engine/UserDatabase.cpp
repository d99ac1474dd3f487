/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/UserDatabase.hpp"

#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/logging.hpp"


namespace stratum {
namespace build_engine {

UserDatabase::UserDatabase(const FilesystemState& state) {
    auto passwd = state.find("/etc/passwd");
    if(passwd && passwd->content) {
        auto is = std::istringstream{*passwd->content};
        readPasswd(is);
    }
    auto group = state.find("/etc/group");
    if(group && group->content) {
        auto is = std::istringstream{*group->content};
        readGroup(is);
    }
}

/**
 * Resolves "user[:group]" where user and group are names or numeric IDs.
 * Without a group, the GID is the numeric value of the UID.
 */
UserDatabase::Ownership UserDatabase::resolveOwnership(const std::string& owner) const {
    auto numeric = boost::regex{"^[0-9]+$"};
    auto separator = owner.find(':');
    auto user = owner.substr(0, separator);
    auto group = separator == std::string::npos ? std::string{} : owner.substr(separator + 1);

    auto ownership = Ownership{};
    if(boost::regex_match(user, numeric)) {
        ownership.uid = static_cast<uid_t>(std::stoul(user));
    }
    else {
        auto uid = findUid(user);
        if(!uid) {
            auto message = boost::format("Unable to find user '%s' in /etc/passwd of the image") % user;
            STRATUM_THROW_ERROR(message.str());
        }
        ownership.uid = *uid;
    }

    if(group.empty()) {
        ownership.gid = static_cast<gid_t>(ownership.uid);
    }
    else if(boost::regex_match(group, numeric)) {
        ownership.gid = static_cast<gid_t>(std::stoul(group));
    }
    else {
        auto gid = findGid(group);
        if(!gid) {
            auto message = boost::format("Unable to find group '%s' in /etc/group of the image") % group;
            STRATUM_THROW_ERROR(message.str());
        }
        ownership.gid = *gid;
    }

    return ownership;
}

boost::optional<uid_t> UserDatabase::findUid(const std::string& loginName) const {
    for(const auto& entry : users) {
        if(entry.loginName == loginName) {
            return entry.uid;
        }
    }
    return boost::none;
}

boost::optional<gid_t> UserDatabase::findGid(const std::string& groupName) const {
    for(const auto& entry : groups) {
        if(entry.groupName == groupName) {
            return entry.gid;
        }
    }
    return boost::none;
}

void UserDatabase::readPasswd(std::istream& is) {
    auto line = std::string{};
    while(std::getline(is, line)) {
        auto tokens = std::vector<std::string>{};
        boost::split(tokens, line, boost::is_any_of(":"));
        if(tokens.size() < 6 || tokens.size() > 7) {
            libstratum::logMessage(boost::format("Skipping malformed /etc/passwd line \"%s\"") % line,
                                   libstratum::LogLevel::DEBUG);
            continue;
        }
        try {
            users.push_back(PasswdEntry{tokens[0], static_cast<uid_t>(std::stoul(tokens[2])),
                                        static_cast<gid_t>(std::stoul(tokens[3]))});
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to parse /etc/passwd line \"%s\"") % line;
            STRATUM_RETHROW_ERROR(e, message.str());
        }
    }
}

void UserDatabase::readGroup(std::istream& is) {
    auto line = std::string{};
    while(std::getline(is, line)) {
        auto tokens = std::vector<std::string>{};
        boost::split(tokens, line, boost::is_any_of(":"));
        if(tokens.size() != 4) {
            libstratum::logMessage(boost::format("Skipping malformed /etc/group line \"%s\"") % line,
                                   libstratum::LogLevel::DEBUG);
            continue;
        }
        try {
            groups.push_back(GroupEntry{tokens[0], static_cast<gid_t>(std::stoul(tokens[2]))});
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to parse /etc/group line \"%s\"") % line;
            STRATUM_RETHROW_ERROR(e, message.str());
        }
    }
}

}
}
