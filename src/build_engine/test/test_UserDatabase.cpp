/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include <string>

#include "libstratum/Error.hpp"
#include "build_engine/FilesystemState.hpp"
#include "build_engine/UserDatabase.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace build_engine {
namespace test {

TEST_GROUP(UserDatabaseTestGroup) {
    FilesystemState state;

    void setup() {
        state.put("/etc/passwd", FileEntry::makeFile(
            "root:x:0:0:root:/root:/bin/sh\n"
            "app:x:1000:1001:Application:/home/app:/bin/sh\n"
            "malformed line\n"));
        state.put("/etc/group", FileEntry::makeFile(
            "root:x:0:\n"
            "staff:x:50:app\n"));
    }
};

TEST(UserDatabaseTestGroup, lookup) {
    auto database = UserDatabase{state};
    CHECK(*database.findUid("app") == 1000);
    CHECK(*database.findGid("staff") == 50);
    CHECK(!database.findUid("nobody"));
    CHECK(!database.findGid("nogroup"));
}

TEST(UserDatabaseTestGroup, resolveOwnership) {
    auto database = UserDatabase{state};

    auto ownership = database.resolveOwnership("app:staff");
    CHECK_EQUAL(ownership.uid, 1000);
    CHECK_EQUAL(ownership.gid, 50);

    ownership = database.resolveOwnership("1234:5678");
    CHECK_EQUAL(ownership.uid, 1234);
    CHECK_EQUAL(ownership.gid, 5678);

    // without a group, the gid takes the value of the uid
    ownership = database.resolveOwnership("app");
    CHECK_EQUAL(ownership.uid, 1000);
    CHECK_EQUAL(ownership.gid, 1000);

    ownership = database.resolveOwnership("42");
    CHECK_EQUAL(ownership.gid, 42);

    CHECK_THROWS(libstratum::Error, database.resolveOwnership("nobody"));
    CHECK_THROWS(libstratum::Error, database.resolveOwnership("app:nogroup"));
}

TEST(UserDatabaseTestGroup, imageWithoutUserDatabase) {
    auto database = UserDatabase{FilesystemState{}};
    CHECK_EQUAL(database.resolveOwnership("0:0").uid, 0);
    CHECK_THROWS(libstratum::Error, database.resolveOwnership("root"));
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
