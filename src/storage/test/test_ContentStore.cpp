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
#include <thread>
#include <vector>

#include <boost/filesystem.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Utility.hpp"
#include "storage/ContentStore.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace storage {
namespace test {

TEST_GROUP(ContentStoreTestGroup) {
    test_utility::filesystem::TemporaryDirectory storeDir{"stratum-test-store"};
};

TEST(ContentStoreTestGroup, putAndGet) {
    auto store = ContentStore{storeDir.getPath()};
    auto digest = store.put("layer content");

    CHECK(digest == common::Digest::compute("layer content"));
    CHECK(store.has(digest));
    CHECK_EQUAL(store.get(digest), std::string{"layer content"});
    CHECK_EQUAL(store.size(digest), 13);
    CHECK(store.getBlobPath(digest) == storeDir.getPath() / "blobs/sha256" / digest.getHex());
}

TEST(ContentStoreTestGroup, putIsIdempotent) {
    auto store = ContentStore{storeDir.getPath()};
    auto first = store.put("same bytes");
    auto modificationTime = boost::filesystem::last_write_time(store.getBlobPath(first));
    auto second = store.put("same bytes");

    CHECK(first == second);
    CHECK(boost::filesystem::last_write_time(store.getBlobPath(second)) == modificationTime);
    CHECK_EQUAL(store.list().size(), 1);
}

TEST(ContentStoreTestGroup, missingBlob) {
    auto store = ContentStore{storeDir.getPath()};
    auto digest = common::Digest::compute("never stored");
    CHECK(!store.has(digest));

    try {
        store.get(digest);
        FAIL("expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
    CHECK_THROWS(libstratum::Error, store.size(digest));
}

TEST(ContentStoreTestGroup, putVerified) {
    auto store = ContentStore{storeDir.getPath()};
    store.putVerified("downloaded", common::Digest::compute("downloaded"));
    CHECK(store.has(common::Digest::compute("downloaded")));

    try {
        store.putVerified("tampered", common::Digest::compute("downloaded!"));
        FAIL("expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::DigestMismatch);
    }
    CHECK(!store.has(common::Digest::compute("tampered")));
}

TEST(ContentStoreTestGroup, listSkipsTemporaryFiles) {
    auto store = ContentStore{storeDir.getPath()};
    auto a = store.put("a");
    auto b = store.put("b");
    test_utility::filesystem::createFile(storeDir.getPath() / "blobs/sha256" / (a.getHex() + ".tmp-abcdefgh"), "partial");

    auto digests = store.list();
    CHECK_EQUAL(digests.size(), 2);
    CHECK(digests[0] < digests[1]);
    CHECK((digests[0] == a && digests[1] == b) || (digests[0] == b && digests[1] == a));
}

TEST(ContentStoreTestGroup, concurrentWritersOfTheSameBlob) {
    auto store = ContentStore{storeDir.getPath()};
    auto content = std::string(1 << 20, 'z');

    auto threads = std::vector<std::thread>{};
    for(int i=0; i<8; ++i) {
        threads.emplace_back([&store, &content]() {
            store.put(content);
        });
    }
    for(auto& thread : threads) {
        thread.join();
    }

    auto digest = common::Digest::compute(content);
    CHECK_EQUAL(store.get(digest), content);
    CHECK_EQUAL(store.list().size(), 1);
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
