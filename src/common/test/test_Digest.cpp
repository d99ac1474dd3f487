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

#include <boost/filesystem.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Utility.hpp"
#include "common/Digest.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace common {
namespace test {

TEST_GROUP(DigestTestGroup) {
};

TEST(DigestTestGroup, compute) {
    CHECK_EQUAL(Digest::compute("").string(),
                std::string{"sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"});
    CHECK_EQUAL(Digest::compute("abc").string(),
                std::string{"sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"});
}

TEST(DigestTestGroup, incrementalHashingMatchesOneShot) {
    auto hasher = Sha256Hasher{};
    hasher.update("a");
    hasher.update("bc");
    CHECK(hasher.finalize() == Digest::compute("abc"));
    CHECK_THROWS(libstratum::Error, hasher.finalize());
    CHECK_THROWS(libstratum::Error, hasher.update("d"));
}

TEST(DigestTestGroup, computeFile) {
    auto dir = test_utility::filesystem::TemporaryDirectory{};
    auto content = std::string(200000, 'x');
    test_utility::filesystem::createFile(dir.getPath() / "blob", content);
    CHECK(Digest::computeFile(dir.getPath() / "blob") == Digest::compute(content));
    CHECK_THROWS(libstratum::Error, Digest::computeFile(dir.getPath() / "missing"));
}

TEST(DigestTestGroup, parse) {
    auto digest = Digest::parse("sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK_EQUAL(digest.getAlgorithm(), std::string{"sha256"});
    CHECK_EQUAL(digest.getHex(), std::string{"ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"});
    CHECK(!digest.empty());
    CHECK(Digest{}.empty());

    // missing algorithm separator
    CHECK_THROWS(libstratum::Error, Digest::parse("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    // wrong length
    CHECK_THROWS(libstratum::Error, Digest::parse("sha256:ba7816bf"));
    // uppercase hex
    CHECK_THROWS(libstratum::Error, Digest::parse("sha256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    // empty algorithm
    CHECK_THROWS(libstratum::Error, Digest::parse(":ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
