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
#include "common/ImageReference.hpp"
#include "common/ImageSpec.hpp"
#include "storage/ImageLayout.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace storage {
namespace test {

static common::Descriptor makeManifestDescriptor(const std::string& content) {
    auto descriptor = common::Descriptor{};
    descriptor.mediaType = common::mediaType::OCI_MANIFEST;
    descriptor.digest = common::Digest::compute(content);
    descriptor.size = content.size();
    return descriptor;
}

TEST_GROUP(ImageLayoutTestGroup) {
    test_utility::filesystem::TemporaryDirectory layoutDir{"stratum-test-layout"};
};

TEST(ImageLayoutTestGroup, initialize) {
    auto layout = ImageLayout{layoutDir.getPath()};

    auto marker = libstratum::json::read(layoutDir.getPath() / "oci-layout");
    CHECK_EQUAL(libstratum::json::getString(marker, "imageLayoutVersion"), std::string{"1.0.0"});

    auto index = libstratum::json::read(layoutDir.getPath() / "index.json");
    CHECK_EQUAL(index["schemaVersion"].GetInt(), 2);
    CHECK_EQUAL(libstratum::json::getString(index, "mediaType"), common::mediaType::OCI_INDEX);
    CHECK(index["manifests"].Empty());
    CHECK(layout.list().empty());

    // reopening keeps the existing index
    layout.tag(common::ImageReference::parse("localhost:5000/app:1.0"), makeManifestDescriptor("m"));
    auto reopened = ImageLayout{layoutDir.getPath()};
    CHECK_EQUAL(reopened.list().size(), 1);
}

TEST(ImageLayoutTestGroup, tagAndFind) {
    auto layout = ImageLayout{layoutDir.getPath()};
    auto reference = common::ImageReference::parse("localhost:5000/app:1.0");
    auto manifest = makeManifestDescriptor("manifest v1");

    CHECK(!layout.find(reference));
    layout.tag(reference, manifest);

    auto found = layout.find(reference);
    CHECK(found != boost::none);
    CHECK(found->digest == manifest.digest);
    CHECK_EQUAL(ImageLayout::getReferenceName(*found), std::string{"localhost:5000/app:1.0"});

    auto index = libstratum::json::read(layoutDir.getPath() / "index.json");
    CHECK_EQUAL(libstratum::json::getString(index["manifests"][0]["annotations"], "org.opencontainers.image.ref.name"),
                std::string{"localhost:5000/app:1.0"});
}

TEST(ImageLayoutTestGroup, retagReplacesPreviousManifest) {
    auto layout = ImageLayout{layoutDir.getPath()};
    auto reference = common::ImageReference::parse("localhost:5000/app:1.0");
    auto other = common::ImageReference::parse("localhost:5000/app:2.0");

    layout.tag(reference, makeManifestDescriptor("manifest v1"));
    layout.tag(other, makeManifestDescriptor("manifest v1"));
    layout.tag(reference, makeManifestDescriptor("manifest v2"));

    CHECK_EQUAL(layout.list().size(), 2);
    CHECK(layout.find(reference)->digest == common::Digest::compute("manifest v2"));
    CHECK(layout.find(other)->digest == common::Digest::compute("manifest v1"));
}

TEST(ImageLayoutTestGroup, untag) {
    auto layout = ImageLayout{layoutDir.getPath()};
    auto reference = common::ImageReference::parse("localhost:5000/app:1.0");
    layout.tag(reference, makeManifestDescriptor("manifest"));

    layout.untag(reference);
    CHECK(!layout.find(reference));

    try {
        layout.untag(reference);
        FAIL("expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
}

TEST(ImageLayoutTestGroup, malformedIndex) {
    auto layout = ImageLayout{layoutDir.getPath()};
    test_utility::filesystem::createFile(layoutDir.getPath() / "index.json", "{\"schemaVersion\": 2}");
    CHECK_THROWS(libstratum::Error, layout.list());
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
