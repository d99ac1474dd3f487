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
#include <memory>
#include <cstdlib>

#include "libstratum/Error.hpp"
#include "common/ImageReference.hpp"
#include "image_manager/ImageManager.hpp"
#include "test_utility/config.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/FakeRegistry.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace image_manager {
namespace test {

using test_utility::registry::FakeRegistry;

TEST_GROUP(ImageManagerTestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    std::shared_ptr<FakeRegistry> fakeRegistry = std::make_shared<FakeRegistry>();

    void setup() {
        const auto& contextDir = configRAII.config->commandBuild.contextDir;
        test_utility::filesystem::createFile(contextDir / "app.py", "print('hello')\n");
        test_utility::filesystem::createFile(contextDir / "etc/app.conf", "port=8080\n");
        unsetenv("SOURCE_DATE_EPOCH");
    }

    void writeDockerfile(const std::string& text) {
        test_utility::filesystem::createFile(configRAII.config->commandBuild.contextDir / "Dockerfile", text);
    }

    ImageManager makeManager(const test_utility::config::ConfigRAII& raii) const {
        return ImageManager{raii.config, fakeRegistry, std::make_shared<build_engine::SimulatedExecutor>()};
    }
};

TEST(ImageManagerTestGroup, build) {
    writeDockerfile(
        "FROM scratch\n"
        "COPY app.py /app/app.py\n"
        "RUN chmod +x /app/app.py\n"
        "CMD [\"/app/app.py\"]\n");
    auto manager = makeManager(configRAII);
    auto image = manager.buildImage();
    CHECK_EQUAL(1, image.manifest.layers.size());
    CHECK_EQUAL(3, image.configuration.history.size());

    auto images = manager.listImages();
    CHECK_EQUAL(1, images.size());
    CHECK_EQUAL(std::string{"localhost:5000/test/app:1.0"}, images[0].reference.string());
    CHECK(images[0].manifest.digest == image.getDigest());
    CHECK(images[0].id == image.manifest.config.digest);
    CHECK_EQUAL(image.manifestDescriptor.size + image.manifest.config.size + image.manifest.layers[0].size,
                images[0].size);

    // building again gives the same image under the same tag
    auto again = manager.buildImage();
    CHECK(again.getDigest() == image.getDigest());
    CHECK_EQUAL(1, manager.listImages().size());
}

TEST(ImageManagerTestGroup, build_with_custom_dockerfile) {
    auto dockerfile = configRAII.prefixDir / "build.Dockerfile";
    test_utility::filesystem::createFile(dockerfile, "FROM scratch\nCOPY etc /etc\n");
    configRAII.config->commandBuild.dockerfile = dockerfile;

    auto image = makeManager(configRAII).buildImage();
    CHECK_EQUAL(1, image.manifest.layers.size());
}

TEST(ImageManagerTestGroup, build_errors) {
    // no Dockerfile
    try {
        makeManager(configRAII).buildImage();
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }

    writeDockerfile("FROM scratch\nCOPY\n");
    try {
        makeManager(configRAII).buildImage();
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::ParseError);
    }
    CHECK(makeManager(configRAII).listImages().empty());
}

TEST(ImageManagerTestGroup, build_from_local_image) {
    writeDockerfile(
        "FROM scratch\n"
        "COPY etc /etc\n"
        "ENV APP_CONFIG=/etc/app.conf\n");
    configRAII.config->imageReference = common::ImageReference::parse("localhost:5000/test/base:1.0");
    auto base = makeManager(configRAII).buildImage();

    writeDockerfile(
        "FROM localhost:5000/test/base:1.0\n"
        "COPY app.py /app/\n");
    configRAII.config->imageReference = common::ImageReference::parse("localhost:5000/test/app:1.0");
    auto image = makeManager(configRAII).buildImage();

    CHECK_EQUAL(2, image.manifest.layers.size());
    CHECK(image.manifest.layers[0].digest == base.manifest.layers[0].digest);
    CHECK(image.configuration.diffIDs[0] == base.configuration.diffIDs[0]);
    CHECK_EQUAL(3, image.configuration.history.size());
    CHECK(*image.configuration.config.getEnvironmentVariable("APP_CONFIG") == "/etc/app.conf");
    CHECK_EQUAL(2, makeManager(configRAII).listImages().size());

    writeDockerfile("FROM localhost:5000/test/missing:1.0\n");
    try {
        makeManager(configRAII).buildImage();
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
}

TEST(ImageManagerTestGroup, push) {
    writeDockerfile("FROM scratch\nCOPY app.py /app.py\n");

    // the image is built on the fly when it isn't in the local layout
    auto report = makeManager(configRAII).pushImage();
    CHECK_EQUAL(2, report.blobsUploaded);
    CHECK(fakeRegistry->hasManifest("test/app", "1.0"));
    CHECK(fakeRegistry->hasManifest("test/app", report.manifestDigest.string()));

    report = makeManager(configRAII).pushImage();
    CHECK_EQUAL(0, report.blobsUploaded);
    CHECK_EQUAL(2, report.blobsSkipped);
}

TEST(ImageManagerTestGroup, push_without_image) {
    try {
        makeManager(configRAII).pushImage();
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
    CHECK(fakeRegistry->getRequests().empty());
}

TEST(ImageManagerTestGroup, pull) {
    writeDockerfile("FROM scratch\nCOPY app.py /app.py\nCOPY etc /etc\n");
    auto pushed = makeManager(configRAII).pushImage();

    // another machine: empty store, same registry
    auto otherRAII = test_utility::config::makeConfig();
    auto otherManager = makeManager(otherRAII);
    CHECK(otherManager.listImages().empty());

    auto manifest = otherManager.pullImage();
    CHECK(manifest.digest == pushed.manifestDigest);
    auto images = otherManager.listImages();
    CHECK_EQUAL(1, images.size());
    CHECK(images[0].manifest.digest == pushed.manifestDigest);

    // the pulled image is a valid base image
    test_utility::filesystem::createFile(otherRAII.config->commandBuild.contextDir / "Dockerfile",
                                         "FROM localhost:5000/test/app:1.0\nLABEL pulled=yes\n");
    otherRAII.config->imageReference = common::ImageReference::parse("localhost:5000/test/derived:1.0");
    auto derived = otherManager.buildImage();
    CHECK_EQUAL(2, derived.manifest.layers.size());
}

TEST(ImageManagerTestGroup, remove) {
    writeDockerfile("FROM scratch\nCOPY app.py /app.py\n");
    auto manager = makeManager(configRAII);
    auto image = manager.buildImage();

    manager.removeImage();
    CHECK(manager.listImages().empty());
    // the blobs stay in the content store
    CHECK(manager.getContentStore()->has(image.getDigest()));

    try {
        manager.removeImage();
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
}

TEST(ImageManagerTestGroup, created_time_from_environment) {
    writeDockerfile("FROM scratch\nCOPY app.py /app.py\n");
    setenv("SOURCE_DATE_EPOCH", "86400", 1);
    auto image = makeManager(configRAII).buildImage();
    unsetenv("SOURCE_DATE_EPOCH");
    CHECK_EQUAL(std::string{"1970-01-02T00:00:00Z"}, image.configuration.created);
    CHECK_EQUAL(std::string{"1970-01-02T00:00:00Z"}, image.configuration.history[0].created);
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
