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
#include <algorithm>
#include <cstdlib>

#include "libstratum/Error.hpp"
#include "dockerfile/Parser.hpp"
#include "storage/ContentStore.hpp"
#include "build_engine/BuildEngine.hpp"
#include "image_manager/ImageAssembler.hpp"
#include "test_utility/config.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace image_manager {
namespace test {

TEST_GROUP(ImageAssemblerTestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    std::shared_ptr<storage::ContentStore> contentStore;

    void setup() {
        test_utility::filesystem::createFile(configRAII.config->commandBuild.contextDir / "app.py", "print('hello')\n");
        test_utility::filesystem::createFile(configRAII.config->commandBuild.contextDir / "requirements.txt", "flask\n");
        contentStore = std::make_shared<storage::ContentStore>(configRAII.config->directories.store);
        unsetenv("SOURCE_DATE_EPOCH");
    }

    std::shared_ptr<const build_engine::Stage> build(const std::string& text) {
        auto context = std::make_shared<build_engine::BuildContext>(configRAII.config->commandBuild.contextDir);
        auto engine = build_engine::BuildEngine{configRAII.config, contentStore, context,
                                                std::make_shared<build_engine::SimulatedExecutor>(), nullptr};
        return engine.build(dockerfile::Parser{}.parse(text));
    }
};

TEST(ImageAssemblerTestGroup, assemble) {
    auto stage = build(
        "FROM scratch\n"
        "WORKDIR /app\n"
        "COPY requirements.txt .\n"
        "RUN pip install -r requirements.txt\n"
        "COPY app.py .\n"
        "ENV PYTHONUNBUFFERED=1\n"
        "CMD [\"python\", \"app.py\"]\n");
    auto image = ImageAssembler{configRAII.config, contentStore}.assemble(*stage);

    // one layer per COPY, every instruction in the history
    CHECK_EQUAL(2, image.manifest.layers.size());
    CHECK_EQUAL(2, image.configuration.diffIDs.size());
    CHECK_EQUAL(6, image.configuration.history.size());
    auto layerEntries = std::count_if(image.configuration.history.cbegin(), image.configuration.history.cend(),
                                      [](const common::HistoryEntry& entry) { return !entry.emptyLayer; });
    CHECK_EQUAL(image.manifest.layers.size(), layerEntries);

    CHECK_EQUAL(std::string{"linux"}, image.configuration.os);
    CHECK_EQUAL(std::string{"amd64"}, image.configuration.architecture);
    CHECK(*image.configuration.config.workdir == "/app");
    CHECK(*image.configuration.config.getEnvironmentVariable("PYTHONUNBUFFERED") == "1");

    for(std::size_t i = 0; i < image.manifest.layers.size(); ++i) {
        CHECK(image.manifest.layers[i].digest == stage->getLayers()[i].digest);
        CHECK(image.configuration.diffIDs[i] == stage->getLayers()[i].diffID);
        CHECK_EQUAL(common::mediaType::OCI_LAYER_TAR_GZIP, image.manifest.layers[i].mediaType);
        CHECK(contentStore->has(image.manifest.layers[i].digest));
    }

    // the config and the manifest are blobs of the content store as well
    CHECK_EQUAL(common::mediaType::OCI_CONFIG, image.manifest.config.mediaType);
    CHECK_EQUAL(image.configuration.serialize(), contentStore->get(image.manifest.config.digest));
    CHECK_EQUAL(image.manifest.serialize(), contentStore->get(image.getDigest()));
    CHECK_EQUAL(common::mediaType::OCI_MANIFEST, image.manifestDescriptor.mediaType);
    CHECK_EQUAL(contentStore->size(image.getDigest()), image.manifestDescriptor.size);
}

TEST(ImageAssemblerTestGroup, reproducible) {
    auto text = std::string{"FROM scratch\nCOPY . /src\nLABEL version=1\n"};
    auto first = ImageAssembler{configRAII.config, contentStore}.assemble(*build(text));
    auto second = ImageAssembler{configRAII.config, contentStore}.assemble(*build(text));
    CHECK(first.getDigest() == second.getDigest());
    CHECK(first.manifest.config.digest == second.manifest.config.digest);
    CHECK_EQUAL(std::string{"1970-01-01T00:00:00Z"}, first.configuration.created);
}

TEST(ImageAssemblerTestGroup, empty_image) {
    auto image = ImageAssembler{configRAII.config, contentStore}.assemble(*build("FROM scratch\nUSER nobody\n"));
    CHECK(image.manifest.layers.empty());
    CHECK(image.configuration.diffIDs.empty());
    CHECK_EQUAL(1, image.configuration.history.size());
}

TEST(ImageAssemblerTestGroup, incomplete_stage) {
    auto definition = dockerfile::Parser{}.parse("FROM scratch\n").stages[0];
    auto stage = build_engine::Stage{definition};
    CHECK_THROWS(libstratum::Error, ImageAssembler(configRAII.config, contentStore).assemble(stage));

    stage.start();
    CHECK_THROWS(libstratum::Error, ImageAssembler(configRAII.config, contentStore).assemble(stage));
}

TEST(ImageAssemblerTestGroup, missing_layer) {
    // a layer that is neither in the store nor carries its bytes
    auto changeset = build_engine::Changeset{};
    changeset.upserts["/file"] = build_engine::FileEntry::makeFile("content");
    auto layer = build_engine::Layer::create(changeset, "COPY file /file");
    layer.blob.reset();

    auto stage = build_engine::Stage{dockerfile::Parser{}.parse("FROM scratch\n").stages[0]};
    stage.start();
    auto base = build_engine::ImageState{};
    base.layers.push_back(layer);
    stage.inheritBase(base);
    stage.complete();

    try {
        ImageAssembler{configRAII.config, contentStore}.assemble(stage);
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
