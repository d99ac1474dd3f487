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
#include "dockerfile/Parser.hpp"
#include "storage/ContentStore.hpp"
#include "build_engine/BuildEngine.hpp"
#include "test_utility/config.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace build_engine {
namespace test {

// writes /built-by-run, fails commands containing "exit 1"
class FakeExecutor : public CommandExecutor {
public:
    Changeset execute(const ExecutionRequest& request, const FilesystemState&) override {
        if(request.command.string().find("exit 1") != std::string::npos) {
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ExecutionError, "command returned exit code 1");
        }
        auto changeset = Changeset{};
        changeset.upserts["/built-by-run"] = FileEntry::makeFile(request.command.string());
        return changeset;
    }
    std::string getName() const override { return "fake"; }
};

TEST_GROUP(BuildEngineTestGroup) {
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    std::shared_ptr<storage::ContentStore> contentStore;
    std::shared_ptr<BuildContext> context;

    void setup() {
        const auto& contextDir = configRAII.config->commandBuild.contextDir;
        test_utility::filesystem::createFile(contextDir / "app.py", "print('hello')\n");
        test_utility::filesystem::createFile(contextDir / "README", "readme\n");
        contentStore = std::make_shared<storage::ContentStore>(configRAII.config->directories.store);
        context = std::make_shared<BuildContext>(contextDir);
        unsetenv("SOURCE_DATE_EPOCH");
    }

    BuildEngine makeEngine(std::shared_ptr<CommandExecutor> executor = std::make_shared<SimulatedExecutor>()) {
        return BuildEngine{configRAII.config, contentStore, context, std::move(executor), nullptr};
    }
};

TEST(BuildEngineTestGroup, single_stage) {
    auto engine = makeEngine();
    auto result = engine.build(dockerfile::Parser{}.parse(
        "FROM scratch\n"
        "COPY app.py /app/\n"
        "CMD [\"python\", \"/app/app.py\"]\n"));

    CHECK(result->getStatus() == StageStatus::Completed);
    CHECK_EQUAL(1, result->getLayers().size());
    CHECK_EQUAL(2, result->getHistory().size());
    CHECK(!result->getHistory()[0].emptyLayer);
    CHECK(result->getHistory()[1].emptyLayer);
    CHECK_EQUAL(std::string{"1970-01-01T00:00:00Z"}, result->getHistory()[0].created);
    CHECK((*result->getMetadata().cmd == libstratum::CLIArguments{"python", "/app/app.py"}));
    CHECK(result->getFinalFilesystemState().exists("/app/app.py"));

    // layers are in the content store as soon as they are built
    CHECK(contentStore->has(result->getLayers()[0].digest));
    CHECK_EQUAL(result->getLayers()[0].size, contentStore->size(result->getLayers()[0].digest));
}

TEST(BuildEngineTestGroup, simulated_run) {
    auto engine = makeEngine();
    auto result = engine.build(dockerfile::Parser{}.parse(
        "FROM scratch\n"
        "RUN pip install flask\n"
        "COPY app.py /app.py\n"));
    CHECK_EQUAL(1, result->getLayers().size());
    CHECK_EQUAL(2, result->getHistory().size());
    CHECK(result->getHistory()[0].emptyLayer);
    CHECK(!result->getFinalFilesystemState().exists("/built-by-run"));
}

TEST(BuildEngineTestGroup, executed_run) {
    auto engine = makeEngine(std::make_shared<FakeExecutor>());
    auto result = engine.build(dockerfile::Parser{}.parse(
        "FROM scratch\n"
        "RUN make\n"));
    CHECK_EQUAL(1, result->getLayers().size());
    CHECK(result->getFinalFilesystemState().exists("/built-by-run"));
}

TEST(BuildEngineTestGroup, failed_instruction) {
    auto engine = makeEngine(std::make_shared<FakeExecutor>());
    try {
        engine.build(dockerfile::Parser{}.parse(
            "FROM scratch\n"
            "COPY app.py /app.py\n"
            "RUN exit 1\n"
            "COPY README /README\n"));
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::ExecutionError);
        CHECK(e.getErrorTrace().back().errorMessage.find("line 3") != std::string::npos);
    }

    const auto& stage = *engine.getStages().at(0);
    CHECK(stage.getStatus() == StageStatus::Failed);
    CHECK(*stage.getFailedInstruction() == 1);
    CHECK_EQUAL(1, stage.getExecutedInstructionCount());

    // the layer built before the failure stays in the content store
    CHECK_EQUAL(1, stage.getLayers().size());
    CHECK(contentStore->has(stage.getLayers()[0].digest));
    CHECK_EQUAL(1, contentStore->list().size());
}

TEST(BuildEngineTestGroup, multi_stage) {
    auto engine = makeEngine();
    auto result = engine.build(dockerfile::Parser{}.parse(
        "FROM scratch AS build\n"
        "COPY app.py /out/app.py\n"
        "COPY README /out/README\n"
        "FROM scratch AS unused\n"
        "COPY README /README\n"
        "FROM scratch\n"
        "COPY --from=build /out/app.py /app.py\n"));

    const auto& stages = engine.getStages();
    CHECK_EQUAL(3, stages.size());
    CHECK(stages[0]->getStatus() == StageStatus::Completed);
    CHECK(stages[1]->getStatus() == StageStatus::Pending); // not needed by the target
    CHECK(stages[2]->getStatus() == StageStatus::Completed);
    CHECK(result == stages[2]);

    // the final image only carries its own layers
    CHECK_EQUAL(1, result->getLayers().size());
    CHECK(result->getFinalFilesystemState().exists("/app.py"));
    CHECK(!result->getFinalFilesystemState().exists("/out/README"));
}

TEST(BuildEngineTestGroup, stage_as_base) {
    auto engine = makeEngine();
    auto result = engine.build(dockerfile::Parser{}.parse(
        "FROM scratch AS base\n"
        "COPY README /README\n"
        "ENV MODE=production\n"
        "FROM base\n"
        "COPY app.py /app.py\n"));
    CHECK_EQUAL(2, result->getLayers().size());
    CHECK_EQUAL(1, result->getBaseLayerCount());
    CHECK_EQUAL(3, result->getHistory().size());
    CHECK(*result->getMetadata().getEnvironmentVariable("MODE") == "production");
    CHECK(result->getFinalFilesystemState().exists("/README"));
}

TEST(BuildEngineTestGroup, parallel_stages) {
    for(auto parallel : {true, false}) {
        configRAII.config->commandBuild.parallelStages = parallel;
        auto engine = makeEngine();
        auto result = engine.build(dockerfile::Parser{}.parse(
            "FROM scratch AS first\n"
            "COPY app.py /first/app.py\n"
            "FROM scratch AS second\n"
            "COPY README /second/README\n"
            "FROM scratch\n"
            "COPY --from=first /first /first\n"
            "COPY --from=second /second /second\n"));
        CHECK_EQUAL(2, result->getLayers().size());
        CHECK(result->getFinalFilesystemState().exists("/first/app.py"));
        CHECK(result->getFinalFilesystemState().exists("/second/README"));
    }
}

TEST(BuildEngineTestGroup, target) {
    configRAII.config->commandBuild.target = std::string{"build"};
    auto engine = makeEngine();
    auto result = engine.build(dockerfile::Parser{}.parse(
        "FROM scratch AS build\n"
        "COPY app.py /app.py\n"
        "FROM scratch\n"
        "COPY README /README\n"));
    CHECK_EQUAL(std::string{"build"}, *result->getDefinition().name);
    CHECK(engine.getStages()[1]->getStatus() == StageStatus::Pending);

    configRAII.config->commandBuild.target = std::string{"release"};
    try {
        makeEngine().build(dockerfile::Parser{}.parse("FROM scratch\n"));
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
}

TEST(BuildEngineTestGroup, build_args) {
    configRAII.config->commandBuild.buildArgs = {{"BASE", "builder"}, {"FILE", "README"}};
    auto engine = makeEngine();
    auto result = engine.build(dockerfile::Parser{}.parse(
        "ARG BASE=scratch\n"
        "FROM scratch AS builder\n"
        "COPY app.py /app.py\n"
        "FROM ${BASE}\n"
        "ARG FILE=app.py\n"
        "COPY ${FILE} /copied\n"));
    CHECK(result->getFinalFilesystemState().exists("/app.py"));
    CHECK_EQUAL(std::string{"readme\n"}, *result->getFinalFilesystemState().find("/copied")->content);
}

TEST(BuildEngineTestGroup, copy_from_stage_named_by_variable) {
    auto engine = makeEngine();
    auto result = engine.build(dockerfile::Parser{}.parse(
        "FROM scratch AS builder\n"
        "COPY app.py /out/app.py\n"
        "FROM scratch\n"
        "ARG SRC=builder\n"
        "COPY --from=$SRC /out/app.py /app.py\n"));

    const auto& stages = engine.getStages();
    CHECK(stages[0]->getStatus() == StageStatus::Completed);
    CHECK(result == stages[1]);
    CHECK_EQUAL(std::string{"print('hello')\n"}, *result->getFinalFilesystemState().find("/app.py")->content);

    configRAII.config->commandBuild.buildArgs = {{"SRC", "0"}};
    result = makeEngine().build(dockerfile::Parser{}.parse(
        "FROM scratch AS builder\n"
        "COPY README /out/app.py\n"
        "FROM scratch\n"
        "ARG SRC=missing\n"
        "COPY --from=${SRC} /out/app.py /app.py\n"));
    CHECK_EQUAL(std::string{"readme\n"}, *result->getFinalFilesystemState().find("/app.py")->content);
}

TEST(BuildEngineTestGroup, cyclic_dependency) {
    auto engine = makeEngine();
    try {
        engine.build(dockerfile::Parser{}.parse(
            "FROM scratch AS a\n"
            "COPY --from=b /x /x\n"
            "FROM scratch AS b\n"
            "COPY --from=a /y /y\n"));
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::CyclicStageDependency);
    }
    CHECK(contentStore->list().empty());
}

TEST(BuildEngineTestGroup, missing_base_image) {
    auto engine = makeEngine();
    try {
        engine.build(dockerfile::Parser{}.parse("FROM alpine:3.18\n"));
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
    CHECK(engine.getStages()[0]->getStatus() == StageStatus::Failed);
    CHECK(!engine.getStages()[0]->getFailedInstruction());
}

TEST(BuildEngineTestGroup, reproducible_layers) {
    auto text = std::string{
        "FROM scratch\n"
        "COPY . /src\n"
        "RUN make\n"};
    auto first = makeEngine(std::make_shared<FakeExecutor>()).build(dockerfile::Parser{}.parse(text));
    auto second = makeEngine(std::make_shared<FakeExecutor>()).build(dockerfile::Parser{}.parse(text));
    CHECK_EQUAL(2, first->getLayers().size());
    for(std::size_t i = 0; i < first->getLayers().size(); ++i) {
        CHECK(first->getLayers()[i].digest == second->getLayers()[i].digest);
        CHECK(first->getLayers()[i].diffID == second->getLayers()[i].diffID);
    }
}

TEST(BuildEngineTestGroup, created_timestamp) {
    CHECK_EQUAL(std::string{"1970-01-01T00:00:00Z"}, BuildEngine::getCreatedTimestamp());

    setenv("SOURCE_DATE_EPOCH", "1700000000", 1);
    CHECK_EQUAL(std::string{"2023-11-14T22:13:20Z"}, BuildEngine::getCreatedTimestamp());

    setenv("SOURCE_DATE_EPOCH", "yesterday", 1);
    CHECK_THROWS(libstratum::Error, BuildEngine::getCreatedTimestamp());
    unsetenv("SOURCE_DATE_EPOCH");
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
