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
#include <vector>
#include <set>
#include <map>
#include <algorithm>

#include "libstratum/Error.hpp"
#include "dockerfile/Parser.hpp"
#include "build_engine/StageGraph.hpp"
#include "test_utility/unittest_main_function.hpp"

namespace stratum {
namespace build_engine {
namespace test {

using Indices = std::vector<std::size_t>;

TEST_GROUP(StageGraphTestGroup) {
    const std::map<std::string, std::string> noArgs;
};

TEST(StageGraphTestGroup, single_stage) {
    auto parsed = dockerfile::Parser{}.parse("FROM alpine:3.18\nRUN make\n");
    auto graph = StageGraph{parsed, noArgs};
    CHECK(graph.getExecutionOrder() == Indices{0});
    CHECK(graph.getDependencies(0).empty());
    CHECK_EQUAL(0, graph.resolveTarget(boost::none));
    CHECK(graph.getRequiredStages(0) == Indices{0});
}

TEST(StageGraphTestGroup, findStage) {
    auto parsed = dockerfile::Parser{}.parse(
        "FROM alpine AS Builder\n"
        "FROM alpine AS tester\n"
        "FROM scratch\n");
    auto graph = StageGraph{parsed, noArgs};
    CHECK(*graph.findStage("builder") == 0);
    CHECK(*graph.findStage("BUILDER") == 0);
    CHECK(*graph.findStage("tester") == 1);
    CHECK(*graph.findStage("2") == 2);
    CHECK(!graph.findStage("3"));
    CHECK(!graph.findStage("alpine"));
    CHECK(!graph.findStage("docker.io/library/builder:latest"));
}

TEST(StageGraphTestGroup, dependencies) {
    auto parsed = dockerfile::Parser{}.parse(
        "FROM alpine AS base\n"
        "FROM base AS build\n"
        "COPY --from=0 /etc/os-release /\n"
        "FROM alpine AS docs\n"
        "FROM scratch AS final\n"
        "COPY --from=build /out /app\n"
        "COPY --from=busybox:1.36 /bin/busybox /bin/\n");
    auto graph = StageGraph{parsed, noArgs};

    CHECK(graph.getDependencies(0).empty());
    CHECK(graph.getDependencies(1) == std::set<std::size_t>{0});
    CHECK(graph.getDependencies(2).empty());
    CHECK(graph.getDependencies(3) == std::set<std::size_t>{1}); // external images are no stages

    // a stage is ordered after all its dependencies
    auto order = graph.getExecutionOrder();
    CHECK_EQUAL(4, order.size());
    auto position = [&order](std::size_t stage) {
        return std::find(order.cbegin(), order.cend(), stage) - order.cbegin();
    };
    CHECK(position(0) < position(1));
    CHECK(position(1) < position(3));
}

TEST(StageGraphTestGroup, from_with_the_same_name) {
    // the stage is named after the image it starts from, it doesn't depend on itself
    auto parsed = dockerfile::Parser{}.parse("FROM golang AS golang\nRUN go build\n");
    auto graph = StageGraph{parsed, noArgs};
    CHECK(graph.getDependencies(0).empty());
}

TEST(StageGraphTestGroup, global_args_in_from) {
    auto parsed = dockerfile::Parser{}.parse(
        "ARG BASE=builder\n"
        "FROM alpine AS builder\n"
        "FROM ${BASE}\n");
    auto graph = StageGraph{parsed, {{"BASE", "builder"}}};
    CHECK(graph.getDependencies(1) == std::set<std::size_t>{0});

    auto other = StageGraph{parsed, {{"BASE", "ubuntu"}}};
    CHECK(other.getDependencies(1).empty());
}

TEST(StageGraphTestGroup, variables_in_copy_from) {
    auto parsed = dockerfile::Parser{}.parse(
        "ARG GLOBAL_SRC=first\n"
        "FROM scratch AS builder\n"
        "FROM scratch AS first\n"
        "FROM scratch\n"
        "ARG SRC=builder\n"
        "COPY --from=$SRC /out /out\n"
        "ARG GLOBAL_SRC\n"
        "COPY --from=${GLOBAL_SRC} /out /out\n"
        "FROM scratch\n"
        "ENV SRC=1\n"
        "COPY --from=${SRC} /out /out\n");
    auto graph = StageGraph{parsed, {{"GLOBAL_SRC", "first"}}};
    CHECK((graph.getDependencies(2) == std::set<std::size_t>{0, 1}));
    CHECK(graph.getDependencies(3) == std::set<std::size_t>{1});
    CHECK((graph.getRequiredStages(2) == Indices{0, 1, 2}));

    // build args override the ARG default
    auto overridden = StageGraph{parsed, {{"GLOBAL_SRC", "first"}}, {{"SRC", "1"}}};
    CHECK(overridden.getDependencies(2) == std::set<std::size_t>{1});
}

TEST(StageGraphTestGroup, cycles) {
    auto parsed = dockerfile::Parser{}.parse(
        "FROM b AS a\n"
        "FROM a AS b\n");
    try {
        StageGraph{parsed, noArgs};
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::CyclicStageDependency);
        CHECK(e.getErrorTrace().back().errorMessage.find("Cyclic dependency between stages") != std::string::npos);
    }

    // through COPY --from, involving only some of the stages
    parsed = dockerfile::Parser{}.parse(
        "FROM alpine AS independent\n"
        "FROM alpine AS first\n"
        "COPY --from=third /a /a\n"
        "FROM first AS second\n"
        "FROM second AS third\n");
    try {
        StageGraph{parsed, noArgs};
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::CyclicStageDependency);
        const auto& message = e.getErrorTrace().back().errorMessage;
        CHECK(message.find("first") != std::string::npos);
        CHECK(message.find("third") != std::string::npos);
        CHECK(message.find("independent") == std::string::npos);
    }

    // a stage copying from itself
    parsed = dockerfile::Parser{}.parse(
        "FROM alpine AS self\n"
        "COPY --from=self /a /b\n");
    try {
        StageGraph{parsed, noArgs};
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::CyclicStageDependency);
    }
}

TEST(StageGraphTestGroup, resolveTarget) {
    auto parsed = dockerfile::Parser{}.parse(
        "FROM alpine AS build\n"
        "FROM alpine AS test\n"
        "FROM scratch\n");
    auto graph = StageGraph{parsed, noArgs};
    CHECK_EQUAL(2, graph.resolveTarget(boost::none));
    CHECK_EQUAL(1, graph.resolveTarget(std::string{"test"}));
    CHECK_EQUAL(0, graph.resolveTarget(std::string{"0"}));

    try {
        graph.resolveTarget(std::string{"release"});
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getErrorCode() == libstratum::ErrorCode::NotFound);
    }
}

TEST(StageGraphTestGroup, required_stages_and_waves) {
    auto parsed = dockerfile::Parser{}.parse(
        "FROM alpine AS deps\n"
        "FROM deps AS frontend\n"
        "FROM deps AS backend\n"
        "FROM alpine AS unrelated\n"
        "FROM scratch AS release\n"
        "COPY --from=frontend /dist /www\n"
        "COPY --from=backend /bin/server /bin/server\n");
    auto graph = StageGraph{parsed, noArgs};

    auto required = graph.getRequiredStages(graph.resolveTarget(boost::none));
    CHECK_EQUAL(4, required.size());
    CHECK(std::find(required.cbegin(), required.cend(), 3) == required.cend());
    CHECK_EQUAL(0, required.front());
    CHECK_EQUAL(4, required.back());

    auto waves = graph.makeWaves(required);
    CHECK_EQUAL(3, waves.size());
    CHECK(waves[0] == Indices{0});
    CHECK((waves[1] == Indices{1, 2}));
    CHECK(waves[2] == Indices{4});

    // a target in the middle only needs what it depends on
    CHECK((graph.getRequiredStages(graph.resolveTarget(std::string{"backend"})) == Indices{0, 2}));
    CHECK(graph.getRequiredStages(3) == Indices{3});

    // independent stages share the first wave
    auto all = graph.makeWaves(graph.getExecutionOrder());
    CHECK_EQUAL(3, all.size());
    CHECK((all[0] == Indices{0, 3}));
}

}}}

STRATUM_UNITTEST_MAIN_FUNCTION();
