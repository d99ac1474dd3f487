/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/BuildEngine.hpp"

#include <future>
#include <algorithm>
#include <ctime>

#include <boost/algorithm/string.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/process.hpp"
#include "build_engine/VariableExpansion.hpp"


namespace stratum {
namespace build_engine {

namespace {

/**
 * Resolves FROM and COPY --from of one stage: references to other stages yield
 * their result, anything else is an image of the local store.
 */
class StageSourceResolver : public SourceResolver {
public:
    StageSourceResolver(const std::vector<std::shared_ptr<Stage>>& stages,
                        const StageGraph& graph,
                        std::size_t currentStage,
                        std::shared_ptr<const BaseImageResolver> baseImageResolver)
        : stages(stages)
        , graph(graph)
        , currentStage{currentStage}
        , baseImageResolver{std::move(baseImageResolver)}
    {}

    std::shared_ptr<const ImageState> resolve(const std::string& reference) const override {
        auto index = graph.findStage(reference);
        if(index && *index != currentStage) {
            return stages.at(*index)->getResult();
        }
        if(!baseImageResolver) {
            auto message = boost::format("Image '%s' not found: no local image store available") % reference;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
        }
        return baseImageResolver->resolve(reference);
    }

private:
    const std::vector<std::shared_ptr<Stage>>& stages;
    const StageGraph& graph;
    std::size_t currentStage;
    std::shared_ptr<const BaseImageResolver> baseImageResolver;
};

}

BuildEngine::BuildEngine(std::shared_ptr<const common::Config> config,
                         std::shared_ptr<const storage::ContentStore> contentStore,
                         std::shared_ptr<const BuildContext> context,
                         std::shared_ptr<CommandExecutor> executor,
                         std::shared_ptr<const BaseImageResolver> baseImageResolver)
    : config{std::move(config)}
    , contentStore{std::move(contentStore)}
    , context{std::move(context)}
    , executor{std::move(executor)}
    , baseImageResolver{std::move(baseImageResolver)}
    , created{getCreatedTimestamp()}
{}

std::shared_ptr<const Stage> BuildEngine::build(const common::Dockerfile& dockerfile) {
    auto globalArgs = evaluateGlobalArgs(dockerfile);
    auto graph = StageGraph{dockerfile, globalArgs, config->commandBuild.buildArgs};

    stages.clear();
    for(const auto& definition : dockerfile.stages) {
        stages.push_back(std::make_shared<Stage>(definition));
    }

    auto target = graph.resolveTarget(config->commandBuild.target);
    auto required = graph.getRequiredStages(target);
    for(const auto& stage : stages) {
        if(std::find(required.cbegin(), required.cend(), stage->getDefinition().index) == required.cend()) {
            printLog(boost::format("Skipping stage %s: not needed by target stage %s")
                     % stage->getDisplayName() % stages[target]->getDisplayName(), libstratum::LogLevel::INFO);
        }
    }

    auto waves = std::vector<std::vector<std::size_t>>{};
    if(config->commandBuild.parallelStages) {
        waves = graph.makeWaves(required);
    }
    else {
        for(auto stage : required) {
            waves.push_back({stage});
        }
    }

    for(const auto& wave : waves) {
        runWave(wave, graph, globalArgs);
    }

    printLog(boost::format("Built target stage %s with %d layer(s)")
             % stages[target]->getDisplayName() % stages[target]->getLayers().size(), libstratum::LogLevel::INFO);
    return stages[target];
}

/**
 * The creation time recorded in history entries and image configs. It is fixed so
 * that builds are reproducible; SOURCE_DATE_EPOCH selects another one.
 */
std::string BuildEngine::getCreatedTimestamp() {
    auto epoch = std::time_t{0};
    auto sourceDateEpoch = libstratum::process::getEnvironmentVariable("SOURCE_DATE_EPOCH");
    if(sourceDateEpoch) {
        try {
            epoch = static_cast<std::time_t>(std::stoll(*sourceDateEpoch));
        }
        catch(const std::exception& e) {
            auto message = boost::format("Invalid SOURCE_DATE_EPOCH '%s'") % *sourceDateEpoch;
            STRATUM_RETHROW_ERROR(e, message.str());
        }
    }

    struct tm time;
    gmtime_r(&epoch, &time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &time);
    return buffer;
}

/**
 * The values of the ARGs declared before the first FROM. They are visible to the
 * FROM lines and, when re-declared, inside the stages.
 */
std::map<std::string, std::string> BuildEngine::evaluateGlobalArgs(const common::Dockerfile& dockerfile) const {
    const auto& buildArgs = config->commandBuild.buildArgs;
    auto globalArgs = std::map<std::string, std::string>{};

    for(const auto& instruction : dockerfile.globalArgs) {
        for(const auto& argument : instruction.arguments) {
            auto equal = argument.find('=');
            auto name = argument.substr(0, equal);
            auto buildArg = buildArgs.find(name);
            if(buildArg != buildArgs.cend()) {
                globalArgs[name] = buildArg->second;
            }
            else if(equal != std::string::npos) {
                globalArgs[name] = expandVariables(argument.substr(equal + 1), globalArgs);
            }
        }
    }

    return globalArgs;
}

void BuildEngine::runWave(const std::vector<std::size_t>& wave, const StageGraph& graph,
                          const std::map<std::string, std::string>& globalArgs) {
    if(wave.size() == 1) {
        runStage(*stages[wave.front()], graph, globalArgs);
        return;
    }

    printLog(boost::format("Building %d independent stages concurrently") % wave.size(), libstratum::LogLevel::INFO);

    std::vector<std::future<void>> results;
    for(auto index : wave) {
        auto& stage = *stages[index];
        results.push_back(std::async(std::launch::async, [this, &stage, &graph, &globalArgs]() {
            runStage(stage, graph, globalArgs);
        }));
    }

    try {
        // check that all stages completed without throwing exceptions
        for(auto& result : results) {
            result.get();
        }
    }
    catch(const std::exception& e) {
        STRATUM_RETHROW_ERROR(e, "Build failed");
    }
}

void BuildEngine::runStage(Stage& stage, const StageGraph& graph, const std::map<std::string, std::string>& globalArgs) {
    const auto& definition = stage.getDefinition();
    auto logContext = libstratum::Logger::Context{"stage " + stage.getDisplayName()};
    auto resolver = std::make_shared<StageSourceResolver>(stages, graph, definition.index, baseImageResolver);
    auto builder = LayerBuilder{context, executor, resolver, config->commandBuild.buildArgs, created};
    builder.setGlobalArgs(globalArgs);

    stage.start();
    printLog(boost::format("Building stage %s from %s") % stage.getDisplayName() % definition.baseReference,
             libstratum::LogLevel::INFO);

    auto state = BuildState{};
    try {
        auto step = builder.apply(state, definition.from);
        stage.inheritBase(*step.base);
        state = step.state;
    }
    catch(libstratum::Error& e) {
        stage.fail(boost::none);
        auto message = boost::format("Stage %s failed at FROM %s (line %d)")
            % stage.getDisplayName() % definition.baseReference % definition.from.line;
        STRATUM_RETHROW_ERROR(e, message.str());
    }

    const auto& instructions = definition.instructions;
    for(std::size_t i = 0; i < instructions.size(); ++i) {
        const auto& instruction = instructions[i];
        printLog(boost::format("Stage %s step %d/%d: %s")
                 % stage.getDisplayName() % (i + 1) % instructions.size() % instruction.string(),
                 libstratum::LogLevel::GENERAL);
        try {
            auto step = builder.apply(state, instruction);
            if(step.layer) {
                storeLayer(*step.layer);
            }
            stage.recordInstruction(step.state.filesystem, step.state.metadata, step.layer, *step.history);
            state = std::move(step.state);
        }
        catch(libstratum::Error& e) {
            stage.fail(i);
            auto message = boost::format("Stage %s failed at instruction '%s' (line %d)")
                % stage.getDisplayName() % instruction.string() % instruction.line;
            STRATUM_RETHROW_ERROR(e, message.str());
        }
    }

    stage.complete();
    printLog(boost::format("Completed stage %s: %d layer(s), %d history entries")
             % stage.getDisplayName() % stage.getLayers().size() % stage.getHistory().size(), libstratum::LogLevel::INFO);
}

void BuildEngine::storeLayer(const Layer& layer) const {
    if(!layer.blob) {
        auto message = boost::format("Layer %s has no content to store") % layer.digest;
        STRATUM_THROW_ERROR(message.str());
    }
    auto digest = contentStore->put(*layer.blob);
    if(digest != layer.digest) {
        auto message = boost::format("Layer stored as %s, expected %s") % digest % layer.digest;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, message.str());
    }
    printLog(boost::format("Stored layer %s (diff_id %s, %d bytes)") % layer.digest % layer.diffID % layer.size,
             libstratum::LogLevel::INFO);
}

void BuildEngine::printLog(const boost::format& message, libstratum::LogLevel level) const {
    libstratum::Logger::getInstance().log(message, sysname, level);
}

}
}
