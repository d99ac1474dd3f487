/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/StageGraph.hpp"

#include <algorithm>
#include <deque>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libstratum/Error.hpp"
#include "build_engine/VariableExpansion.hpp"


namespace stratum {
namespace build_engine {

namespace {

/**
 * ARG and ENV values seen by the instructions of a stage, with the same precedence
 * the LayerBuilder applies: build args over ARG defaults over global ARGs, ENV over ARG.
 */
class StageVariables {
public:
    StageVariables(const std::map<std::string, std::string>& globalArgs,
                   const std::map<std::string, std::string>& buildArgs)
        : globalArgs(globalArgs)
        , buildArgs(buildArgs)
    {}

    std::map<std::string, std::string> get() const {
        auto variables = args;
        for(const auto& variable : environment) {
            variables[variable.first] = variable.second;
        }
        return variables;
    }

    void apply(const common::Instruction& instruction) {
        if(instruction.kind == common::InstructionKind::ARG) {
            auto variables = get();
            for(const auto& argument : instruction.arguments) {
                auto equal = argument.find('=');
                auto name = argument.substr(0, equal);
                auto buildArg = buildArgs.find(name);
                auto globalArg = globalArgs.find(name);
                if(buildArg != buildArgs.cend()) {
                    args[name] = buildArg->second;
                }
                else if(equal != std::string::npos) {
                    args[name] = expandVariables(argument.substr(equal + 1), variables);
                }
                else if(globalArg != globalArgs.cend()) {
                    args[name] = globalArg->second;
                }
            }
        }
        else if(instruction.kind == common::InstructionKind::ENV) {
            auto variables = get();
            for(const auto& pair : instruction.arguments) {
                auto equal = pair.find('=');
                environment[pair.substr(0, equal)] = expandVariables(pair.substr(equal + 1), variables);
            }
        }
    }

private:
    const std::map<std::string, std::string>& globalArgs;
    const std::map<std::string, std::string>& buildArgs;
    std::map<std::string, std::string> args;
    std::map<std::string, std::string> environment;
};

}

StageGraph::StageGraph(const common::Dockerfile& dockerfile,
                       const std::map<std::string, std::string>& globalArgs,
                       const std::map<std::string, std::string>& buildArgs)
    : dockerfile(dockerfile)
    , dependencies(dockerfile.stages.size())
{
    for(const auto& stage : dockerfile.stages) {
        if(stage.name) {
            stageNames[*stage.name] = stage.index;
        }
    }

    for(const auto& stage : dockerfile.stages) {
        // "FROM image AS image" names the image, not the stage itself
        auto base = findStage(expandVariables(stage.baseReference, globalArgs));
        if(base && *base != stage.index) {
            dependencies[stage.index].insert(*base);
        }
        auto variables = StageVariables{globalArgs, buildArgs};
        for(const auto& instruction : stage.instructions) {
            if(instruction.sourceStage) {
                addDependency(stage.index, expandVariables(*instruction.sourceStage, variables.get()));
            }
            variables.apply(instruction);
        }
    }

    sort();
}

/**
 * Returns the index of the stage named by 'reference' (stage name or numeric index),
 * none if the reference names an image instead.
 */
boost::optional<std::size_t> StageGraph::findStage(const std::string& reference) const {
    auto name = stageNames.find(boost::algorithm::to_lower_copy(reference));
    if(name != stageNames.cend()) {
        return name->second;
    }
    if(boost::regex_match(reference, boost::regex{"^[0-9]+$"})) {
        auto index = std::stoul(reference);
        if(index < dockerfile.stages.size()) {
            return static_cast<std::size_t>(index);
        }
    }
    return boost::none;
}

const std::set<std::size_t>& StageGraph::getDependencies(std::size_t stage) const {
    return dependencies.at(stage);
}

/**
 * The stage to build: the one named by 'target', or the last one.
 */
std::size_t StageGraph::resolveTarget(const boost::optional<std::string>& target) const {
    if(!target) {
        return dockerfile.stages.size() - 1;
    }
    auto index = findStage(*target);
    if(!index) {
        auto message = boost::format("Target stage '%s' not found in the Dockerfile") % *target;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }
    return *index;
}

/**
 * The target and all the stages it transitively depends on, in execution order.
 */
std::vector<std::size_t> StageGraph::getRequiredStages(std::size_t target) const {
    auto required = std::set<std::size_t>{};
    auto pending = std::deque<std::size_t>{target};
    while(!pending.empty()) {
        auto stage = pending.front();
        pending.pop_front();
        if(required.insert(stage).second) {
            pending.insert(pending.end(), dependencies[stage].cbegin(), dependencies[stage].cend());
        }
    }

    auto ordered = std::vector<std::size_t>{};
    for(auto stage : executionOrder) {
        if(required.count(stage)) {
            ordered.push_back(stage);
        }
    }
    return ordered;
}

/**
 * Groups the stages in waves: the stages of a wave only depend on stages of
 * earlier waves and can be built concurrently.
 */
std::vector<std::vector<std::size_t>> StageGraph::makeWaves(const std::vector<std::size_t>& stages) const {
    auto level = std::map<std::size_t, std::size_t>{};
    auto waves = std::vector<std::vector<std::size_t>>{};

    // 'stages' is in execution order, so dependencies get their level first
    for(auto stage : stages) {
        std::size_t stageLevel = 0;
        for(auto dependency : dependencies[stage]) {
            auto it = level.find(dependency);
            if(it != level.cend()) {
                stageLevel = std::max(stageLevel, it->second + 1);
            }
        }
        level[stage] = stageLevel;
        if(waves.size() <= stageLevel) {
            waves.resize(stageLevel + 1);
        }
        waves[stageLevel].push_back(stage);
    }

    return waves;
}

void StageGraph::addDependency(std::size_t stage, const std::string& reference) {
    auto dependency = findStage(reference);
    if(dependency) {
        dependencies[stage].insert(*dependency);
    }
}

void StageGraph::sort() {
    auto inDegree = std::vector<std::size_t>(dependencies.size(), 0);
    auto dependents = std::vector<std::vector<std::size_t>>(dependencies.size());
    for(std::size_t stage = 0; stage < dependencies.size(); ++stage) {
        inDegree[stage] = dependencies[stage].size();
        for(auto dependency : dependencies[stage]) {
            dependents[dependency].push_back(stage);
        }
    }

    auto ready = std::deque<std::size_t>{};
    for(std::size_t stage = 0; stage < inDegree.size(); ++stage) {
        if(inDegree[stage] == 0) {
            ready.push_back(stage);
        }
    }

    executionOrder.clear();
    while(!ready.empty()) {
        auto stage = ready.front();
        ready.pop_front();
        executionOrder.push_back(stage);
        for(auto dependent : dependents[stage]) {
            if(--inDegree[dependent] == 0) {
                ready.push_back(dependent);
            }
        }
    }

    if(executionOrder.size() != dependencies.size()) {
        auto involved = std::vector<std::string>{};
        for(std::size_t stage = 0; stage < inDegree.size(); ++stage) {
            if(inDegree[stage] > 0) {
                involved.push_back(dockerfile.stages[stage].getDisplayName());
            }
        }
        auto message = boost::format("Cyclic dependency between stages %s") % boost::algorithm::join(involved, ", ");
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::CyclicStageDependency, message.str());
    }
}

}
}
