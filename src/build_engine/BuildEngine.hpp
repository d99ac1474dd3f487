/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_BuildEngine_hpp
#define stratum_build_engine_BuildEngine_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/Dockerfile.hpp"
#include "storage/ContentStore.hpp"
#include "build_engine/BuildContext.hpp"
#include "build_engine/CommandExecutor.hpp"
#include "build_engine/BaseImageResolver.hpp"
#include "build_engine/LayerBuilder.hpp"
#include "build_engine/Stage.hpp"
#include "build_engine/StageGraph.hpp"


namespace stratum {
namespace build_engine {

/**
 * Runs a multi-stage build.
 *
 * The stage graph is sorted before anything executes. Only the target stage and the
 * stages it depends on are built, in waves of independent stages that run
 * concurrently when parallel stages are enabled. Inside a stage the instructions run
 * strictly in order. Every layer is stored in the content store as soon as it is
 * produced, so a failed build leaves the layers of the completed steps reusable.
 */
class BuildEngine {
public:
    BuildEngine(std::shared_ptr<const common::Config> config,
                std::shared_ptr<const storage::ContentStore> contentStore,
                std::shared_ptr<const BuildContext> context,
                std::shared_ptr<CommandExecutor> executor,
                std::shared_ptr<const BaseImageResolver> baseImageResolver);

    std::shared_ptr<const Stage> build(const common::Dockerfile& dockerfile);
    const std::vector<std::shared_ptr<Stage>>& getStages() const { return stages; }

    static std::string getCreatedTimestamp();

private:
    std::map<std::string, std::string> evaluateGlobalArgs(const common::Dockerfile& dockerfile) const;
    void runWave(const std::vector<std::size_t>& wave, const StageGraph& graph,
                 const std::map<std::string, std::string>& globalArgs);
    void runStage(Stage& stage, const StageGraph& graph, const std::map<std::string, std::string>& globalArgs);
    void storeLayer(const Layer& layer) const;
    void printLog(const boost::format& message, libstratum::LogLevel level) const;

private:
    const std::string sysname = "BuildEngine";
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<const storage::ContentStore> contentStore;
    std::shared_ptr<const BuildContext> context;
    std::shared_ptr<CommandExecutor> executor;
    std::shared_ptr<const BaseImageResolver> baseImageResolver;
    std::vector<std::shared_ptr<Stage>> stages;
    std::string created;
};

}
}

#endif
