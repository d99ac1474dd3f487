/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_StageGraph_hpp
#define stratum_build_engine_StageGraph_hpp

#include <string>
#include <vector>
#include <map>
#include <set>
#include <cstddef>

#include <boost/optional.hpp>

#include "common/Dockerfile.hpp"


namespace stratum {
namespace build_engine {

/**
 * Dependency graph of the stages of a Dockerfile. A stage depends on the stages it
 * names as FROM base or as COPY --from source, by name or by index.
 *
 * A --from reference may use the ARG and ENV values of its stage.
 *
 * The graph is sorted topologically (Kahn's algorithm) on construction, a cycle
 * raises an error with code CyclicStageDependency.
 */
class StageGraph {
public:
    StageGraph(const common::Dockerfile& dockerfile,
               const std::map<std::string, std::string>& globalArgs,
               const std::map<std::string, std::string>& buildArgs = {});

    boost::optional<std::size_t> findStage(const std::string& reference) const;
    const std::set<std::size_t>& getDependencies(std::size_t stage) const;
    std::size_t resolveTarget(const boost::optional<std::string>& target) const;
    std::vector<std::size_t> getRequiredStages(std::size_t target) const;
    std::vector<std::vector<std::size_t>> makeWaves(const std::vector<std::size_t>& stages) const;
    const std::vector<std::size_t>& getExecutionOrder() const { return executionOrder; }

private:
    void addDependency(std::size_t stage, const std::string& reference);
    void sort();

private:
    const common::Dockerfile& dockerfile;
    std::map<std::string, std::size_t> stageNames;
    std::vector<std::set<std::size_t>> dependencies;
    std::vector<std::size_t> executionOrder;
};

}
}

#endif
