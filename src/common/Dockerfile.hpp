/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_common_Dockerfile_hpp
#define stratum_common_Dockerfile_hpp

#include <string>
#include <vector>
#include <cstddef>

#include <boost/optional.hpp>

#include "common/Instruction.hpp"

namespace stratum {
namespace common {

/**
 * A build stage: a FROM instruction followed by the instructions up to the next FROM.
 * The FROM instruction itself is kept apart from the stage's instructions.
 */
struct StageDefinition {
    std::size_t index = 0;
    boost::optional<std::string> name;
    std::string baseReference;
    Instruction from;
    std::vector<Instruction> instructions;

    std::string getDisplayName() const;
};

struct Dockerfile {
    // ARG instructions preceding the first FROM
    std::vector<Instruction> globalArgs;
    std::vector<StageDefinition> stages;
};

}
}

#endif
