/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Dockerfile.hpp"

namespace stratum {
namespace common {

std::string StageDefinition::getDisplayName() const {
    if(name) {
        return "'" + *name + "' (#" + std::to_string(index) + ")";
    }
    return "#" + std::to_string(index);
}

}
}
