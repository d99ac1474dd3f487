/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_VariableExpansion_hpp
#define stratum_build_engine_VariableExpansion_hpp

#include <string>
#include <map>


namespace stratum {
namespace build_engine {

/**
 * Replaces $NAME, ${NAME}, ${NAME:-default} and ${NAME:+alternative} with the values
 * of 'variables'. Undefined variables expand to the empty string, "\$" is a literal '$'.
 */
std::string expandVariables(const std::string& input, const std::map<std::string, std::string>& variables);

}
}

#endif
