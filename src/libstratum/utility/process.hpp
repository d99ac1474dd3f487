/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_utility_process_hpp
#define libstratum_utility_process_hpp

#include <string>

#include <boost/optional.hpp>

/**
 * Utility functions to query the environment and the host machine
 */

namespace libstratum {
namespace process {

boost::optional<std::string> getEnvironmentVariable(const std::string& key);
std::string getMachineArchitecture();

}}

#endif
