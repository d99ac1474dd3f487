/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_utility_logging_hpp
#define libstratum_utility_logging_hpp

#include <string>

#include <boost/format.hpp>

#include "libstratum/Logger.hpp"

/**
 * Utility functions for output controls
 */

namespace libstratum {

void logMessage(const std::string&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);
void logMessage(const boost::format&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);

}

#endif
