/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_LogLevel_hpp
#define libstratum_LogLevel_hpp

namespace libstratum {

enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

}

#endif
