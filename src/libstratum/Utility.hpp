/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_Utility_hpp
#define libstratum_Utility_hpp

/*
 * All utility headers.
 * Prefer including the individual headers in new code.
 */

#include "libstratum/utility/filesystem.hpp"
#include "libstratum/utility/json.hpp"
#include "libstratum/utility/logging.hpp"
#include "libstratum/utility/process.hpp"
#include "libstratum/utility/string.hpp"

#endif
