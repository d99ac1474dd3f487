/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_ErrorCode_hpp
#define libstratum_ErrorCode_hpp

#include <string>

namespace libstratum {

/**
 * Classification of the failure carried by a libstratum::Error.
 * Errors that don't fit any specific class are "Generic".
 */
enum class ErrorCode {
    Generic,
    ParseError,
    CyclicStageDependency,
    ExecutionError,
    DigestMismatch,
    NotFound,
    NetworkError
};

std::string errorCodeToString(ErrorCode code);

}

#endif
