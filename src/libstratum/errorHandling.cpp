/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <ios>
#include <stdexcept>
#include <system_error>

namespace libstratum {

std::string getExceptionTypeString(const std::exception& e) {
    auto ret = std::string("generic exception");
    if (dynamic_cast<const std::logic_error*>(&e)) {
        ret = std::string("logic error");
    }
    else if (dynamic_cast<const std::system_error*>(&e)) {
        ret = std::string("system error");
    }
    else if (dynamic_cast<const std::ios_base::failure*>(&e)) {
        ret = std::string("ios_base failure");
    }
    else if (dynamic_cast<const std::runtime_error*>(&e)) {
        ret = std::string("runtime error");
    }
    return ret;
}

std::string errorCodeToString(ErrorCode code) {
    switch(code) {
        case ErrorCode::Generic:                return "Error";
        case ErrorCode::ParseError:             return "ParseError";
        case ErrorCode::CyclicStageDependency:  return "CyclicStageDependency";
        case ErrorCode::ExecutionError:         return "ExecutionError";
        case ErrorCode::DigestMismatch:         return "DigestMismatch";
        case ErrorCode::NotFound:               return "NotFound";
        case ErrorCode::NetworkError:           return "NetworkError";
    }
    return "Error";
}

}
