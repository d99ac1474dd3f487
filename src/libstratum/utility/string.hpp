/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_utility_string_hpp
#define libstratum_utility_string_hpp

#include <string>
#include <tuple>
#include <vector>
#include <sys/types.h>

/**
 * Utility functions for string manipulation
 */

namespace libstratum {
namespace string {

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator = '=');
std::string generateRandom(size_t size);
std::string toHex(const unsigned char* data, size_t size);
bool isHex(const std::string& s);

}}

#endif
