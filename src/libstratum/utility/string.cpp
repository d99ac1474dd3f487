/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <random>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"

namespace libstratum {
namespace string {

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator) {
    auto keyEnd = std::find(pairString.cbegin(), pairString.cend(), separator);
    auto key = std::string(pairString.cbegin(), keyEnd);
    auto value = keyEnd != pairString.cend() ? std::string(keyEnd+1, pairString.cend()) : std::string{};
    if(key.empty()) {
        auto message = boost::format("Failed to parse key-value pair '%s': key is empty") % pairString;
        STRATUM_THROW_ERROR(message.str())
    }
    return std::pair<std::string, std::string>{key, value};
}

std::string generateRandom(size_t size) {
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, 'z'-'a');
    std::mt19937 generator;
    generator.seed(std::random_device()());

    auto string = std::string(size, '.');

    for(size_t i=0; i<string.size(); ++i) {
        auto randomCharacter = 'a' + dist(generator);
        string[i] = randomCharacter;
    }

    return string;
}

std::string toHex(const unsigned char* data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    auto hex = std::string(2*size, '0');
    for(size_t i=0; i<size; ++i) {
        hex[2*i] = digits[data[i] >> 4];
        hex[2*i+1] = digits[data[i] & 0x0f];
    }
    return hex;
}

bool isHex(const std::string& s) {
    return !s.empty() && std::all_of(s.cbegin(), s.cend(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

}}
