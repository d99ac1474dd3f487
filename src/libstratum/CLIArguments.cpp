/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <boost/algorithm/string/join.hpp>

namespace libstratum {

CLIArguments::CLIArguments() {
    updatePointers();
}

CLIArguments::CLIArguments(const CLIArguments& rhs)
    : strings{rhs.strings}
{
    updatePointers();
}

CLIArguments::CLIArguments(int argc, char* argv[]) {
    strings.reserve(argc);
    for(int i=0; i<argc; ++i) {
        strings.emplace_back(argv[i]);
    }
    updatePointers();
}

CLIArguments::CLIArguments(std::initializer_list<std::string> args)
    : strings{args}
{
    updatePointers();
}

CLIArguments& CLIArguments::operator=(const CLIArguments& rhs) {
    strings = rhs.strings;
    updatePointers();
    return *this;
}

void CLIArguments::push_back(const std::string& arg) {
    strings.push_back(arg);
    updatePointers();
}

int CLIArguments::argc() const {
    return static_cast<int>(strings.size());
}

char** CLIArguments::argv() const {
    return const_cast<char**>(pointers.data());
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return strings.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return strings.cend();
}

const std::string& CLIArguments::operator[](size_t i) const {
    return strings.at(i);
}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    strings.insert(strings.end(), rhs.strings.cbegin(), rhs.strings.cend());
    updatePointers();
    return *this;
}

bool CLIArguments::empty() const {
    return strings.empty();
}

void CLIArguments::clear() {
    strings.clear();
    updatePointers();
}

std::string CLIArguments::string() const {
    return boost::algorithm::join(strings, " ");
}

// the char* array points into the strings, so it must be rebuilt
// whenever the strings vector may have reallocated
void CLIArguments::updatePointers() {
    pointers.clear();
    pointers.reserve(strings.size() + 1);
    for(auto& s : strings) {
        pointers.push_back(&s[0]);
    }
    pointers.push_back(nullptr);
}

bool operator==(const CLIArguments& lhs, const CLIArguments& rhs) {
    return lhs.asVector() == rhs.asVector();
}

bool operator!=(const CLIArguments& lhs, const CLIArguments& rhs) {
    return !(lhs == rhs);
}

const CLIArguments operator+(const CLIArguments& lhs, const CLIArguments& rhs) {
    auto result = lhs;
    result += rhs;
    return result;
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[";
    bool isFirstArg = true;
    for(const auto& arg : args) {
        if(!isFirstArg) {
            os << ", ";
        }
        else {
            isFirstArg = false;
        }
        os << "\"" << arg << "\"";
    }
    os << "]";
    return os;
}

}
