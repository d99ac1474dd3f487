/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_CLIArguments_hpp
#define libstratum_CLIArguments_hpp

#include <initializer_list>
#include <vector>
#include <string>
#include <ostream>

namespace libstratum {

/**
 * Sequence of command line arguments. Besides the strings, it maintains a
 * null-terminated char* array suitable for argc/argv style interfaces
 * (e.g. boost::program_options).
 */
class CLIArguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    CLIArguments();
    CLIArguments(const CLIArguments& rhs);
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);
    template<class InputIter>
    CLIArguments(InputIter begin, InputIter end) : CLIArguments() {
        for(InputIter arg=begin; arg!=end; ++arg) {
            push_back(*arg);
        }
    };

    CLIArguments& operator=(const CLIArguments& rhs);
    void push_back(const std::string& arg);

    int argc() const;
    char** argv() const;

    const_iterator begin() const;
    const_iterator end() const;
    const std::string& operator[](size_t i) const;
    const std::vector<std::string>& asVector() const { return strings; }

    CLIArguments& operator+=(const CLIArguments& rhs);

    bool empty() const;
    void clear();
    std::string string() const;

private:
    void updatePointers();

private:
    std::vector<std::string> strings;
    std::vector<char*> pointers;
};

bool operator==(const CLIArguments&, const CLIArguments&);
bool operator!=(const CLIArguments&, const CLIArguments&);
const CLIArguments operator+(const CLIArguments&, const CLIArguments&);
std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif
