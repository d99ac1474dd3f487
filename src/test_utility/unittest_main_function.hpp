/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_test_utility_unittest_main_function_hpp
#define stratum_test_utility_unittest_main_function_hpp

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so in order to be
// on the safe side include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>


#define STRATUM_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libstratum::Error& e) { \
        libstratum::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

#endif
