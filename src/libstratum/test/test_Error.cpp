/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include <stdexcept>

#include "libstratum/Error.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace libstratum {
namespace test {

TEST_GROUP(ErrorTestGroup) {
};

void functionThatThrows() {
    STRATUM_THROW_ERROR("first error message");
}

void functionThatRethrows() {
    try {
        functionThatThrows();
    }
    catch(libstratum::Error& error) {
        STRATUM_RETHROW_ERROR(error, "second error message");
    }
}

void functionThatThrowsFromStdException() {
    auto stdException = std::runtime_error("first error message");
    const auto& ref = stdException;
    STRATUM_RETHROW_ERROR(ref, "second error message");
}

void functionThatThrowsWithLogLevelDebug() {
    STRATUM_THROW_ERROR("first error message", libstratum::LogLevel::DEBUG);
}

void functionThatThrowsCodedError() {
    STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::DigestMismatch, "digest mismatch");
}

void functionThatRethrowsCodedError() {
    try {
        functionThatThrowsCodedError();
    }
    catch(libstratum::Error& error) {
        STRATUM_RETHROW_ERROR(error, "failed to push blob", libstratum::LogLevel::INFO);
    }
}

static void checkEntry(const libstratum::Error::ErrorTraceEntry& entry,
                       const std::string& message,
                       const std::string& functionName) {
    CHECK_EQUAL(entry.errorMessage, message);
    CHECK_EQUAL(entry.fileName.string(), std::string{"test_Error.cpp"});
    CHECK_EQUAL(entry.functionName, functionName);
    CHECK(entry.fileLine > 0);
}

TEST(ErrorTestGroup, oneStackTraceEntry) {
    try {
        functionThatThrows();
        FAIL("expected exception");
    }
    catch(const libstratum::Error& error) {
        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        checkEntry(error.getErrorTrace()[0], "first error message", "functionThatThrows");
        CHECK(error.getLogLevel() == libstratum::LogLevel::ERROR);
        CHECK(error.getErrorCode() == libstratum::ErrorCode::Generic);
        CHECK_EQUAL(std::string{error.what()}, std::string{"first error message"});
    }
}

TEST(ErrorTestGroup, twoStackTraceEntries) {
    try {
        functionThatRethrows();
        FAIL("expected exception");
    }
    catch (const libstratum::Error& error) {
        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        checkEntry(error.getErrorTrace()[0], "first error message", "functionThatThrows");
        checkEntry(error.getErrorTrace()[1], "second error message", "functionThatRethrows");
        CHECK(error.getLogLevel() == libstratum::LogLevel::ERROR);
        CHECK_EQUAL(std::string{error.what()}, std::string{"first error message"});
    }
}

TEST(ErrorTestGroup, fromStdException) {
    try {
        functionThatThrowsFromStdException();
        FAIL("expected exception");
    }
    catch(const libstratum::Error& error) {
        auto expectedFirstEntry = libstratum::Error::ErrorTraceEntry{"first error message", "unspecified location", -1, "runtime error"};

        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        CHECK(error.getErrorTrace()[0] == expectedFirstEntry);
        checkEntry(error.getErrorTrace()[1], "second error message", "functionThatThrowsFromStdException");
        CHECK(error.getLogLevel() == libstratum::LogLevel::ERROR);
        CHECK(error.getErrorCode() == libstratum::ErrorCode::Generic);
    }
}

TEST(ErrorTestGroup, throwWithLogLevelDebug) {
    try {
        functionThatThrowsWithLogLevelDebug();
        FAIL("expected exception");
    }
    catch(const libstratum::Error& error) {
        CHECK_EQUAL(error.getErrorTrace().size(), 1);
        CHECK(error.getLogLevel() == libstratum::LogLevel::DEBUG);
    }
}

TEST(ErrorTestGroup, rethrowKeepsErrorCode) {
    try {
        functionThatRethrowsCodedError();
        FAIL("expected exception");
    }
    catch(const libstratum::Error& error) {
        CHECK(error.getErrorCode() == libstratum::ErrorCode::DigestMismatch);
        CHECK(error.getLogLevel() == libstratum::LogLevel::INFO);
        CHECK_EQUAL(error.getErrorTrace().size(), 2);
        checkEntry(error.getErrorTrace()[1], "failed to push blob", "functionThatRethrowsCodedError");
    }
}

TEST(ErrorTestGroup, errorCodeNames) {
    CHECK_EQUAL(libstratum::errorCodeToString(libstratum::ErrorCode::Generic), std::string{"Error"});
    CHECK_EQUAL(libstratum::errorCodeToString(libstratum::ErrorCode::CyclicStageDependency), std::string{"CyclicStageDependency"});
    CHECK_EQUAL(libstratum::errorCodeToString(libstratum::ErrorCode::NetworkError), std::string{"NetworkError"});
}

}}

STRATUM_UNITTEST_MAIN_FUNCTION();
