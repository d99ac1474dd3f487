/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_Error_hpp
#define libstratum_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cassert>
#include <cstring>

#include <boost/filesystem.hpp>

#include "libstratum/LogLevel.hpp"
#include "libstratum/ErrorCode.hpp"

namespace libstratum {

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macro STRATUM_THROW_ERROR
 * (or STRATUM_THROW_CODED_ERROR, which also classifies the failure).
 * Additional error trace entries are created by the macro STRATUM_RETHROW_ERROR.
 * Rethrowing keeps the original object, hence its error code.
 *
 * Note: this class should be instantiated and thrown through the macros above.
 * Caught instances of this class should be rethrown through the STRATUM_RETHROW_ERROR macro.
 * The user is not supposed to instantiate and throw this class "manually".
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    Error(ErrorCode errorCode, LogLevel logLevel, const ErrorTraceEntry& entry)
        : errorCode{ errorCode }
        , logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

    ErrorCode getErrorCode() const {
        return errorCode;
    }

    void setErrorCode(ErrorCode value) {
        errorCode = value;
    }

private:
    ErrorCode errorCode = ErrorCode::Generic;
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


// STRATUM_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define STRATUM_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define STRATUM_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = libstratum::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libstratum::Error{logLevel, stackTraceEntry}; \
}

#define STRATUM_THROW_ERROR_1(errorMessage) STRATUM_THROW_ERROR_2(errorMessage, libstratum::LogLevel::ERROR)

#define STRATUM_THROW_ERROR(...) STRATUM_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, STRATUM_THROW_ERROR_2, STRATUM_THROW_ERROR_1)(__VA_ARGS__)


// STRATUM_THROW_CODED_ERROR macros
#define STRATUM_GET_OVERLOADED_THROW_CODED_ERROR(_1, _2, _3, NAME, ...) NAME

#define STRATUM_THROW_CODED_ERROR_3(errorCode, errorMessage, logLevel) { \
    auto stackTraceEntry = libstratum::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libstratum::Error{errorCode, logLevel, stackTraceEntry}; \
}

#define STRATUM_THROW_CODED_ERROR_2(errorCode, errorMessage) STRATUM_THROW_CODED_ERROR_3(errorCode, errorMessage, libstratum::LogLevel::ERROR)

#define STRATUM_THROW_CODED_ERROR(...) STRATUM_GET_OVERLOADED_THROW_CODED_ERROR(__VA_ARGS__, STRATUM_THROW_CODED_ERROR_3, STRATUM_THROW_CODED_ERROR_2)(__VA_ARGS__)


// STRATUM_RETHROW_ERROR macros
#define STRATUM_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define STRATUM_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libstratum::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libstratum::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libstratum::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libstratum::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libstratum::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libstratum::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                             libstratum::getExceptionTypeString(exception)}; \
        auto error = libstratum::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define STRATUM_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libstratum::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libstratum::Error */ \
        STRATUM_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        STRATUM_RETHROW_ERROR_3(exception, errorMessage, libstratum::LogLevel::ERROR) \
    } \
}

#define STRATUM_RETHROW_ERROR(...) STRATUM_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, STRATUM_RETHROW_ERROR_3, STRATUM_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
