/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libstratum/Logger.hpp"

#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"

namespace libstratum {

    namespace {
        thread_local std::string currentContext;

        const char* levelTag(LogLevel logLevel) {
            switch(logLevel) {
                case LogLevel::DEBUG:   return "DEBUG";
                case LogLevel::INFO:    return "INFO";
                case LogLevel::WARN:    return "WARN";
                case LogLevel::ERROR:   return "ERROR";
                case LogLevel::GENERAL: return "";
            }
            STRATUM_THROW_ERROR("logger failed to convert unknown log level to string");
        }
    }

    Logger::Context::Context(const std::string& name)
        : previous{currentContext}
    {
        currentContext = name;
    }

    Logger::Context::~Context() {
        currentContext = previous;
    }

    Logger& Logger::getInstance() {
        static Logger logger;
        return logger;
    }

    const std::string& Logger::getCurrentContext() {
        return currentContext;
    }

    Logger::Logger()
        : level{ libstratum::LogLevel::WARN }
        , startTime{ std::chrono::steady_clock::now() }
    {}

    void Logger::log(const std::string& message, const std::string& systemName, const libstratum::LogLevel& logLevel,
            std::ostream& out_stream, std::ostream& err_stream) {
        if(logLevel < level) {
            return;
        }

        auto line = makePrefix(logLevel, systemName) + message;
        auto& stream = logLevel == LogLevel::WARN || logLevel == LogLevel::ERROR ? err_stream : out_stream;

        std::lock_guard<std::mutex> lock{streamMutex};
        stream << line << std::endl;
    }

    void Logger::log(const boost::format& message, const std::string& systemName, const libstratum::LogLevel& logLevel,
            std::ostream& out_stream, std::ostream& err_stream) {
        log(message.str(), systemName, logLevel, out_stream, err_stream);
    }

    /**
     * Prints the error code followed by the trace entries, outermost first, so the
     * root cause ends up on the last line.
     */
    void Logger::logErrorTrace(const libstratum::Error& error, const std::string& systemName, std::ostream& errStream) {
        if(error.getLogLevel() < level) {
            return;
        }

        auto output = makePrefix(LogLevel::ERROR, systemName)
            + errorCodeToString(error.getErrorCode()) + " trace (most nested error last):\n";
        const auto& trace = error.getErrorTrace();
        for(std::size_t i = 0; i < trace.size(); ++i) {
            const auto& entry = trace[trace.size() - i - 1];
            auto position = entry.fileLine != -1 ? ":" + std::to_string(entry.fileLine) : std::string{};
            output += (boost::format("#%-3d %s at %s%s %s\n")
                       % i % entry.functionName % entry.fileName % position % entry.errorMessage).str();
        }

        std::lock_guard<std::mutex> lock{streamMutex};
        errStream << output << std::flush;
    }

    std::string Logger::makePrefix(libstratum::LogLevel logLevel, const std::string& systemName) const {
        if(logLevel == LogLevel::GENERAL) {
            return "";
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
        auto prefix = (boost::format("[%d.%03d] [%s] ") % (elapsed.count() / 1000) % (elapsed.count() % 1000) % systemName).str();
        if(!currentContext.empty()) {
            prefix += "[" + currentContext + "] ";
        }
        return prefix + "[" + levelTag(logLevel) + "] ";
    }

}
