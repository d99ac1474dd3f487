/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_Logger_hpp
#define libstratum_Logger_hpp

#include <chrono>
#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "libstratum/Error.hpp"

namespace libstratum {

/**
 * Process-wide logger. Except for GENERAL messages, every line is prefixed with
 * the seconds elapsed since the logger was created, the subsystem, the context
 * of the calling thread (if any) and the level:
 *
 *   [12.034] [BuildEngine] [stage builder] [INFO] Completed stage builder: 2 layer(s), 3 history entries
 */
class Logger {
public:
    /**
     * Tags the messages logged by the current thread while the object is alive,
     * e.g. with the stage being built. Contexts nest and are restored on destruction.
     */
    class Context {
    public:
        explicit Context(const std::string& name);
        ~Context();
        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

    private:
        std::string previous;
    };

public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libstratum::LogLevel& logLevel,
            std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libstratum::LogLevel& logLevel,
            std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libstratum::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libstratum::LogLevel logLevel) { level = logLevel; };
    libstratum::LogLevel getLevel() { return level; };

    static const std::string& getCurrentContext();

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makePrefix(libstratum::LogLevel logLevel, const std::string& systemName) const;

private:
    libstratum::LogLevel level;
    std::chrono::steady_clock::time_point startTime;
    // stages and blob transfers run on worker threads
    std::mutex streamMutex;
};

}

#endif
