/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Flock.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <sys/file.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/filesystem.hpp"

namespace libstratum {

const milliseconds Flock::noTimeout = milliseconds{std::numeric_limits<milliseconds::rep>::max()};

Flock::Flock(const boost::filesystem::path& file, const Type type, const milliseconds& timeoutTime, const milliseconds& warningTime)
    : lockfile{file}
    , lockType{type}
{
    auto& logger = Logger::getInstance();
    logger.log(boost::format("Acquiring %s lock on %s") % (lockType==Type::readLock ? "read" : "write") % lockfile,
               loggerSubsystemName, LogLevel::DEBUG);

    openLockfile();

    auto elapsedTime = milliseconds{0};
    auto backoffTime = milliseconds{100};
    auto nextWarningTime = warningTime;
    while(!tryLock()) {
        if(timeoutTime != noTimeout && elapsedTime >= timeoutTime) {
            close(fileFd);
            auto message = boost::format("Failed to acquire lock on file %s (expired timeout of %d milliseconds)")
                % lockfile % timeoutTime.count();
            STRATUM_THROW_ERROR(message.str());
        }
        std::this_thread::sleep_for(backoffTime);
        elapsedTime += backoffTime;
        if(elapsedTime >= nextWarningTime) {
            auto message = boost::format("Still attempting to acquire lock on file %s after %d ms...")
                % lockfile % elapsedTime.count();
            logger.log(message, loggerSubsystemName, LogLevel::WARN);
            nextWarningTime += warningTime;
        }
    }

    logger.log("Successfully acquired lock", loggerSubsystemName, LogLevel::DEBUG);
}

Flock::~Flock() {
    release();
}

void Flock::openLockfile() {
    filesystem::createFoldersIfNecessary(lockfile.parent_path());
    fileFd = open(lockfile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if(fileFd == -1) {
        auto message = boost::format("Failed to open %s for locking: %s") % lockfile % strerror(errno);
        STRATUM_THROW_ERROR(message.str());
    }
}

bool Flock::tryLock() {
    auto operation = lockType == Type::readLock ? LOCK_SH : LOCK_EX;
    if(flock(fileFd, operation | LOCK_NB) == 0) {
        return true;
    }
    if(errno != EWOULDBLOCK) {
        auto message = boost::format("Failed to flock() %s (fd %d): %s") % lockfile % fileFd % strerror(errno);
        close(fileFd);
        STRATUM_THROW_ERROR(message.str());
    }
    return false;
}

void Flock::release() {
    if(fileFd < 0) {
        return;
    }
    if(flock(fileFd, LOCK_UN) == -1) {
        auto message = boost::format("Failed to release lock on %s (fd %d): %s") % lockfile % fileFd % strerror(errno);
        Logger::getInstance().log(message, loggerSubsystemName, LogLevel::WARN);
    }
    if(close(fileFd) != 0) {
        auto message = boost::format("Failed to close file descriptor %d of file %s") % fileFd % lockfile;
        Logger::getInstance().log(message, loggerSubsystemName, LogLevel::WARN);
    }
    fileFd = -1;
}

}
