/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libstratum_Flock_hpp
#define libstratum_Flock_hpp

#include <chrono>
#include <limits>
#include <string>

#include <boost/filesystem.hpp>

namespace libstratum {

using milliseconds = std::chrono::milliseconds;

/**
 * Advisory lock on a file through flock(2), acquired by the constructor and
 * released by the destructor. A read lock is shared, a write lock is exclusive.
 * The lock file is created if it doesn't exist yet.
 * If an incompatible lock is held by somebody else, the constructor polls with a
 * short backoff until the lock is acquired or the timeout expires (error).
 */
class Flock {
public:
    static const milliseconds noTimeout;
    enum class Type {readLock, writeLock};

public:
    Flock(const boost::filesystem::path& file, const Type type=Type::readLock,
          const milliseconds& timeoutTime=noTimeout, const milliseconds& warningTime=milliseconds{1000});
    Flock(const Flock&) = delete;
    Flock& operator=(const Flock&) = delete;
    ~Flock();

    const boost::filesystem::path& getFile() const { return lockfile; }
    Type getType() const { return lockType; }

private:
    void openLockfile();
    bool tryLock();
    void release();

private:
    std::string loggerSubsystemName = "Flock";
    boost::filesystem::path lockfile;
    Type lockType;
    int fileFd = -1;
};

}

#endif
