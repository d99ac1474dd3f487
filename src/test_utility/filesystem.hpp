/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_test_utility_filesystem_hpp
#define stratum_test_utility_filesystem_hpp

#include <string>
#include <sys/types.h>

#include <boost/filesystem.hpp>


namespace test_utility {
namespace filesystem {

void createFile(const boost::filesystem::path& path, const std::string& content, mode_t mode = 0644);

// A throw-away directory, removed on destruction
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(const std::string& name = "stratum-test-dir");
    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    ~TemporaryDirectory();

    const boost::filesystem::path& getPath() const { return path; }

private:
    boost::filesystem::path path;
};

}
}

#endif
