/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/utsname.h>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"

namespace libstratum {
namespace process {

boost::optional<std::string> getEnvironmentVariable(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if(value == nullptr) {
        return boost::none;
    }
    return std::string{value};
}

/**
 * Returns the architecture of the host machine using the
 * naming of the OCI image specification (GOARCH values).
 */
std::string getMachineArchitecture() {
    auto info = utsname{};
    if(uname(&info) != 0) {
        auto message = boost::format("failed to retrieve machine architecture (%s)") % strerror(errno);
        STRATUM_THROW_ERROR(message.str());
    }

    auto machine = std::string{info.machine};
    if(machine == "x86_64") {
        return "amd64";
    }
    else if(machine == "aarch64" || machine == "arm64") {
        return "arm64";
    }
    else if(machine == "i386" || machine == "i686") {
        return "386";
    }
    else if(machine.compare(0, 3, "arm") == 0) {
        return "arm";
    }
    else if(machine == "ppc64le") {
        return "ppc64le";
    }
    else if(machine == "s390x") {
        return "s390x";
    }
    else if(machine == "riscv64") {
        return "riscv64";
    }
    return machine;
}

}}
