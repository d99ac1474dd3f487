/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/CommandExecutor.hpp"

#include <boost/format.hpp>

#include "libstratum/Logger.hpp"


namespace stratum {
namespace build_engine {

Changeset SimulatedExecutor::execute(const ExecutionRequest& request, const FilesystemState& state) {
    auto message = boost::format("Not executing %s (workdir %s, %d files in the filesystem)")
        % request.command % request.workdir % state.size();
    libstratum::Logger::getInstance().log(message, sysname, libstratum::LogLevel::INFO);
    return Changeset{};
}

}
}
