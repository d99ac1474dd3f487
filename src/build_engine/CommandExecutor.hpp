/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_CommandExecutor_hpp
#define stratum_build_engine_CommandExecutor_hpp

#include <string>
#include <map>

#include <boost/optional.hpp>

#include "libstratum/CLIArguments.hpp"
#include "build_engine/FilesystemState.hpp"


namespace stratum {
namespace build_engine {

/**
 * What a RUN instruction asks to execute.
 */
struct ExecutionRequest {
    libstratum::CLIArguments command;
    std::map<std::string, std::string> environment;
    std::string workdir = "/";
    boost::optional<std::string> user;
};

/**
 * Executes the command of a RUN instruction against a filesystem state and returns
 * the resulting mutation. Implementations report failures by throwing libstratum::Error.
 */
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;
    virtual Changeset execute(const ExecutionRequest& request, const FilesystemState& state) = 0;
    virtual std::string getName() const = 0;
    // a simulated executor doesn't run anything, so RUN leaves the filesystem untouched
    virtual bool isSimulated() const { return false; }
};

class SimulatedExecutor : public CommandExecutor {
public:
    Changeset execute(const ExecutionRequest& request, const FilesystemState& state) override;
    std::string getName() const override { return "simulated"; }
    bool isSimulated() const override { return true; }

private:
    const std::string sysname = "SimulatedExecutor";
};

}
}

#endif
