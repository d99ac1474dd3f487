/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandHelpOfCommand_hpp
#define stratum_cli_CommandHelpOfCommand_hpp

#include <memory>

#include "libstratum/Error.hpp"
#include "cli/Command.hpp"

namespace stratum {
namespace cli {

/**
 * Prints the help message of another command ("stratum help build").
 */
class CommandHelpOfCommand : public Command {
public:
    explicit CommandHelpOfCommand(std::unique_ptr<cli::Command> command)
        : command(std::move(command))
    {}

    void execute() override {
        command->printHelpMessage();
    }

    const cli::Command& getCommand() const {
        return *command;
    }

    std::string getBriefDescription() const override {
        STRATUM_THROW_ERROR("This function must not be executed."
                            " The developer should review the program's logic.");
    }

    void printHelpMessage() const override {
        STRATUM_THROW_ERROR("This function must not be executed."
                            " The developer should review the program's logic.");
    }

private:
    std::unique_ptr<cli::Command> command;
};

}
}

#endif
