/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandObjectsFactory_hpp
#define stratum_cli_CommandObjectsFactory_hpp

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <map>

#include "libstratum/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"


namespace stratum {
namespace cli {

/**
 * Creates the command objects by name. A command is created either empty, to
 * print its description and help, or from its CLI arguments, ready to execute.
 */
class CommandObjectsFactory {
public:
    CommandObjectsFactory();

    std::vector<std::string> getCommandNames() const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName) const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName,
                                                    const libstratum::CLIArguments& commandArgs,
                                                    std::shared_ptr<common::Config> config) const;
    std::unique_ptr<cli::Command> makeCommandObjectHelpOfCommand(const std::string& commandName) const;

private:
    struct Constructors {
        std::function<std::unique_ptr<cli::Command>()> empty;
        std::function<std::unique_ptr<cli::Command>(const libstratum::CLIArguments&,
                                                    std::shared_ptr<common::Config>)> fromArguments;
    };

    template<class CommandType>
    void addCommand(const std::string& commandName) {
        auto& constructors = commands[commandName];
        constructors.empty = []() {
            return std::unique_ptr<cli::Command>{new CommandType{}};
        };
        constructors.fromArguments = [](const libstratum::CLIArguments& args, std::shared_ptr<common::Config> config) {
            return std::unique_ptr<cli::Command>{new CommandType{args, std::move(config)}};
        };
    }

    const Constructors& findCommand(const std::string& commandName) const;

private:
    std::map<std::string, Constructors> commands;
};

}
}

#endif
