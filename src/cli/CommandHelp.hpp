/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandHelp_hpp
#define stratum_cli_CommandHelp_hpp

#include <iostream>
#include <memory>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"

namespace stratum {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libstratum::CLIArguments& args, std::shared_ptr<common::Config>) {
        if(args.argc() > 1) {
            auto message = boost::format("Command 'help' doesn't support options");
            utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
            STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
        }
    }

    void execute() override {
        std::cout
        << "Usage: stratum COMMAND\n"
        << "\n"
        << cli::CLI{}.getOptionsDescription()
        << "\n"
        << "Commands:\n";

        auto factory = CommandObjectsFactory{};
        for(const auto& name : factory.getCommandNames()) {
            auto description = factory.makeCommandObject(name)->getBriefDescription();
            std::cout << "   " << name << ": " << description << "\n";
        }
        std::cout << "\nRun 'stratum help COMMAND' for more information on a command.\n";
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("stratum help [COMMAND]")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }
};

}
}

#endif
