/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "cli/CLI.hpp"

#include <iostream>
#include <string>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace stratum {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libstratum::CLIArguments& args,
                                                    std::shared_ptr<common::Config> conf) const {
    libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    boost::program_options::variables_map values;
    auto factory = cli::CommandObjectsFactory{};
    auto& logger = libstratum::Logger::getInstance();

    try {
        cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, values);
    }
    catch (const std::exception& e) {
        auto message = boost::format("%s\nSee 'stratum help'") % e.what();
        logger.log(message, "CLI", libstratum::LogLevel::GENERAL, std::cerr);
        STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
    }

    // configure logger
    if(values.count("debug")) {
        logger.setLevel(libstratum::LogLevel::DEBUG);
    }
    else if(values.count("verbose")) {
        logger.setLevel(libstratum::LogLevel::INFO);
    }
    else {
        logger.setLevel(libstratum::LogLevel::WARN);
    }

    // --help overrides other arguments and options
    if(values.count("help")) {
        return factory.makeCommandObject("help", libstratum::CLIArguments{}, std::move(conf));
    }

    // --version overrides other arguments and options
    if(values.count("version")) {
        return factory.makeCommandObject("version", libstratum::CLIArguments{}, std::move(conf));
    }

    // no command name => return help command
    if(positionalArgs.empty()) {
        return factory.makeCommandObject("help");
    }

    auto commandName = positionalArgs[0];

    if(commandName == "help" && positionalArgs.argc() > 1) {
        return parseCommandHelpOfCommand(positionalArgs);
    }

    return factory.makeCommandObject(commandName, positionalArgs, std::move(conf));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

std::unique_ptr<cli::Command> CLI::parseCommandHelpOfCommand(const libstratum::CLIArguments& args) const {
    auto optionsDescription = boost::program_options::options_description();
    libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    if(nameAndOptionArgs.argc() > 1) {
        auto message = boost::format("Command 'help' doesn't support options");
        utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
        STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
    }
    if(positionalArgs.argc() > 1) {
        auto message = boost::format("Too many arguments for command 'help'"
                                     "\nSee 'stratum help help'");
        utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
        STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
    }
    auto factory = cli::CommandObjectsFactory{};
    return factory.makeCommandObjectHelpOfCommand(positionalArgs[0]);
}

} // namespace
} // namespace
