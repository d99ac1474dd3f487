/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandVersion_hpp
#define stratum_cli_CommandVersion_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "cli/HelpMessage.hpp"


namespace stratum {
namespace cli {

/**
 * Prints the version and, unless --short is given, the platform that builds
 * and pulls target by default.
 */
class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libstratum::CLIArguments& args, std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {
        parseCommandArguments(args);
    }

    void execute() override {
        auto& logger = libstratum::Logger::getInstance();
        if(versionOnly) {
            logger.log(conf->buildTime.version, "CommandVersion", libstratum::LogLevel::GENERAL);
            return;
        }
        logger.log(boost::format("stratum version %s") % conf->buildTime.version,
                   "CommandVersion", libstratum::LogLevel::GENERAL);
        logger.log(boost::format("default platform: %s/%s") % conf->platform.os % conf->platform.architecture,
                   "CommandVersion", libstratum::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the stratum version and the default target platform";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("stratum version [--short]")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription());
        std::cout << printer;
    }

    bool isVersionOnly() const {
        return versionOnly;
    }

private:
    static boost::program_options::options_description optionsDescription() {
        auto options = boost::program_options::options_description{"Options"};
        options.add_options()
            ("short", "Print the version number only");
        return options;
    }

    void parseCommandArguments(const libstratum::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of version command"), libstratum::LogLevel::DEBUG);

        auto options = optionsDescription();
        libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, options);
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");

        // "stratum --version" comes without command arguments
        if(nameAndOptionArgs.argc() == 0) {
            return;
        }

        try {
            auto values = boost::program_options::variables_map{};
            cli::utility::parseOptions(nameAndOptionArgs, options, values);
            versionOnly = values.count("short") > 0;
        }
        catch(std::exception& e) {
            auto message = boost::format("%s\nSee 'stratum help version'") % e.what();
            cli::utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
            STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libstratum::LogLevel::DEBUG);
    }

private:
    std::shared_ptr<const common::Config> conf;
    bool versionOnly = false;
};

}
}

#endif
