/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandRmi_hpp
#define stratum_cli_CommandRmi_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "cli/HelpMessage.hpp"
#include "image_manager/ImageManager.hpp"


namespace stratum {
namespace cli {

class CommandRmi : public Command {
public:
    CommandRmi() {
        initializeOptionsDescription();
    }

    CommandRmi(const libstratum::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto imageManager = image_manager::ImageManager{conf};
        imageManager.removeImage();
    }

    std::string getBriefDescription() const override {
        return "Remove an image";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("stratum rmi [OPTIONS] REPOSITORY[:TAG]")
            .setDescription(getBriefDescription()
                            + ".\nOnly the tag is removed: the blobs stay in the content store.")
            .setOptionsDescription(optionsDescription);
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("output-dir",
                boost::program_options::value<std::string>(&outputDir),
                "Directory of the OCI image layout (default: storeDir of the configuration)");
    }

    void parseCommandArguments(const libstratum::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of rmi command"), libstratum::LogLevel::DEBUG);

        libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the rmi command expects exactly one positional argument
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "rmi");

        try {
            boost::program_options::variables_map values;
            cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, values);

            conf->imageReference = common::ImageReference::parse(positionalArgs[0]);
            conf->directories.storeFromCLI = outputDir;
            conf->directories.initialize(*conf);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'stratum help rmi'") % e.what();
            cli::utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
            STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libstratum::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::string outputDir;
};

}
}

#endif
