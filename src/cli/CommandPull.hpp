/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandPull_hpp
#define stratum_cli_CommandPull_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "cli/HelpMessage.hpp"
#include "image_manager/ImageManager.hpp"


namespace stratum {
namespace cli {

class CommandPull : public Command {
public:
    CommandPull() {
        initializeOptionsDescription();
    }

    CommandPull(const libstratum::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto imageManager = image_manager::ImageManager{conf};
        auto manifest = imageManager.pullImage();
        libstratum::Logger::getInstance().log(manifest.digest.string(), "CommandPull", libstratum::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Pull an image from a registry";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("stratum pull [OPTIONS] REPOSITORY[:TAG][@DIGEST]")
            .setDescription(getBriefDescription()
                            + ".\nPulled images can be used as base images by FROM and COPY --from.")
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
        cli::utility::printLog(boost::format("parsing CLI arguments of pull command"), libstratum::LogLevel::DEBUG);

        libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the pull command expects exactly one positional argument
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "pull");

        try {
            boost::program_options::variables_map values;
            cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, values);

            conf->imageReference = common::ImageReference::parse(positionalArgs[0]);
            conf->directories.storeFromCLI = outputDir;
            conf->directories.initialize(*conf);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'stratum help pull'") % e.what();
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
