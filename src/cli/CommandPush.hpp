/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandPush_hpp
#define stratum_cli_CommandPush_hpp

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

class CommandPush : public Command {
public:
    CommandPush() {
        initializeOptionsDescription();
    }

    CommandPush(const libstratum::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto imageManager = image_manager::ImageManager{conf};
        auto report = imageManager.pushImage();
        auto message = boost::format("%s: %d blob(s) pushed, %d already present in the registry")
            % report.manifestDigest % report.blobsUploaded % report.blobsSkipped;
        libstratum::Logger::getInstance().log(message, "CommandPush", libstratum::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Push an image to a registry";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("stratum push [OPTIONS] REPOSITORY[:TAG]")
            .setDescription(getBriefDescription()
                            + ".\nIf the image is not in the output directory, it is built first"
                              " from the Dockerfile of the context.")
            .setOptionsDescription(optionsDescription)
            .addExample("stratum push localhost:5000/myapp:1.0", "push a previously built image to a local registry");
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("file,f",
                boost::program_options::value<std::string>(&dockerfile),
                "Path of the Dockerfile used when the image has to be built (default: CONTEXT/Dockerfile)")
            ("context",
                boost::program_options::value<std::string>(&context),
                "Build context used when the image has to be built (default: current directory)")
            ("output-dir",
                boost::program_options::value<std::string>(&outputDir),
                "Directory of the OCI image layout (default: storeDir of the configuration)");
    }

    void parseCommandArguments(const libstratum::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of push command"), libstratum::LogLevel::DEBUG);

        libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the push command expects exactly one positional argument
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "push");

        try {
            boost::program_options::variables_map values;
            cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, values);

            conf->imageReference = common::ImageReference::parse(positionalArgs[0]);
            if(values.count("context")) {
                conf->commandBuild.contextDir = context;
            }
            conf->commandBuild.dockerfile = dockerfile;
            conf->directories.storeFromCLI = outputDir;
            conf->directories.initialize(*conf);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'stratum help push'") % e.what();
            cli::utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
            STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libstratum::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::string dockerfile;
    std::string context;
    std::string outputDir;
};

}
}

#endif
