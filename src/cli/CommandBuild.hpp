/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandBuild_hpp
#define stratum_cli_CommandBuild_hpp

#include <iostream>
#include <memory>
#include <string>
#include <vector>

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

class CommandBuild : public Command {
public:
    CommandBuild() {
        initializeOptionsDescription();
    }

    CommandBuild(const libstratum::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto imageManager = image_manager::ImageManager{conf};
        auto image = imageManager.buildImage();
        libstratum::Logger::getInstance().log(image.getDigest().string(), "CommandBuild", libstratum::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Build an image from a Dockerfile";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("stratum build [OPTIONS] -t REPOSITORY[:TAG] CONTEXT")
            .setDescription(getBriefDescription()
                            + ".\nThe image is written to the OCI image layout of the output directory"
                              " and its digest is printed on success.")
            .setOptionsDescription(optionsDescription)
            .addExample("stratum build -t myapp:1.0 .", "build ./Dockerfile and tag the result as myapp:1.0")
            .addExample("stratum build -f docker/Dockerfile --target runtime --build-arg VERSION=2 -t myapp .",
                        "build only up to the stage named 'runtime'");
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("file,f",
                boost::program_options::value<std::string>(&dockerfile),
                "Path of the Dockerfile (default: CONTEXT/Dockerfile)")
            ("tag,t",
                boost::program_options::value<std::string>(&tag),
                "Name and optionally a tag of the image, in the 'name:tag' format")
            ("target",
                boost::program_options::value<std::string>(&target),
                "Build the given stage instead of the last one")
            ("build-arg",
                boost::program_options::value<std::vector<std::string>>(&buildArgs)->composing(),
                "Set a build-time variable, in the 'NAME=value' format. Can be repeated")
            ("output-dir",
                boost::program_options::value<std::string>(&outputDir),
                "Directory of the OCI image layout (default: storeDir of the configuration)")
            ("parallel", "Build independent stages concurrently")
            ("sequential", "Build one stage at a time");
    }

    void parseCommandArguments(const libstratum::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of build command"), libstratum::LogLevel::DEBUG);

        libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the build command expects exactly one positional argument: the context directory
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "build");

        try {
            boost::program_options::variables_map values;
            cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, values);

            if(!values.count("tag")) {
                STRATUM_THROW_ERROR("The image name is required (option '--tag')");
            }
            if(values.count("parallel") && values.count("sequential")) {
                STRATUM_THROW_ERROR("The options '--parallel' and '--sequential' cannot be used together");
            }

            conf->imageReference = common::ImageReference::parse(tag);
            conf->commandBuild.contextDir = positionalArgs[0];
            conf->commandBuild.dockerfile = dockerfile;
            if(values.count("target")) {
                conf->commandBuild.target = target;
            }
            for(const auto& buildArg : buildArgs) {
                auto pair = cli::utility::parseBuildArg(buildArg);
                conf->commandBuild.buildArgs[pair.first] = pair.second;
            }
            if(values.count("parallel")) {
                conf->commandBuild.parallelStages = true;
            }
            else if(values.count("sequential")) {
                conf->commandBuild.parallelStages = false;
            }

            conf->directories.storeFromCLI = outputDir;
            conf->directories.initialize(*conf);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'stratum help build'") % e.what();
            cli::utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
            STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libstratum::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::string dockerfile;
    std::string tag;
    std::string target;
    std::vector<std::string> buildArgs;
    std::string outputDir;
};

}
}

#endif
