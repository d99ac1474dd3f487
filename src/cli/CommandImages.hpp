/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_CommandImages_hpp
#define stratum_cli_CommandImages_hpp

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <algorithm>

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

class CommandImages : public Command {
public:
    CommandImages() {
        initializeOptionsDescription();
    }

    CommandImages(const libstratum::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto imageManager = image_manager::ImageManager{conf};
        printImages(imageManager.listImages(), std::cout);
    }

    std::string getBriefDescription() const override {
        return "List images";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("stratum images [OPTIONS]")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription);
        std::cout << printer;
    }

    // public for test purpose
    void printImages(const std::vector<image_manager::StoredImage>& images, std::ostream& out) const {
        auto fieldGetters = std::vector<field_getter_t>{
            [](const image_manager::StoredImage& image) {
                return image.reference.getFullName();
            },
            [](const image_manager::StoredImage& image) {
                return image.reference.tag.empty() ? std::string{"<none>"} : image.reference.tag;
            },
            [](const image_manager::StoredImage& image) {
                // short digest, as printed by docker
                return image.manifest.digest.getHex().substr(0, 12);
            },
            [](const image_manager::StoredImage& image) {
                return image_manager::StoredImage::createSizeString(image.size);
            }
        };
        auto headers = std::vector<std::string>{"REPOSITORY", "TAG", "DIGEST", "SIZE"};

        auto formatString = std::string{};
        for(std::size_t i = 0; i < headers.size(); ++i) {
            auto width = std::max(maxFieldLength(images, fieldGetters[i]), minFieldWidth);
            formatString += (i == 0 ? "" : "   ") + std::string{"%-"} + std::to_string(width) + "s";
        }

        auto format = boost::format{formatString};
        for(const auto& header : headers) {
            format % header;
        }
        out << format << std::endl;

        for(const auto& image : images) {
            format.clear();
            for(const auto& getField : fieldGetters) {
                format % getField(image);
            }
            out << format << std::endl;
        }
    }

private:
    using field_getter_t = std::function<std::string(const image_manager::StoredImage&)>;

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("output-dir",
                boost::program_options::value<std::string>(&outputDir),
                "Directory of the OCI image layout (default: storeDir of the configuration)");
    }

    void parseCommandArguments(const libstratum::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of images command"), libstratum::LogLevel::DEBUG);

        libstratum::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the images command doesn't support positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "images");

        try {
            boost::program_options::variables_map values;
            cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, values);

            conf->directories.storeFromCLI = outputDir;
            conf->directories.initialize(*conf);
        }
        catch(std::exception& e) {
            auto message = boost::format("%s\nSee 'stratum help images'") % e.what();
            utility::printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
            STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
        }

        cli::utility::printLog( boost::format("successfully parsed CLI arguments"), libstratum::LogLevel::DEBUG);
    }

    std::size_t maxFieldLength(const std::vector<image_manager::StoredImage>& images,
                               const field_getter_t& getField) const {
        std::size_t maxLength = 0;
        for(const auto& image : images) {
            maxLength = std::max(maxLength, getField(image).size());
        }
        return maxLength;
    }

private:
    const std::size_t minFieldWidth = 10;
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::string outputDir;
};

}
}

#endif
