/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include <exception>
#include <iostream>
#include <memory>
#include <clocale>

#include <sys/types.h>
#include <sys/stat.h>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/CLI.hpp"

using namespace stratum;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    // blobs and the image layout are meant to be readable by other users
    umask(022);

    auto& logger = libstratum::Logger::getInstance();

    try {
        // Initialize Config object
        auto config = std::make_shared<common::Config>(common::Config::getDefaultPrefixDir());

        // Process command
        auto args = libstratum::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libstratum::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libstratum::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
