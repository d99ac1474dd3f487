/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_Utility_hpp
#define stratum_cli_Utility_hpp

#include <string>
#include <map>
#include <tuple>
#include <iostream>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libstratum/LogLevel.hpp"
#include "libstratum/CLIArguments.hpp"

namespace stratum {
namespace cli {
namespace utility {

std::pair<std::string, std::string> parseBuildArg(const std::string& input);

std::tuple<libstratum::CLIArguments, libstratum::CLIArguments> groupOptionsAndPositionalArguments(
        const libstratum::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void parseOptions(const libstratum::CLIArguments& nameAndOptionArgs,
                  const boost::program_options::options_description& optionsDescription,
                  boost::program_options::variables_map& values);

void validateNumberOfPositionalArguments(const libstratum::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

void printLog(  const std::string& message, libstratum::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libstratum::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
