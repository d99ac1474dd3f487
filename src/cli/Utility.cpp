/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "cli/Utility.hpp"

#include <cstdlib>

#include <boost/regex.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/string.hpp"


namespace stratum {
namespace cli {
namespace utility {

/**
 * Parse the value of --build-arg: "NAME=value", or "NAME" to take the value
 * from the environment of the caller.
 */
std::pair<std::string, std::string> parseBuildArg(const std::string& input) {
    auto name = input.substr(0, input.find('='));
    if(!boost::regex_match(name, boost::regex{"[A-Za-z_][A-Za-z0-9_]*"})) {
        auto message = boost::format("Invalid build argument '%s': expected NAME=value") % input;
        STRATUM_THROW_ERROR(message.str());
    }

    if(input.find('=') == std::string::npos) {
        const char* value = std::getenv(name.c_str());
        return {name, value ? value : ""};
    }
    return libstratum::string::parseKeyValuePair(input);
}

namespace {

bool isShortOption(const std::string& s) {
    return s.size() > 1 && s[0] == '-' && s[1] != '-';
}

bool isLongOption(const std::string& s) {
    return s.size() > 2 && s.compare(0, 2, "--") == 0;
}

bool takesValue(const boost::program_options::options_description& optionsDescription, const std::string& name) {
    const auto* option = optionsDescription.find_nothrow(name, false);
    return option && option->semantic()->max_tokens() > 0;
}

/**
 * Number of tokens following an option token that belong to it: one when the
 * option takes a value which is not attached to the token itself.
 */
int countValueTokens(const std::string& token, const boost::program_options::options_description& optionsDescription) {
    if(isLongOption(token)) {
        if(token.find('=') != std::string::npos) {
            return 0;
        }
        return takesValue(optionsDescription, token.substr(2)) ? 1 : 0;
    }

    // short options may be grouped ("-vf Dockerfile"), only the last one can take a
    // separate value and one followed by more characters has its value attached
    for(std::size_t i = 1; i < token.size(); ++i) {
        if(takesValue(optionsDescription, std::string{"-"} + token[i])) {
            return i + 1 == token.size() ? 1 : 0;
        }
    }
    return 0;
}

}

/**
 * Group option arguments and positional arguments into two individual CLIArguments objects.
 *
 * The first group contains the program/command name, its options and their values.
 * The second group contains all the arguments from the first positional argument
 * onwards, e.g. "stratum --verbose build -t app:1 ." is grouped into
 * ("stratum --verbose", "build -t app:1 .") and then "build -t app:1 ." into
 * ("build -t app:1", ".").
 *
 * If there are no positional arguments, the second CLIArguments object is empty.
 */
std::tuple<libstratum::CLIArguments, libstratum::CLIArguments> groupOptionsAndPositionalArguments(
        const libstratum::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libstratum::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libstratum::CLIArguments, libstratum::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    nameAndOptionArgs.push_back(args[0]);

    for(auto arg = args.begin() + 1; arg != args.end(); ++arg) {
        if(!isShortOption(*arg) && !isLongOption(*arg)) {
            positionalArgs = libstratum::CLIArguments{arg, args.end()};
            break;
        }

        nameAndOptionArgs.push_back(*arg);
        auto next = arg + 1;
        if(countValueTokens(*arg, optionsDescription) > 0 && next != args.end() && !isShortOption(*next)) {
            nameAndOptionArgs.push_back(*next);
            arg = next;
        }
    }

    return std::tuple<libstratum::CLIArguments, libstratum::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void parseOptions(const libstratum::CLIArguments& nameAndOptionArgs,
                  const boost::program_options::options_description& optionsDescription,
                  boost::program_options::variables_map& values) {
    boost::program_options::store(
        boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
            .options(optionsDescription)
            .style(boost::program_options::command_line_style::unix_style)
            .run(), values);
    boost::program_options::notify(values); // throw if options are invalid
}

void validateNumberOfPositionalArguments(const libstratum::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'stratum help %s'") % quantity % command % command;
        printLog(message, libstratum::LogLevel::GENERAL, std::cerr);
        STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
    }
}

void printLog(const std::string& message, libstratum::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    auto systemName = "CLI";
    libstratum::Logger::getInstance().log(message, systemName, LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libstratum::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

} // namespace
} // namespace
} // namespace
