/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <climits>
#include <cstdlib>
#include <string>
#include <tuple>
#include <vector>

#include "libstratum/CLIArguments.hpp"
#include "libstratum/Error.hpp"
#include "cli/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace stratum {
namespace cli {
namespace test {

TEST_GROUP(CLIUtilityTestGroup) {
    std::string dockerfile;
    std::string tag;
    boost::program_options::options_description optionsDescription;

    void setup() {
        optionsDescription.add_options()
            ("file,f", boost::program_options::value<std::string>(&dockerfile), "Dockerfile")
            ("tag,t", boost::program_options::value<std::string>(&tag), "Tag")
            ("quiet,q", "Quiet")
            ("no-cache", "No cache");
    }
};

void checkArguments(const libstratum::CLIArguments& args, const std::vector<std::string>& expected) {
    CHECK_EQUAL(expected.size(), static_cast<std::size_t>(args.argc()));
    for(std::size_t i = 0; i < expected.size(); ++i) {
        CHECK_EQUAL(expected[i], std::string{args.argv()[i]});
    }
}

TEST(CLIUtilityTestGroup, parseBuildArg) {
    auto pair = cli::utility::parseBuildArg("VERSION=1.2");
    CHECK_EQUAL(std::string{"VERSION"}, pair.first);
    CHECK_EQUAL(std::string{"1.2"}, pair.second);

    // only the first separator splits
    pair = cli::utility::parseBuildArg("FLAGS=--opt=value");
    CHECK_EQUAL(std::string{"FLAGS"}, pair.first);
    CHECK_EQUAL(std::string{"--opt=value"}, pair.second);

    pair = cli::utility::parseBuildArg("EMPTY=");
    CHECK_EQUAL(std::string{"EMPTY"}, pair.first);
    CHECK_EQUAL(std::string{}, pair.second);

    // value from the environment
    setenv("STRATUM_UTEST_ARG", "inherited", 1);
    pair = cli::utility::parseBuildArg("STRATUM_UTEST_ARG");
    CHECK_EQUAL(std::string{"inherited"}, pair.second);
    unsetenv("STRATUM_UTEST_ARG");
    pair = cli::utility::parseBuildArg("STRATUM_UTEST_ARG");
    CHECK_EQUAL(std::string{}, pair.second);

    CHECK_THROWS(libstratum::Error, cli::utility::parseBuildArg("=value"));
    CHECK_THROWS(libstratum::Error, cli::utility::parseBuildArg("1VERSION=1"));
    CHECK_THROWS(libstratum::Error, cli::utility::parseBuildArg("MY-ARG=1"));
}

TEST(CLIUtilityTestGroup, groupOptionsAndPositionalArguments) {
    libstratum::CLIArguments nameAndOptionArgs, positionalArgs;

    // command name only
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build"}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build"});
    CHECK(positionalArgs.empty());

    // everything from the first positional argument onwards is positional
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"stratum", "--debug", "build", "-t", "app", "."}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"stratum", "--debug"});
    checkArguments(positionalArgs, {"build", "-t", "app", "."});

    // long option with adjacent value
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "--tag=app", "."}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "--tag=app"});
    checkArguments(positionalArgs, {"."});

    // long option with separated value followed by an option
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "--file", "Dockerfile.dev", "--no-cache", "context"}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "--file", "Dockerfile.dev", "--no-cache"});
    checkArguments(positionalArgs, {"context"});

    // long option without value is not followed by its value
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "--no-cache", "context"}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "--no-cache"});
    checkArguments(positionalArgs, {"context"});

    // option accepting a value given as last argument
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "--no-cache", "--tag"}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "--no-cache", "--tag"});
    CHECK(positionalArgs.empty());

    // short option with separated and adjacent values
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "-t", "app", "-fDockerfile", "."}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "-t", "app", "-fDockerfile"});
    checkArguments(positionalArgs, {"."});

    // a short option never takes another option as value
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "-t", "-q", "."}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "-t", "-q"});
    checkArguments(positionalArgs, {"."});

    // sticky short options, the last one takes the separated value
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "-qt", "app", "."}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "-qt", "app"});
    checkArguments(positionalArgs, {"."});

    // sticky short options with adjacent value
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
        {"build", "-qtapp", "."}, optionsDescription);
    checkArguments(nameAndOptionArgs, {"build", "-qtapp"});
    checkArguments(positionalArgs, {"."});
}

TEST(CLIUtilityTestGroup, validateNumberOfPositionalArguments) {
    // no positionals expected
    cli::utility::validateNumberOfPositionalArguments({}, 0, 0, "images");
    // exactly one positional expected
    cli::utility::validateNumberOfPositionalArguments({"."}, 1, 1, "build");
    // at least 1 positional expected
    cli::utility::validateNumberOfPositionalArguments({"arg0", "arg1", "arg2"}, 1, INT_MAX, "command");
    // too few arguments
    CHECK_THROWS(libstratum::Error, cli::utility::validateNumberOfPositionalArguments({}, 1, 1, "build"));
    // too many arguments with 0 max
    CHECK_THROWS(libstratum::Error, cli::utility::validateNumberOfPositionalArguments({"alpine"}, 0, 0, "images"));
    // too many arguments with non-zero max
    CHECK_THROWS(libstratum::Error, cli::utility::validateNumberOfPositionalArguments({"alpine", "ubuntu"}, 1, 1, "pull"));
}

}}} // namespace

STRATUM_UNITTEST_MAIN_FUNCTION();
