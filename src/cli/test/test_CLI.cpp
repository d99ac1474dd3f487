/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "libstratum/CLIArguments.hpp"
#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "common/Config.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/CLI.hpp"
#include "cli/CommandBuild.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandImages.hpp"
#include "cli/CommandPull.hpp"
#include "cli/CommandPush.hpp"
#include "cli/CommandRmi.hpp"
#include "cli/CommandVersion.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace stratum {
namespace cli {
namespace test {

TEST_GROUP(CLITestGroup) {
};

std::unique_ptr<cli::Command> generateCommandFromCLIArguments(const libstratum::CLIArguments& args) {
    auto cli = cli::CLI{};
    auto configRAII = test_utility::config::makeConfig();
    return cli.parseCommandLine(args, configRAII.config);
}

template<class ExpectedDynamicType>
void checkCommandDynamicType(const cli::Command& command) {
    CHECK(dynamic_cast<const ExpectedDynamicType*>(&command) != nullptr);
}

TEST(CLITestGroup, LogLevel) {
    auto& logger = libstratum::Logger::getInstance();
    generateCommandFromCLIArguments({"stratum"});
    CHECK(logger.getLevel() == libstratum::LogLevel::WARN);

    generateCommandFromCLIArguments({"stratum", "--verbose"});
    CHECK(logger.getLevel() == libstratum::LogLevel::INFO);

    generateCommandFromCLIArguments({"stratum", "--debug"});
    CHECK(logger.getLevel() == libstratum::LogLevel::DEBUG);
}

TEST(CLITestGroup, CommandTypes) {
    auto command = generateCommandFromCLIArguments({"stratum"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"stratum", "help"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"stratum", "--help"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"stratum", "help", "build"});
    checkCommandDynamicType<cli::CommandHelpOfCommand>(*command);

    command = generateCommandFromCLIArguments({"stratum", "build", "-t", "app", "."});
    checkCommandDynamicType<cli::CommandBuild>(*command);

    command = generateCommandFromCLIArguments({"stratum", "images"});
    checkCommandDynamicType<cli::CommandImages>(*command);

    command = generateCommandFromCLIArguments({"stratum", "pull", "alpine"});
    checkCommandDynamicType<cli::CommandPull>(*command);

    command = generateCommandFromCLIArguments({"stratum", "push", "localhost:5000/app"});
    checkCommandDynamicType<cli::CommandPush>(*command);

    command = generateCommandFromCLIArguments({"stratum", "rmi", "app"});
    checkCommandDynamicType<cli::CommandRmi>(*command);

    command = generateCommandFromCLIArguments({"stratum", "version"});
    checkCommandDynamicType<cli::CommandVersion>(*command);

    command = generateCommandFromCLIArguments({"stratum", "--version"});
    checkCommandDynamicType<cli::CommandVersion>(*command);
}

TEST(CLITestGroup, UnrecognizedCommandsAndOptions) {
    CHECK_THROWS(libstratum::Error, generateCommandFromCLIArguments({"stratum", "run", "alpine"}));
    CHECK_THROWS(libstratum::Error, generateCommandFromCLIArguments({"stratum", "--quiet", "images"}));
    CHECK_THROWS(libstratum::Error, generateCommandFromCLIArguments({"stratum", "---build"}));
    CHECK_THROWS(libstratum::Error, generateCommandFromCLIArguments({"stratum", "help", "build", "push"}));
}

std::shared_ptr<common::Config> generateConfig(const libstratum::CLIArguments& args,
                                               const test_utility::config::ConfigRAII& configRAII) {
    auto commandName = args.argv()[0];
    auto factory = cli::CommandObjectsFactory{};
    auto command = factory.makeCommandObject(commandName, args, configRAII.config);
    return configRAII.config;
}

TEST(CLITestGroup, generated_config_for_CommandBuild) {
    // defaults
    {
        auto configRAII = test_utility::config::makeConfig();
        auto conf = generateConfig({"build", "-t", "myapp", "."}, configRAII);
        CHECK(conf->imageReference.server == "index.docker.io");
        CHECK(conf->imageReference.repositoryNamespace == "library");
        CHECK(conf->imageReference.image == "myapp");
        CHECK(conf->imageReference.tag == "latest");
        CHECK(conf->commandBuild.contextDir == ".");
        CHECK(conf->commandBuild.dockerfile.empty());
        CHECK(!conf->commandBuild.target);
        CHECK(conf->commandBuild.buildArgs.empty());
        CHECK(conf->commandBuild.parallelStages == true);
        CHECK(conf->directories.store == boost::filesystem::absolute(conf->json["storeDir"].GetString()));
    }
    // all options
    {
        auto configRAII = test_utility::config::makeConfig();
        auto outputDir = configRAII.prefixDir / "layout";
        auto conf = generateConfig({"build",
                                    "--file", "docker/Dockerfile.release",
                                    "--tag=localhost:5000/team/app:1.0",
                                    "--target", "runtime",
                                    "--build-arg", "VERSION=2.1",
                                    "--build-arg=FLAGS=-O2 -g",
                                    "--output-dir", outputDir.string(),
                                    "--sequential",
                                    "src"}, configRAII);
        CHECK(conf->imageReference.server == "localhost:5000");
        CHECK(conf->imageReference.repositoryNamespace == "team");
        CHECK(conf->imageReference.image == "app");
        CHECK(conf->imageReference.tag == "1.0");
        CHECK(conf->commandBuild.contextDir == "src");
        CHECK(conf->commandBuild.dockerfile == "docker/Dockerfile.release");
        CHECK(conf->commandBuild.target == std::string{"runtime"});
        CHECK_EQUAL(conf->commandBuild.buildArgs.size(), 2);
        CHECK_EQUAL(conf->commandBuild.buildArgs["VERSION"], std::string{"2.1"});
        CHECK_EQUAL(conf->commandBuild.buildArgs["FLAGS"], std::string{"-O2 -g"});
        CHECK(conf->commandBuild.parallelStages == false);
        CHECK(conf->directories.store == outputDir);
        CHECK(boost::filesystem::is_directory(outputDir));
    }
    // short options
    {
        auto configRAII = test_utility::config::makeConfig();
        auto conf = generateConfig({"build", "-f", "Containerfile", "-t", "app:dev", "--parallel", "."}, configRAII);
        CHECK(conf->commandBuild.dockerfile == "Containerfile");
        CHECK(conf->imageReference.tag == "dev");
        CHECK(conf->commandBuild.parallelStages == true);
    }
    // build argument taken from the environment
    {
        setenv("STRATUM_TEST_BUILD_ARG", "from-env", 1);
        auto configRAII = test_utility::config::makeConfig();
        auto conf = generateConfig({"build", "-t", "app", "--build-arg", "STRATUM_TEST_BUILD_ARG", "."}, configRAII);
        CHECK_EQUAL(conf->commandBuild.buildArgs["STRATUM_TEST_BUILD_ARG"], std::string{"from-env"});
        unsetenv("STRATUM_TEST_BUILD_ARG");
    }
}

TEST(CLITestGroup, invalid_CommandBuild_arguments) {
    auto configRAII = test_utility::config::makeConfig();
    // missing tag
    CHECK_THROWS(libstratum::Error, generateConfig({"build", "."}, configRAII));
    // invalid tag
    CHECK_THROWS(libstratum::Error, generateConfig({"build", "-t", "My/App", "."}, configRAII));
    // missing context
    CHECK_THROWS(libstratum::Error, generateConfig({"build", "-t", "app"}, configRAII));
    // too many positional arguments
    CHECK_THROWS(libstratum::Error, generateConfig({"build", "-t", "app", ".", "other"}, configRAII));
    // conflicting options
    CHECK_THROWS(libstratum::Error, generateConfig({"build", "-t", "app", "--parallel", "--sequential", "."}, configRAII));
    // malformed build argument
    CHECK_THROWS(libstratum::Error, generateConfig({"build", "-t", "app", "--build-arg", "=value", "."}, configRAII));
    // unknown option
    CHECK_THROWS(libstratum::Error, generateConfig({"build", "-t", "app", "--squash", "."}, configRAII));
}

TEST(CLITestGroup, generated_config_for_CommandPull) {
    // defaults
    {
        auto configRAII = test_utility::config::makeConfig();
        auto conf = generateConfig({"pull", "ubuntu"}, configRAII);
        CHECK(conf->imageReference.server == "index.docker.io");
        CHECK(conf->imageReference.repositoryNamespace == "library");
        CHECK(conf->imageReference.image == "ubuntu");
        CHECK(conf->imageReference.tag == "latest");
        CHECK(conf->imageReference.digest.empty());
    }
    // custom server and digest
    {
        auto configRAII = test_utility::config::makeConfig();
        auto digest = std::string{"sha256:"} + std::string(64, 'a');
        auto conf = generateConfig({"pull", "my.own.server:5000/user/image@" + digest}, configRAII);
        CHECK(conf->imageReference.server == "my.own.server:5000");
        CHECK(conf->imageReference.repositoryNamespace == "user");
        CHECK(conf->imageReference.image == "image");
        CHECK(conf->imageReference.tag.empty());
        CHECK(conf->imageReference.digest == digest);
    }
    // output directory
    {
        auto configRAII = test_utility::config::makeConfig();
        auto outputDir = configRAII.prefixDir / "pulled";
        auto conf = generateConfig({"pull", "--output-dir=" + outputDir.string(), "alpine:3.18"}, configRAII);
        CHECK(conf->directories.store == outputDir);
        CHECK(conf->imageReference.tag == "3.18");
    }
    // errors
    {
        auto configRAII = test_utility::config::makeConfig();
        CHECK_THROWS(libstratum::Error, generateConfig({"pull"}, configRAII));
        CHECK_THROWS(libstratum::Error, generateConfig({"pull", "alpine", "ubuntu"}, configRAII));
        CHECK_THROWS(libstratum::Error, generateConfig({"pull", "../alpine"}, configRAII));
    }
}

TEST(CLITestGroup, generated_config_for_CommandPush) {
    // defaults
    {
        auto configRAII = test_utility::config::makeConfig();
        auto conf = generateConfig({"push", "localhost:5000/myapp:1.0"}, configRAII);
        CHECK(conf->imageReference.server == "localhost:5000");
        CHECK(conf->imageReference.repositoryNamespace.empty());
        CHECK(conf->imageReference.image == "myapp");
        CHECK(conf->imageReference.tag == "1.0");
        CHECK(conf->commandBuild.contextDir == configRAII.prefixDir / "context");
        CHECK(conf->commandBuild.dockerfile.empty());
    }
    // build options for images that are not in the layout yet
    {
        auto configRAII = test_utility::config::makeConfig();
        auto conf = generateConfig({"push", "-f", "build/Dockerfile", "--context", "src", "localhost:5000/myapp"}, configRAII);
        CHECK(conf->commandBuild.dockerfile == "build/Dockerfile");
        CHECK(conf->commandBuild.contextDir == "src");
    }
    // errors
    {
        auto configRAII = test_utility::config::makeConfig();
        CHECK_THROWS(libstratum::Error, generateConfig({"push"}, configRAII));
        CHECK_THROWS(libstratum::Error, generateConfig({"push", "--all-tags", "localhost:5000/myapp"}, configRAII));
    }
}

TEST(CLITestGroup, generated_config_for_CommandRmi) {
    {
        auto configRAII = test_utility::config::makeConfig();
        auto conf = generateConfig({"rmi", "ubuntu"}, configRAII);
        CHECK_EQUAL(conf->imageReference.server, std::string{"index.docker.io"});
        CHECK_EQUAL(conf->imageReference.repositoryNamespace, std::string{"library"});
        CHECK_EQUAL(conf->imageReference.image, std::string{"ubuntu"});
        CHECK_EQUAL(conf->imageReference.tag, std::string{"latest"});
    }
    {
        auto configRAII = test_utility::config::makeConfig();
        CHECK_THROWS(libstratum::Error, generateConfig({"rmi"}, configRAII));
    }
}

TEST(CLITestGroup, generated_config_for_CommandImages) {
    {
        auto configRAII = test_utility::config::makeConfig();
        auto outputDir = configRAII.prefixDir / "images";
        auto conf = generateConfig({"images", "--output-dir", outputDir.string()}, configRAII);
        CHECK(conf->directories.store == outputDir);
    }
    {
        auto configRAII = test_utility::config::makeConfig();
        CHECK_THROWS(libstratum::Error, generateConfig({"images", "alpine"}, configRAII));
    }
}

class StdoutRedirection {
public:
    explicit StdoutRedirection(std::ostream& stream)
        : original{std::cout.rdbuf(stream.rdbuf())}
    {}
    ~StdoutRedirection() {
        std::cout.rdbuf(original);
    }

private:
    std::streambuf* original;
};

static std::string captureStdout(cli::Command& command) {
    auto captured = std::ostringstream{};
    auto redirection = StdoutRedirection{captured};
    command.execute();
    return captured.str();
}

TEST(CLITestGroup, CommandVersion) {
    auto configRAII = test_utility::config::makeConfig();
    configRAII.config->platform.os = "linux";
    configRAII.config->platform.architecture = "arm64";
    auto factory = cli::CommandObjectsFactory{};

    auto command = factory.makeCommandObject("version", {"version"}, configRAII.config);
    CHECK(!dynamic_cast<cli::CommandVersion&>(*command).isVersionOnly());
    auto expected = "stratum version " + configRAII.config->buildTime.version + "\n"
        + "default platform: linux/arm64\n";
    CHECK_EQUAL(expected, captureStdout(*command));

    command = factory.makeCommandObject("version", {"version", "--short"}, configRAII.config);
    CHECK_EQUAL(configRAII.config->buildTime.version + "\n", captureStdout(*command));

    // "stratum --version"
    command = factory.makeCommandObject("version", libstratum::CLIArguments{}, configRAII.config);
    CHECK(!dynamic_cast<cli::CommandVersion&>(*command).isVersionOnly());

    CHECK_THROWS(libstratum::Error, factory.makeCommandObject("version", {"version", "--long"}, configRAII.config));
    CHECK_THROWS(libstratum::Error, factory.makeCommandObject("version", {"version", "extra"}, configRAII.config));
}

TEST(CLITestGroup, CommandObjectsFactory) {
    auto factory = cli::CommandObjectsFactory{};
    auto expectedNames = std::vector<std::string>{"build", "help", "images", "pull", "push", "rmi", "version"};
    CHECK(factory.getCommandNames() == expectedNames);

    checkCommandDynamicType<cli::CommandPush>(*factory.makeCommandObject("push"));
    checkCommandDynamicType<cli::CommandHelpOfCommand>(*factory.makeCommandObjectHelpOfCommand("build"));

    try {
        factory.makeCommandObject("run");
        FAIL("Expected exception");
    }
    catch(const libstratum::Error& e) {
        CHECK(e.getLogLevel() == libstratum::LogLevel::INFO);
        CHECK(std::string{e.what()}.find("available: build, help, images, pull, push, rmi, version") != std::string::npos);
    }
    CHECK_THROWS(libstratum::Error, factory.makeCommandObjectHelpOfCommand("run"));
}

}}} // namespace

STRATUM_UNITTEST_MAIN_FUNCTION();
