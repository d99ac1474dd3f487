/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "cli/CommandObjectsFactory.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "cli/CommandBuild.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandImages.hpp"
#include "cli/CommandPull.hpp"
#include "cli/CommandPush.hpp"
#include "cli/CommandRmi.hpp"
#include "cli/CommandVersion.hpp"


namespace stratum {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandBuild>("build");
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandImages>("images");
    addCommand<cli::CommandPull>("pull");
    addCommand<cli::CommandPush>("push");
    addCommand<cli::CommandRmi>("rmi");
    addCommand<cli::CommandVersion>("version");
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    for(const auto& command : commands) {
        names.push_back(command.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    return findCommand(commandName).empty();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libstratum::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    return findCommand(commandName).fromArguments(commandArgs, std::move(config));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    return std::unique_ptr<cli::Command>{new cli::CommandHelpOfCommand{makeCommandObject(commandName)}};
}

const CommandObjectsFactory::Constructors& CommandObjectsFactory::findCommand(const std::string& commandName) const {
    auto it = commands.find(commandName);
    if(it == commands.cend()) {
        auto message = boost::format("'%s' is not a stratum command (available: %s)\nSee 'stratum help'")
            % commandName % boost::algorithm::join(getCommandNames(), ", ");
        libstratum::Logger::getInstance().log(message, "CommandObjectsFactory", libstratum::LogLevel::GENERAL, std::cerr);
        STRATUM_THROW_ERROR(message.str(), libstratum::LogLevel::INFO);
    }
    return it->second;
}

}
}
