/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/LayerBuilder.hpp"

#include <cstring>

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "build_engine/archive.hpp"
#include "build_engine/UserDatabase.hpp"
#include "build_engine/VariableExpansion.hpp"


namespace stratum {
namespace build_engine {

using common::Instruction;
using common::InstructionKind;

const std::string LayerBuilder::SIMULATED_RUN_MARKER{" # simulated, not executed"};

std::map<std::string, std::string> BuildState::getVariables() const {
    auto variables = args;
    for(const auto& variable : metadata.getEnvironment()) {
        variables[variable.first] = variable.second;
    }
    return variables;
}

LayerBuilder::LayerBuilder(std::shared_ptr<const BuildContext> context,
                           std::shared_ptr<CommandExecutor> executor,
                           std::shared_ptr<const SourceResolver> resolver,
                           std::map<std::string, std::string> buildArgs,
                           std::string created)
    : context{std::move(context)}
    , executor{std::move(executor)}
    , resolver{std::move(resolver)}
    , buildArgs(std::move(buildArgs))
    , created{std::move(created)}
{}

BuildStep LayerBuilder::apply(const BuildState& state, const Instruction& instruction) const {
    auto step = BuildStep{state, boost::none, boost::none, nullptr};
    printLog(boost::format("Applying %s") % instruction.string(), libstratum::LogLevel::DEBUG);

    bool changesFilesystem = instruction.kind == InstructionKind::RUN
                             || instruction.kind == InstructionKind::COPY
                             || instruction.kind == InstructionKind::ADD;
    try {
        switch(instruction.kind) {
        case InstructionKind::FROM:
            applyFrom(step, instruction);
            break;
        case InstructionKind::RUN:
            applyRun(step, instruction);
            break;
        case InstructionKind::COPY:
        case InstructionKind::ADD:
            applyCopy(step, instruction);
            break;
        case InstructionKind::ARG:
            applyArg(step, instruction);
            break;
        default:
            applyConfiguration(step, instruction);
            break;
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to apply instruction '%s' (line %d)") % instruction.string() % instruction.line;
        try {
            STRATUM_RETHROW_ERROR(e, message.str());
        }
        catch(libstratum::Error& error) {
            if(changesFilesystem) {
                error.setErrorCode(libstratum::ErrorCode::ExecutionError);
            }
            throw;
        }
    }

    return step;
}

void LayerBuilder::applyFrom(BuildStep& step, const Instruction& instruction) const {
    auto reference = expandVariables(instruction.arguments.at(0), globalArgs);

    if(boost::algorithm::to_lower_copy(reference) == "scratch") {
        step.base = std::make_shared<const ImageState>();
    }
    else if(resolver) {
        step.base = resolver->resolve(reference);
    }
    else {
        auto message = boost::format("Cannot resolve base image '%s': no image source available") % reference;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }

    // ARGs and SHELL don't survive a FROM
    step.state = BuildState{};
    step.state.filesystem = step.base->filesystem;
    step.state.metadata = step.base->metadata;
    printLog(boost::format("Base image '%s' has %d layer(s) and %d filesystem entries")
             % reference % step.base->layers.size() % step.base->filesystem.size(), libstratum::LogLevel::INFO);
}

void LayerBuilder::applyRun(BuildStep& step, const Instruction& instruction) const {
    auto command = makeCommand(step.state, instruction);
    auto createdBy = "RUN " + command.string();

    auto request = ExecutionRequest{};
    request.command = command;
    request.environment = step.state.getVariables();
    request.workdir = step.state.metadata.workdir ? step.state.metadata.workdir->string() : std::string{"/"};
    request.user = step.state.metadata.user;

    if(!executor || executor->isSimulated()) {
        if(executor) {
            executor->execute(request, step.state.filesystem);
        }
        step.history = makeHistory(createdBy + SIMULATED_RUN_MARKER, true,
                                   "RUN was not executed, the filesystem is unchanged");
        return;
    }

    printLog(boost::format("Executing %s with the %s executor") % command % executor->getName(), libstratum::LogLevel::INFO);
    auto mutation = executor->execute(request, step.state.filesystem);

    auto filesystem = step.state.filesystem;
    filesystem.apply(mutation);
    auto changeset = filesystem.diff(step.state.filesystem);

    step.layer = Layer::create(changeset, createdBy);
    step.history = makeHistory(createdBy, false);
    step.state.filesystem = std::move(filesystem);
}

void LayerBuilder::applyCopy(BuildStep& step, const Instruction& instruction) const {
    struct Source {
        std::string path;
        std::vector<SourceItem> items;
        bool isFromContext;
    };

    const auto& arguments = instruction.arguments;
    const auto& state = step.state;
    bool isAdd = instruction.kind == InstructionKind::ADD;
    auto variables = state.getVariables();
    auto workdir = state.metadata.workdir ? state.metadata.workdir->string() : std::string{"/"};
    auto rawDestination = expandVariables(arguments.back(), variables);
    auto destination = normalizePath(rawDestination, workdir);

    auto sourceImage = std::shared_ptr<const ImageState>{};
    if(instruction.sourceStage) {
        auto reference = expandVariables(*instruction.sourceStage, variables);
        if(!resolver) {
            auto message = boost::format("Cannot resolve --from=%s: no image source available") % reference;
            STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
        }
        sourceImage = resolver->resolve(reference);
    }

    auto sources = std::vector<Source>{};
    for(std::size_t i = 0; i + 1 < arguments.size(); ++i) {
        auto pattern = expandVariables(arguments[i], variables);
        if(isAdd && (boost::algorithm::starts_with(pattern, "http://") || boost::algorithm::starts_with(pattern, "https://"))) {
            auto message = boost::format("ADD from remote URL '%s' is not supported") % pattern;
            STRATUM_THROW_ERROR(message.str());
        }
        if(sourceImage) {
            auto path = normalizePath(pattern);
            sources.push_back(Source{path, collectFromImage(*sourceImage, path), false});
        }
        else {
            if(!context) {
                STRATUM_THROW_ERROR("No build context available");
            }
            for(const auto& match : context->expandSources(pattern)) {
                sources.push_back(Source{match, context->collect(match), true});
            }
        }
    }

    // "." and ".." name the directory itself, as does a trailing separator
    bool isDestinationDirectory = boost::algorithm::ends_with(rawDestination, "/")
                                  || rawDestination == "." || boost::algorithm::ends_with(rawDestination, "/.")
                                  || rawDestination == ".." || boost::algorithm::ends_with(rawDestination, "/..")
                                  || sources.size() > 1
                                  || state.filesystem.isDirectory(destination);

    auto ownership = boost::optional<UserDatabase::Ownership>{};
    auto chown = instruction.flags.find("chown");
    if(chown != instruction.flags.cend()) {
        ownership = UserDatabase{state.filesystem}.resolveOwnership(expandVariables(chown->second, variables));
    }
    auto permissions = boost::optional<mode_t>{};
    auto chmod = instruction.flags.find("chmod");
    if(chmod != instruction.flags.cend()) {
        permissions = static_cast<mode_t>(std::stoul(chmod->second, nullptr, 8));
    }

    auto adjust = [&](FileEntry entry) {
        if(ownership) {
            entry.uid = ownership->uid;
            entry.gid = ownership->gid;
        }
        if(permissions && entry.type != FileEntry::Type::symlink) {
            entry.mode = *permissions;
        }
        return entry;
    };

    auto filesystem = state.filesystem;
    for(const auto& source : sources) {
        const auto& root = source.items.front().entry;

        if(root.type == FileEntry::Type::directory) {
            // the content of a directory is copied, not the directory itself
            for(const auto& item : source.items) {
                if(item.relativePath.empty()) {
                    if(!filesystem.isDirectory(destination)) {
                        filesystem.put(destination, adjust(item.entry));
                    }
                    continue;
                }
                filesystem.put(normalizePath(destination + "/" + item.relativePath), adjust(item.entry));
            }
            continue;
        }

        if(isAdd && source.isFromContext && root.type == FileEntry::Type::regularFile && root.content
           && extractArchive(filesystem, destination, *root.content, adjust(root))) {
            continue;
        }

        auto target = isDestinationDirectory
            ? normalizePath(destination + "/" + getBaseName(source.path))
            : destination;
        filesystem.put(target, adjust(root));
    }

    auto changeset = filesystem.diff(state.filesystem);
    printLog(boost::format("%s changed %d entries and removed %d")
             % common::instructionKindToString(instruction.kind) % changeset.upserts.size() % changeset.deletions.size(),
             libstratum::LogLevel::DEBUG);

    step.layer = Layer::create(changeset, instruction.string());
    step.history = makeHistory(instruction.string(), false);
    step.state.filesystem = std::move(filesystem);
}

void LayerBuilder::applyArg(BuildStep& step, const Instruction& instruction) const {
    auto variables = step.state.getVariables();
    for(const auto& argument : instruction.arguments) {
        auto equal = argument.find('=');
        auto name = argument.substr(0, equal);

        auto buildArg = buildArgs.find(name);
        auto globalArg = globalArgs.find(name);
        if(buildArg != buildArgs.cend()) {
            step.state.args[name] = buildArg->second;
        }
        else if(equal != std::string::npos) {
            step.state.args[name] = expandVariables(argument.substr(equal + 1), variables);
        }
        else if(globalArg != globalArgs.cend()) {
            step.state.args[name] = globalArg->second;
        }
    }
    step.history = makeHistory(instruction.string(), true);
}

void LayerBuilder::applyConfiguration(BuildStep& step, const Instruction& instruction) const {
    auto& metadata = step.state.metadata;
    auto variables = step.state.getVariables();
    const auto& arguments = instruction.arguments;

    switch(instruction.kind) {
    case InstructionKind::WORKDIR: {
        auto current = metadata.workdir ? metadata.workdir->string() : std::string{"/"};
        metadata.workdir = boost::filesystem::path{normalizePath(expandVariables(arguments.at(0), variables), current)};
        break;
    }
    case InstructionKind::ENV:
        // all the pairs of one ENV see the values from before the instruction
        for(const auto& pair : arguments) {
            auto equal = pair.find('=');
            metadata.setEnvironmentVariable(pair.substr(0, equal), expandVariables(pair.substr(equal + 1), variables));
        }
        break;
    case InstructionKind::CMD:
        metadata.cmd = makeCommand(step.state, instruction);
        step.state.isCmdSetInStage = true;
        break;
    case InstructionKind::ENTRYPOINT: {
        auto entry = makeCommand(step.state, instruction);
        if(entry.empty()) {
            metadata.entry = boost::none;
        }
        else {
            metadata.entry = entry;
        }
        // an inherited CMD doesn't apply to a new entrypoint
        if(!step.state.isCmdSetInStage) {
            metadata.cmd = boost::none;
        }
        break;
    }
    case InstructionKind::EXPOSE: {
        auto portRegex = boost::regex{"^[0-9]+(-[0-9]+)?(/(tcp|udp|sctp))?$"};
        for(const auto& argument : arguments) {
            auto port = boost::algorithm::to_lower_copy(expandVariables(argument, variables));
            if(!boost::regex_match(port, portRegex)) {
                auto message = boost::format("Invalid port '%s' in EXPOSE") % port;
                STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, message.str());
            }
            if(port.find('/') == std::string::npos) {
                port += "/tcp";
            }
            metadata.exposedPorts.insert(port);
        }
        break;
    }
    case InstructionKind::LABEL:
        for(const auto& pair : arguments) {
            auto equal = pair.find('=');
            metadata.labels[expandVariables(pair.substr(0, equal), variables)] = expandVariables(pair.substr(equal + 1), variables);
        }
        break;
    case InstructionKind::USER:
        metadata.user = expandVariables(arguments.at(0), variables);
        break;
    case InstructionKind::VOLUME:
        for(const auto& volume : arguments) {
            metadata.volumes.insert(expandVariables(volume, variables));
        }
        break;
    case InstructionKind::STOPSIGNAL:
        metadata.stopSignal = expandVariables(arguments.at(0), variables);
        break;
    case InstructionKind::SHELL:
        step.state.shell = libstratum::CLIArguments(arguments.cbegin(), arguments.cend());
        break;
    default: {
        auto message = boost::format("Instruction %s doesn't change the image configuration")
            % common::instructionKindToString(instruction.kind);
        STRATUM_THROW_ERROR(message.str());
    }
    }

    step.history = makeHistory(instruction.string(), true);
}

libstratum::CLIArguments LayerBuilder::makeCommand(const BuildState& state, const Instruction& instruction) const {
    if(instruction.execForm) {
        return libstratum::CLIArguments(instruction.arguments.cbegin(), instruction.arguments.cend());
    }
    return state.shell + libstratum::CLIArguments{instruction.arguments.at(0)};
}

std::vector<SourceItem> LayerBuilder::collectFromImage(const ImageState& image, const std::string& path) const {
    auto resolved = path;
    const FileEntry* entry = image.filesystem.find(resolved);
    for(int hops = 0; entry && entry->type == FileEntry::Type::symlink; ++hops) {
        if(hops == 40) {
            auto message = boost::format("Too many levels of symbolic links resolving '%s'") % path;
            STRATUM_THROW_ERROR(message.str());
        }
        resolved = normalizePath(entry->linkTarget, getParentPath(resolved));
        entry = image.filesystem.find(resolved);
    }

    if(resolved == "/") {
        auto items = std::vector<SourceItem>{ SourceItem{"", FileEntry::makeDirectory()} };
        for(const auto& child : image.filesystem.getEntries()) {
            items.push_back(SourceItem{child.first.substr(1), child.second});
        }
        return items;
    }

    if(!entry) {
        auto message = boost::format("'%s' not found in the source image") % path;
        STRATUM_THROW_ERROR(message.str());
    }

    auto items = std::vector<SourceItem>{ SourceItem{"", *entry} };
    if(entry->type == FileEntry::Type::directory) {
        for(const auto& child : image.filesystem.listSubtree(resolved)) {
            items.push_back(SourceItem{child.substr(resolved.size() + 1), *image.filesystem.find(child)});
        }
    }
    return items;
}

/**
 * ADD extracts local tar archives (plain or gzip-compressed) into the destination
 * directory. Returns false if the data is not an archive.
 */
bool LayerBuilder::extractArchive(FilesystemState& filesystem, const std::string& destination,
                                  const std::string& data, const FileEntry& archiveEntry) const {
    auto tar = data;
    if(archive::isGzip(data)) {
        try {
            tar = archive::gunzip(data);
        }
        catch(const libstratum::Error& e) {
            printLog(boost::format("Not extracting ADD source: %s") % e.what(), libstratum::LogLevel::DEBUG);
            return false;
        }
    }

    bool isTar = tar.size() >= 512 && std::memcmp(tar.data() + 257, "ustar", 5) == 0;
    if(!isTar) {
        return false;
    }

    auto changeset = archive::readTar(tar);
    for(const auto& upsert : changeset.upserts) {
        auto entry = upsert.second;
        if(archiveEntry.uid != 0 || archiveEntry.gid != 0) {
            entry.uid = archiveEntry.uid;
            entry.gid = archiveEntry.gid;
        }
        if(entry.type == FileEntry::Type::hardlink) {
            entry.linkTarget = normalizePath(destination + entry.linkTarget);
        }
        filesystem.put(normalizePath(destination + upsert.first), entry);
    }
    printLog(boost::format("Extracted %d entries into %s") % changeset.upserts.size() % destination,
             libstratum::LogLevel::INFO);
    return true;
}

common::HistoryEntry LayerBuilder::makeHistory(const std::string& createdBy, bool emptyLayer,
                                               const std::string& comment) const {
    auto entry = common::HistoryEntry{};
    entry.created = created;
    entry.createdBy = createdBy;
    entry.comment = comment;
    entry.emptyLayer = emptyLayer;
    return entry;
}

void LayerBuilder::printLog(const boost::format& message, libstratum::LogLevel level) const {
    libstratum::Logger::getInstance().log(message, sysname, level);
}

}
}
