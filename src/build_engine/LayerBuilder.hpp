/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_LayerBuilder_hpp
#define stratum_build_engine_LayerBuilder_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>

#include <boost/optional.hpp>
#include <boost/format.hpp>

#include "libstratum/CLIArguments.hpp"
#include "libstratum/LogLevel.hpp"
#include "common/Instruction.hpp"
#include "common/ImageMetadata.hpp"
#include "common/ImageSpec.hpp"
#include "build_engine/FilesystemState.hpp"
#include "build_engine/Layer.hpp"
#include "build_engine/Stage.hpp"
#include "build_engine/BuildContext.hpp"
#include "build_engine/CommandExecutor.hpp"


namespace stratum {
namespace build_engine {

/**
 * Looks up the images referenced by FROM and COPY --from: a previous stage
 * (by name or index) or an image of the local store.
 */
class SourceResolver {
public:
    virtual ~SourceResolver() = default;
    virtual std::shared_ptr<const ImageState> resolve(const std::string& reference) const = 0;
};

/**
 * The state a stage carries from one instruction to the next.
 */
struct BuildState {
    FilesystemState filesystem;
    common::ImageMetadata metadata;
    // ARG values in scope
    std::map<std::string, std::string> args;
    libstratum::CLIArguments shell{"/bin/sh", "-c"};
    bool isCmdSetInStage = false;

    std::map<std::string, std::string> getVariables() const;
};

/**
 * Outcome of one instruction. FROM yields the base image and no history entry,
 * every other instruction yields a history entry and possibly a layer.
 */
struct BuildStep {
    BuildState state;
    boost::optional<Layer> layer;
    boost::optional<common::HistoryEntry> history;
    std::shared_ptr<const ImageState> base;
};

/**
 * Applies one instruction to a build state.
 *
 * FROM replaces the state with the base image. COPY and ADD write into a copy of
 * the filesystem and produce a layer with the changed entries. RUN hands the command
 * to the executor and wraps the returned mutation into a layer, unless the executor
 * is simulated: then no layer is produced and the history marks the step as simulated.
 * All other instructions only change the image configuration.
 */
class LayerBuilder {
public:
    static const std::string SIMULATED_RUN_MARKER;

public:
    LayerBuilder(std::shared_ptr<const BuildContext> context,
                 std::shared_ptr<CommandExecutor> executor,
                 std::shared_ptr<const SourceResolver> resolver,
                 std::map<std::string, std::string> buildArgs,
                 std::string created);

    BuildStep apply(const BuildState& state, const common::Instruction& instruction) const;
    void setGlobalArgs(const std::map<std::string, std::string>& args) { globalArgs = args; }

private:
    void applyFrom(BuildStep& step, const common::Instruction& instruction) const;
    void applyRun(BuildStep& step, const common::Instruction& instruction) const;
    void applyCopy(BuildStep& step, const common::Instruction& instruction) const;
    void applyConfiguration(BuildStep& step, const common::Instruction& instruction) const;
    void applyArg(BuildStep& step, const common::Instruction& instruction) const;
    libstratum::CLIArguments makeCommand(const BuildState& state, const common::Instruction& instruction) const;
    std::vector<SourceItem> collectFromImage(const ImageState& image, const std::string& path) const;
    bool extractArchive(FilesystemState& filesystem, const std::string& destination,
                        const std::string& data, const FileEntry& archiveEntry) const;
    common::HistoryEntry makeHistory(const std::string& createdBy, bool emptyLayer,
                                     const std::string& comment = "") const;
    void printLog(const boost::format& message, libstratum::LogLevel level) const;

private:
    const std::string sysname = "LayerBuilder";
    std::shared_ptr<const BuildContext> context;
    std::shared_ptr<CommandExecutor> executor;
    std::shared_ptr<const SourceResolver> resolver;
    std::map<std::string, std::string> buildArgs;
    std::map<std::string, std::string> globalArgs;
    std::string created;
};

}
}

#endif
