/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_build_engine_Stage_hpp
#define stratum_build_engine_Stage_hpp

#include <string>
#include <vector>
#include <memory>
#include <cstddef>

#include <boost/optional.hpp>

#include "common/Dockerfile.hpp"
#include "common/ImageMetadata.hpp"
#include "common/ImageSpec.hpp"
#include "build_engine/FilesystemState.hpp"
#include "build_engine/Layer.hpp"


namespace stratum {
namespace build_engine {

/**
 * An image as seen by the build: a base image a stage starts from, or the result a
 * completed stage hands over to the stages depending on it.
 */
struct ImageState {
    FilesystemState filesystem;
    common::ImageMetadata metadata;
    std::vector<Layer> layers;
    std::vector<common::HistoryEntry> history;
};

enum class StageStatus {Pending, Running, Completed, Failed};

std::string stageStatusToString(StageStatus status);

/**
 * One stage of a multi-stage build and its execution state.
 *
 * Status goes Pending -> Running -> Completed or Running -> Failed. While Running, the
 * stage is only touched by the thread executing it; once Completed its result is
 * immutable and shared read-only by the dependent stages.
 */
class Stage {
public:
    explicit Stage(common::StageDefinition definition);

    const common::StageDefinition& getDefinition() const { return definition; }
    std::string getDisplayName() const { return definition.getDisplayName(); }
    StageStatus getStatus() const { return status; }

    const std::vector<Layer>& getLayers() const { return image.layers; }
    const std::vector<common::HistoryEntry>& getHistory() const { return image.history; }
    const common::ImageMetadata& getMetadata() const { return image.metadata; }
    const FilesystemState& getFinalFilesystemState() const;
    std::size_t getBaseLayerCount() const { return baseLayerCount; }
    std::size_t getExecutedInstructionCount() const { return executedInstructions; }
    boost::optional<std::size_t> getFailedInstruction() const { return failedInstruction; }
    std::shared_ptr<const ImageState> getResult() const;

    void start();
    void inheritBase(const ImageState& base);
    void recordInstruction(const FilesystemState& filesystem,
                           const common::ImageMetadata& metadata,
                           const boost::optional<Layer>& layer,
                           const common::HistoryEntry& history);
    void complete();
    void fail(boost::optional<std::size_t> instructionIndex);

private:
    void checkStatus(StageStatus expected, const std::string& operation) const;

private:
    common::StageDefinition definition;
    StageStatus status = StageStatus::Pending;
    ImageState image;
    std::shared_ptr<const ImageState> result;
    std::size_t baseLayerCount = 0;
    std::size_t executedInstructions = 0;
    boost::optional<std::size_t> failedInstruction;
};

}
}

#endif
