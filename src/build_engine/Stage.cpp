/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/Stage.hpp"

#include <boost/format.hpp>

#include "libstratum/Error.hpp"


namespace stratum {
namespace build_engine {

std::string stageStatusToString(StageStatus status) {
    switch(status) {
    case StageStatus::Pending:
        return "Pending";
    case StageStatus::Running:
        return "Running";
    case StageStatus::Completed:
        return "Completed";
    case StageStatus::Failed:
        return "Failed";
    }
    return "Unknown";
}

Stage::Stage(common::StageDefinition definition)
    : definition(std::move(definition))
{}

const FilesystemState& Stage::getFinalFilesystemState() const {
    checkStatus(StageStatus::Completed, "get the final filesystem state of");
    return result->filesystem;
}

std::shared_ptr<const ImageState> Stage::getResult() const {
    checkStatus(StageStatus::Completed, "get the result of");
    return result;
}

void Stage::start() {
    checkStatus(StageStatus::Pending, "start");
    status = StageStatus::Running;
}

void Stage::inheritBase(const ImageState& base) {
    checkStatus(StageStatus::Running, "set the base image of");
    image = base;
    baseLayerCount = base.layers.size();
}

void Stage::recordInstruction(const FilesystemState& filesystem,
                              const common::ImageMetadata& metadata,
                              const boost::optional<Layer>& layer,
                              const common::HistoryEntry& history) {
    checkStatus(StageStatus::Running, "record an instruction in");
    image.filesystem = filesystem;
    image.metadata = metadata;
    if(layer) {
        auto stored = *layer;
        stored.blob.reset(); // the bytes live in the content store from now on
        image.layers.push_back(stored);
    }
    image.history.push_back(history);
    ++executedInstructions;
}

void Stage::complete() {
    checkStatus(StageStatus::Running, "complete");
    result = std::make_shared<const ImageState>(image);
    status = StageStatus::Completed;
}

void Stage::fail(boost::optional<std::size_t> instructionIndex) {
    failedInstruction = instructionIndex;
    status = StageStatus::Failed;
}

void Stage::checkStatus(StageStatus expected, const std::string& operation) const {
    if(status != expected) {
        auto message = boost::format("Cannot %s stage %s: stage is %s (expected %s)")
            % operation % getDisplayName() % stageStatusToString(status) % stageStatusToString(expected);
        STRATUM_THROW_ERROR(message.str());
    }
}

}
}
