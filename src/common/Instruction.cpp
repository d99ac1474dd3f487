/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Instruction.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>

namespace stratum {
namespace common {

static const std::vector<std::pair<InstructionKind, std::string>> keywords = {
    {InstructionKind::FROM, "FROM"},
    {InstructionKind::RUN, "RUN"},
    {InstructionKind::COPY, "COPY"},
    {InstructionKind::ADD, "ADD"},
    {InstructionKind::WORKDIR, "WORKDIR"},
    {InstructionKind::ENV, "ENV"},
    {InstructionKind::CMD, "CMD"},
    {InstructionKind::ENTRYPOINT, "ENTRYPOINT"},
    {InstructionKind::EXPOSE, "EXPOSE"},
    {InstructionKind::LABEL, "LABEL"},
    {InstructionKind::ARG, "ARG"},
    {InstructionKind::USER, "USER"},
    {InstructionKind::VOLUME, "VOLUME"},
    {InstructionKind::STOPSIGNAL, "STOPSIGNAL"},
    {InstructionKind::SHELL, "SHELL"}
};

std::string instructionKindToString(InstructionKind kind) {
    auto it = std::find_if(keywords.cbegin(), keywords.cend(), [kind](const std::pair<InstructionKind, std::string>& entry) {
        return entry.first == kind;
    });
    return it->second;
}

boost::optional<InstructionKind> instructionKindFromString(const std::string& keyword) {
    auto upperCase = boost::algorithm::to_upper_copy(keyword);
    for(const auto& entry : keywords) {
        if(entry.second == upperCase) {
            return entry.first;
        }
    }
    return boost::none;
}

/**
 * Textual form of the instruction, e.g. "COPY --from=builder /app /app".
 */
std::string Instruction::string() const {
    auto s = instructionKindToString(kind);
    if(!text.empty()) {
        return s + " " + text;
    }
    if(sourceStage) {
        s += " --from=" + *sourceStage;
    }
    for(const auto& flag : flags) {
        s += " --" + flag.first + "=" + flag.second;
    }
    if(execForm) {
        auto quoted = std::vector<std::string>{};
        for(const auto& argument : arguments) {
            quoted.push_back("\"" + argument + "\"");
        }
        return s + " [" + boost::algorithm::join(quoted, ",") + "]";
    }
    for(const auto& argument : arguments) {
        s += " " + argument;
    }
    return s;
}

bool operator==(const Instruction& lhs, const Instruction& rhs) {
    return lhs.kind == rhs.kind
        && lhs.arguments == rhs.arguments
        && lhs.sourceStage == rhs.sourceStage
        && lhs.flags == rhs.flags
        && lhs.execForm == rhs.execForm;
}

}
}
