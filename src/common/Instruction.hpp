/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef stratum_common_Instruction_hpp
#define stratum_common_Instruction_hpp

#include <string>
#include <vector>
#include <map>
#include <cstddef>

#include <boost/optional.hpp>

namespace stratum {
namespace common {

enum class InstructionKind {
    FROM, RUN, COPY, ADD, WORKDIR, ENV, CMD, ENTRYPOINT, EXPOSE, LABEL, ARG, USER, VOLUME,
    STOPSIGNAL, SHELL
};

std::string instructionKindToString(InstructionKind kind);
boost::optional<InstructionKind> instructionKindFromString(const std::string& keyword);

/**
 * One Dockerfile instruction, as produced by the parser. Conventions for the arguments:
 *
 * FROM                 [image]
 * RUN, CMD, ENTRYPOINT [command line] in shell form, or the argv in exec form (execForm=true)
 * SHELL                the shell argv (always exec form)
 * COPY, ADD            [source..., destination]; sourceStage is set for --from=<stage>
 * ENV, LABEL           ["key=value", ...]
 * ARG                  ["name"] or ["name=default"]
 * EXPOSE               ["port[/protocol]", ...]
 * VOLUME               [path, ...]
 * WORKDIR, USER, STOPSIGNAL   [value]
 */
struct Instruction {
    InstructionKind kind = InstructionKind::RUN;
    std::vector<std::string> arguments;
    boost::optional<std::string> sourceStage;
    std::map<std::string, std::string> flags;
    bool execForm = false;
    std::size_t line = 0;
    std::string text;

    std::string string() const;
};

bool operator==(const Instruction&, const Instruction&);

}
}

#endif
