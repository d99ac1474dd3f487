/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_Command_hpp
#define stratum_cli_Command_hpp

#include <string>

namespace stratum {
namespace cli {

class Command {
public:
    virtual ~Command() {}
    virtual void execute() = 0;
    virtual std::string getBriefDescription() const = 0;
    virtual void printHelpMessage() const = 0;
};

}
}

#endif
