/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_cli_HelpMessage_hpp
#define stratum_cli_HelpMessage_hpp

#include <ostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>


namespace stratum {
namespace cli {

/**
 * Help text of a command: usage line, description, options and examples.
 */
class HelpMessage {
    friend std::ostream& operator<<(std::ostream&, const HelpMessage&);

public:
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);
    HelpMessage& addExample(const std::string& commandLine, const std::string& explanation);

private:
    std::string usage;
    std::string description;
    // options_description can't be copy assigned
    std::shared_ptr<const boost::program_options::options_description> optionsDescription;
    std::vector<std::pair<std::string, std::string>> examples;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
