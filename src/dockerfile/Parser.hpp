/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#ifndef stratum_dockerfile_Parser_hpp
#define stratum_dockerfile_Parser_hpp

#include <string>
#include <vector>
#include <map>
#include <cstddef>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libstratum/LogLevel.hpp"
#include "common/Instruction.hpp"
#include "common/Dockerfile.hpp"


namespace stratum {
namespace dockerfile {

/**
 * Turns the text of a Dockerfile into the instruction AST consumed by the build engine.
 *
 * Malformed input raises a libstratum::Error with code ParseError whose message names
 * the offending line. Variables are not expanded here: expansion depends on the ARG and
 * ENV values in scope at build time.
 */
class Parser {
public:
    common::Dockerfile parse(const std::string& text) const;
    common::Dockerfile parseFile(const boost::filesystem::path& file) const;

private:
    struct LogicalLine {
        std::size_t number;
        std::string content;
    };

    std::vector<LogicalLine> makeLogicalLines(const std::string& text) const;
    common::Instruction parseInstruction(const LogicalLine& line) const;
    std::map<std::string, std::string> extractFlags(std::string& rest, std::size_t line) const;
    void parseFrom(common::Instruction& instruction, const std::string& rest) const;
    void parseCommand(common::Instruction& instruction, const std::string& rest) const;
    void parseCopy(common::Instruction& instruction, std::string rest) const;
    void parseKeyValuePairs(common::Instruction& instruction, const std::string& rest, bool allowLegacyForm) const;
    void parseArg(common::Instruction& instruction, const std::string& rest) const;
    void parseExpose(common::Instruction& instruction, const std::string& rest) const;
    void parseVolume(common::Instruction& instruction, const std::string& rest) const;
    void parseSingleValue(common::Instruction& instruction, const std::string& rest) const;
    bool parseJSONArray(const std::string& rest, std::vector<std::string>& array) const;
    [[noreturn]] void throwParseError(std::size_t line, const boost::format& message) const;
    void printLog(const boost::format& message, libstratum::LogLevel level) const;

private:
    const std::string sysname = "Parser";
};

/**
 * Splits a string into words at unquoted whitespace. Single and double quotes group
 * words and are removed, a backslash escapes the next character.
 */
std::vector<std::string> splitQuotedWords(const std::string& input);

}
}

#endif
