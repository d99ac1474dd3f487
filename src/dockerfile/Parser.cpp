/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "dockerfile/Parser.hpp"

#include <set>
#include <sstream>
#include <cctype>

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <rapidjson/document.h>

#include "libstratum/Error.hpp"
#include "libstratum/Logger.hpp"
#include "libstratum/utility/filesystem.hpp"


namespace stratum {
namespace dockerfile {

using common::Instruction;
using common::InstructionKind;

common::Dockerfile Parser::parseFile(const boost::filesystem::path& file) const {
    if(!boost::filesystem::is_regular_file(file)) {
        auto message = boost::format("Dockerfile %s not found") % file;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::NotFound, message.str());
    }
    printLog(boost::format("Parsing Dockerfile %s") % file, libstratum::LogLevel::INFO);
    return parse(libstratum::filesystem::readFile(file));
}

common::Dockerfile Parser::parse(const std::string& text) const {
    auto dockerfile = common::Dockerfile{};
    auto stageNames = std::set<std::string>{};

    for(const auto& line : makeLogicalLines(text)) {
        auto instruction = parseInstruction(line);

        if(instruction.kind == InstructionKind::FROM) {
            auto stage = common::StageDefinition{};
            stage.index = dockerfile.stages.size();
            stage.baseReference = instruction.arguments[0];
            if(instruction.arguments.size() == 2) {
                stage.name = instruction.arguments[1];
                if(!stageNames.insert(*stage.name).second) {
                    throwParseError(line.number, boost::format("duplicate stage name '%s'") % *stage.name);
                }
            }
            stage.from = instruction;
            dockerfile.stages.push_back(std::move(stage));
        }
        else if(dockerfile.stages.empty()) {
            if(instruction.kind != InstructionKind::ARG) {
                throwParseError(line.number, boost::format("%s instruction before the first FROM (only ARG is allowed)")
                                % common::instructionKindToString(instruction.kind));
            }
            dockerfile.globalArgs.push_back(std::move(instruction));
        }
        else {
            dockerfile.stages.back().instructions.push_back(std::move(instruction));
        }
    }

    if(dockerfile.stages.empty()) {
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, "Dockerfile contains no FROM instruction");
    }

    printLog(boost::format("Parsed Dockerfile with %d stage(s)") % dockerfile.stages.size(), libstratum::LogLevel::DEBUG);
    return dockerfile;
}

/**
 * Joins the physical lines continued with a trailing backslash and drops comments
 * and blank lines. Each logical line keeps the number of its first physical line.
 */
std::vector<Parser::LogicalLine> Parser::makeLogicalLines(const std::string& text) const {
    auto lines = std::vector<LogicalLine>{};
    auto is = std::istringstream{text};
    auto physical = std::string{};
    auto number = std::size_t{0};
    auto pending = boost::optional<LogicalLine>{};

    while(std::getline(is, physical)) {
        ++number;
        if(!physical.empty() && physical.back() == '\r') {
            physical.pop_back();
        }

        auto trimmed = boost::algorithm::trim_copy(physical);
        if(trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        bool continued = trimmed.back() == '\\';
        auto content = physical;
        if(continued) {
            content = boost::algorithm::trim_right_copy(physical);
            content.pop_back();
        }

        if(pending) {
            pending->content += content;
        }
        else {
            pending = LogicalLine{number, boost::algorithm::trim_left_copy(content)};
        }

        if(!continued) {
            lines.push_back(*pending);
            pending = boost::none;
        }
    }

    if(pending) {
        lines.push_back(*pending);
    }

    return lines;
}

Instruction Parser::parseInstruction(const LogicalLine& line) const {
    auto content = boost::algorithm::trim_copy(line.content);
    auto separator = content.find_first_of(" \t");
    auto keyword = content.substr(0, separator);
    auto rest = separator == std::string::npos
        ? std::string{}
        : boost::algorithm::trim_copy(content.substr(separator));

    auto kind = common::instructionKindFromString(keyword);
    if(!kind) {
        auto upperCase = boost::algorithm::to_upper_copy(keyword);
        if(upperCase == "ONBUILD" || upperCase == "HEALTHCHECK" || upperCase == "MAINTAINER") {
            throwParseError(line.number, boost::format("unsupported instruction '%s'") % keyword);
        }
        throwParseError(line.number, boost::format("unknown instruction '%s'") % keyword);
    }

    auto instruction = Instruction{};
    instruction.kind = *kind;
    instruction.line = line.number;
    instruction.text = rest;

    if(rest.empty()) {
        throwParseError(line.number, boost::format("%s requires at least one argument") % common::instructionKindToString(*kind));
    }

    try {
        switch(instruction.kind) {
        case InstructionKind::FROM:
            parseFrom(instruction, rest);
            break;
        case InstructionKind::RUN:
        case InstructionKind::CMD:
        case InstructionKind::ENTRYPOINT:
        case InstructionKind::SHELL:
            parseCommand(instruction, rest);
            break;
        case InstructionKind::COPY:
        case InstructionKind::ADD:
            parseCopy(instruction, rest);
            break;
        case InstructionKind::ENV:
            parseKeyValuePairs(instruction, rest, true);
            break;
        case InstructionKind::LABEL:
            parseKeyValuePairs(instruction, rest, false);
            break;
        case InstructionKind::ARG:
            parseArg(instruction, rest);
            break;
        case InstructionKind::EXPOSE:
            parseExpose(instruction, rest);
            break;
        case InstructionKind::VOLUME:
            parseVolume(instruction, rest);
            break;
        case InstructionKind::WORKDIR:
        case InstructionKind::USER:
        case InstructionKind::STOPSIGNAL:
            parseSingleValue(instruction, rest);
            break;
        }
    }
    catch(libstratum::Error& e) {
        e.setErrorCode(libstratum::ErrorCode::ParseError);
        auto message = boost::format("Dockerfile line %d: invalid %s instruction")
            % line.number % common::instructionKindToString(instruction.kind);
        STRATUM_RETHROW_ERROR(e, message.str());
    }

    return instruction;
}

/**
 * Removes the leading "--name=value" flags from 'rest' and returns them.
 */
std::map<std::string, std::string> Parser::extractFlags(std::string& rest, std::size_t line) const {
    auto flags = std::map<std::string, std::string>{};
    while(boost::algorithm::starts_with(rest, "--")) {
        auto end = rest.find_first_of(" \t");
        auto flag = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
        auto equal = flag.find('=');
        if(equal == std::string::npos || equal == 0) {
            throwParseError(line, boost::format("malformed flag '--%s' (expected --name=value)") % flag);
        }
        flags[flag.substr(0, equal)] = flag.substr(equal + 1);
        rest = end == std::string::npos ? std::string{} : boost::algorithm::trim_left_copy(rest.substr(end));
    }
    return flags;
}

void Parser::parseFrom(Instruction& instruction, const std::string& rest) const {
    auto remaining = rest;
    auto flags = extractFlags(remaining, instruction.line);
    for(const auto& flag : flags) {
        if(flag.first != "platform") {
            throwParseError(instruction.line, boost::format("unknown flag '--%s' for FROM") % flag.first);
        }
    }
    instruction.flags = flags;

    auto words = std::vector<std::string>{};
    boost::algorithm::split(words, remaining, boost::algorithm::is_any_of(" \t"), boost::algorithm::token_compress_on);

    if(words.size() == 1) {
        instruction.arguments = words;
    }
    else if(words.size() == 3 && boost::algorithm::iequals(words[1], "AS")) {
        auto name = boost::algorithm::to_lower_copy(words[2]);
        if(!boost::regex_match(name, boost::regex{"^[a-z][a-z0-9_.-]*$"})) {
            throwParseError(instruction.line, boost::format("invalid stage name '%s'") % words[2]);
        }
        instruction.arguments = {words[0], name};
    }
    else {
        throwParseError(instruction.line, boost::format("expected 'FROM <image> [AS <name>]', got 'FROM %s'") % rest);
    }
}

/**
 * RUN, CMD, ENTRYPOINT and SHELL. A JSON array of strings is the exec form,
 * anything else is the shell form, as in Docker.
 */
void Parser::parseCommand(Instruction& instruction, const std::string& rest) const {
    auto remaining = rest;
    if(instruction.kind == InstructionKind::RUN) {
        auto flags = extractFlags(remaining, instruction.line);
        if(!flags.empty()) {
            throwParseError(instruction.line, boost::format("unsupported flag '--%s' for RUN") % flags.cbegin()->first);
        }
    }

    auto array = std::vector<std::string>{};
    if(parseJSONArray(remaining, array)) {
        if(array.empty() && instruction.kind != InstructionKind::CMD && instruction.kind != InstructionKind::ENTRYPOINT) {
            throwParseError(instruction.line, boost::format("%s requires a non-empty command")
                            % common::instructionKindToString(instruction.kind));
        }
        instruction.execForm = true;
        instruction.arguments = array;
        return;
    }

    if(instruction.kind == InstructionKind::SHELL) {
        throwParseError(instruction.line, boost::format("SHELL requires the JSON array form, got '%s'") % rest);
    }
    instruction.arguments = {remaining};
}

void Parser::parseCopy(Instruction& instruction, std::string rest) const {
    auto keyword = common::instructionKindToString(instruction.kind);
    auto flags = extractFlags(rest, instruction.line);

    for(const auto& flag : flags) {
        if(flag.first == "from" && instruction.kind == InstructionKind::COPY) {
            if(flag.second.empty()) {
                throwParseError(instruction.line, boost::format("empty --from flag"));
            }
            instruction.sourceStage = flag.second;
        }
        else if(flag.first == "chown") {
            instruction.flags["chown"] = flag.second;
        }
        else if(flag.first == "chmod") {
            if(!boost::regex_match(flag.second, boost::regex{"^[0-7]{3,4}$"})) {
                throwParseError(instruction.line, boost::format("invalid --chmod value '%s' (expected octal mode)") % flag.second);
            }
            instruction.flags["chmod"] = flag.second;
        }
        else {
            throwParseError(instruction.line, boost::format("unknown flag '--%s' for %s") % flag.first % keyword);
        }
    }

    auto arguments = std::vector<std::string>{};
    if(parseJSONArray(rest, arguments)) {
        instruction.execForm = true;
    }
    else {
        arguments = splitQuotedWords(rest);
    }

    if(arguments.size() < 2) {
        throwParseError(instruction.line, boost::format("%s requires at least one source and a destination") % keyword);
    }
    instruction.arguments = arguments;
}

/**
 * ENV and LABEL: "key=value ..." pairs. ENV also accepts the legacy "key value" form,
 * where the value is the rest of the line.
 */
void Parser::parseKeyValuePairs(Instruction& instruction, const std::string& rest, bool allowLegacyForm) const {
    auto keyword = common::instructionKindToString(instruction.kind);
    auto words = splitQuotedWords(rest);
    auto firstWord = rest.substr(0, rest.find_first_of(" \t"));

    if(allowLegacyForm && firstWord.find('=') == std::string::npos) {
        auto separator = rest.find_first_of(" \t");
        if(separator == std::string::npos) {
            throwParseError(instruction.line, boost::format("%s %s is missing a value") % keyword % rest);
        }
        auto value = boost::algorithm::trim_copy(rest.substr(separator));
        auto unquoted = splitQuotedWords(value);
        if(unquoted.size() == 1) {
            value = unquoted[0];
        }
        instruction.arguments = {firstWord + "=" + value};
        return;
    }

    for(const auto& word : words) {
        auto equal = word.find('=');
        if(equal == std::string::npos || equal == 0) {
            throwParseError(instruction.line, boost::format("%s expects key=value pairs, got '%s'") % keyword % word);
        }
        instruction.arguments.push_back(word);
    }
}

void Parser::parseArg(Instruction& instruction, const std::string& rest) const {
    for(const auto& word : splitQuotedWords(rest)) {
        auto name = word.substr(0, word.find('='));
        if(!boost::regex_match(name, boost::regex{"^[A-Za-z_][A-Za-z0-9_]*$"})) {
            throwParseError(instruction.line, boost::format("invalid ARG name '%s'") % name);
        }
        instruction.arguments.push_back(word);
    }
}

void Parser::parseExpose(Instruction& instruction, const std::string& rest) const {
    auto portRegex = boost::regex{"^[0-9]+(-[0-9]+)?(/(tcp|udp|sctp))?$", boost::regex::icase};
    for(const auto& word : splitQuotedWords(rest)) {
        // ports with variables are checked once expanded
        if(word.find('$') == std::string::npos && !boost::regex_match(word, portRegex)) {
            throwParseError(instruction.line, boost::format("invalid port '%s'") % word);
        }
        instruction.arguments.push_back(word);
    }
}

void Parser::parseVolume(Instruction& instruction, const std::string& rest) const {
    auto array = std::vector<std::string>{};
    if(parseJSONArray(rest, array)) {
        instruction.execForm = true;
        instruction.arguments = array;
    }
    else {
        instruction.arguments = splitQuotedWords(rest);
    }
    if(instruction.arguments.empty()) {
        throwParseError(instruction.line, boost::format("VOLUME requires at least one path"));
    }
}

void Parser::parseSingleValue(Instruction& instruction, const std::string& rest) const {
    if(instruction.kind == InstructionKind::WORKDIR) {
        // WORKDIR takes the whole line, spaces included
        auto words = splitQuotedWords(rest);
        instruction.arguments = {words.size() == 1 ? words[0] : rest};
        return;
    }
    auto words = splitQuotedWords(rest);
    if(words.size() != 1) {
        throwParseError(instruction.line, boost::format("%s expects exactly one argument, got '%s'")
                        % common::instructionKindToString(instruction.kind) % rest);
    }
    instruction.arguments = words;
}

bool Parser::parseJSONArray(const std::string& rest, std::vector<std::string>& array) const {
    if(rest.empty() || rest.front() != '[') {
        return false;
    }
    auto json = rapidjson::Document{};
    json.Parse(rest.c_str());
    if(json.HasParseError() || !json.IsArray()) {
        return false;
    }
    auto values = std::vector<std::string>{};
    for(const auto& value : json.GetArray()) {
        if(!value.IsString()) {
            return false;
        }
        values.push_back(value.GetString());
    }
    array = values;
    return true;
}

void Parser::throwParseError(std::size_t line, const boost::format& message) const {
    auto fullMessage = boost::format("Dockerfile line %d: %s") % line % message.str();
    STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, fullMessage.str());
}

void Parser::printLog(const boost::format& message, libstratum::LogLevel level) const {
    libstratum::Logger::getInstance().log(message, sysname, level);
}

std::vector<std::string> splitQuotedWords(const std::string& input) {
    auto words = std::vector<std::string>{};
    auto word = std::string{};
    bool inWord = false;
    char quote = 0;

    for(std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if(c == '\\' && quote != '\'' && i + 1 < input.size()) {
            // an escaped '$' stays escaped for the variable expansion
            if(input[i + 1] == '$') {
                word += '\\';
            }
            word += input[++i];
            inWord = true;
        }
        else if(quote != 0) {
            if(c == quote) {
                quote = 0;
            }
            else {
                word += c;
            }
        }
        else if(c == '"' || c == '\'') {
            quote = c;
            inWord = true;
        }
        else if(std::isspace(static_cast<unsigned char>(c))) {
            if(inWord) {
                words.push_back(word);
                word.clear();
                inWord = false;
            }
        }
        else {
            word += c;
            inWord = true;
        }
    }

    if(quote != 0) {
        auto message = boost::format("unterminated %c quote in '%s'") % quote % input;
        STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, message.str());
    }
    if(inWord) {
        words.push_back(word);
    }
    return words;
}

}
}
