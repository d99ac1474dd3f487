/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */


#include "build_engine/VariableExpansion.hpp"

#include <cctype>

#include <boost/format.hpp>

#include "libstratum/Error.hpp"


namespace stratum {
namespace build_engine {

static bool isNameCharacter(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::string lookup(const std::map<std::string, std::string>& variables, const std::string& name) {
    auto it = variables.find(name);
    return it != variables.cend() ? it->second : std::string{};
}

std::string expandVariables(const std::string& input, const std::map<std::string, std::string>& variables) {
    auto output = std::string{};
    std::size_t i = 0;

    while(i < input.size()) {
        char c = input[i];

        if(c == '\\' && i + 1 < input.size() && input[i + 1] == '$') {
            output += '$';
            i += 2;
        }
        else if(c != '$' || i + 1 == input.size()) {
            output += c;
            ++i;
        }
        else if(input[i + 1] == '{') {
            auto end = input.find('}', i + 2);
            if(end == std::string::npos) {
                auto message = boost::format("Unterminated variable reference in '%s'") % input;
                STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, message.str());
            }
            auto expression = input.substr(i + 2, end - i - 2);
            auto modifier = expression.find(':');
            auto name = expression.substr(0, modifier);
            auto value = lookup(variables, name);
            bool isSet = variables.count(name) > 0 && !value.empty();

            if(modifier == std::string::npos) {
                output += value;
            }
            else if(expression.compare(modifier, 2, ":-") == 0) {
                auto word = expandVariables(expression.substr(modifier + 2), variables);
                output += isSet ? value : word;
            }
            else if(expression.compare(modifier, 2, ":+") == 0) {
                auto word = expandVariables(expression.substr(modifier + 2), variables);
                output += isSet ? word : std::string{};
            }
            else {
                auto message = boost::format("Unsupported variable modifier in '${%s}'") % expression;
                STRATUM_THROW_CODED_ERROR(libstratum::ErrorCode::ParseError, message.str());
            }
            i = end + 1;
        }
        else if(isNameCharacter(input[i + 1])) {
            auto end = i + 1;
            while(end < input.size() && isNameCharacter(input[end])) {
                ++end;
            }
            output += lookup(variables, input.substr(i + 1, end - i - 1));
            i = end;
        }
        else {
            output += c;
            ++i;
        }
    }

    return output;
}

}
}
