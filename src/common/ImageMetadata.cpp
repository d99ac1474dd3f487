/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/ImageMetadata.hpp"

#include <tuple>
#include <algorithm>
#include <boost/format.hpp>

#include "libstratum/Error.hpp"
#include "libstratum/utility/json.hpp"
#include "libstratum/utility/string.hpp"

namespace stratum {
namespace common {

ImageMetadata::ImageMetadata(const rapidjson::Value& metadata) {
    try {
        parseJSON(metadata);
    }
    catch (const std::exception& e) {
        STRATUM_RETHROW_ERROR(e, "Error creating image metadata from JSON object");
    }
}

void ImageMetadata::setEnvironmentVariable(const std::string& key, const std::string& value) {
    auto entry = key + "=" + value;
    auto it = std::find_if(env.begin(), env.end(), [&key](const std::string& variable) {
        return variable.compare(0, key.size()+1, key + "=") == 0;
    });
    if(it != env.end()) {
        *it = entry;
    }
    else {
        env.push_back(entry);
    }
}

boost::optional<std::string> ImageMetadata::getEnvironmentVariable(const std::string& key) const {
    for(const auto& variable : env) {
        if(variable.compare(0, key.size()+1, key + "=") == 0) {
            return variable.substr(key.size()+1);
        }
    }
    return boost::none;
}

std::map<std::string, std::string> ImageMetadata::getEnvironment() const {
    auto environment = std::map<std::string, std::string>{};
    for(const auto& variable : env) {
        std::string key, value;
        std::tie(key, value) = libstratum::string::parseKeyValuePair(variable);
        environment[key] = value;
    }
    return environment;
}

static rapidjson::Value makeStringArray(const libstratum::CLIArguments& args, rapidjson::Document::AllocatorType& allocator) {
    auto array = rapidjson::Value{rapidjson::kArrayType};
    for(const auto& arg : args) {
        array.PushBack(libstratum::json::makeString(arg, allocator), allocator);
    }
    return array;
}

rapidjson::Value ImageMetadata::toJSON(rapidjson::Document::AllocatorType& allocator) const {
    namespace json = libstratum::json;
    auto object = rapidjson::Value{rapidjson::kObjectType};

    if(user) {
        object.AddMember("User", json::makeString(*user, allocator), allocator);
    }
    if(!exposedPorts.empty()) {
        auto ports = rapidjson::Value{rapidjson::kObjectType};
        for(const auto& port : exposedPorts) {
            ports.AddMember(json::makeString(port, allocator), rapidjson::Value{rapidjson::kObjectType}, allocator);
        }
        object.AddMember("ExposedPorts", ports, allocator);
    }
    if(!env.empty()) {
        auto variables = rapidjson::Value{rapidjson::kArrayType};
        for(const auto& variable : env) {
            variables.PushBack(json::makeString(variable, allocator), allocator);
        }
        object.AddMember("Env", variables, allocator);
    }
    if(entry) {
        object.AddMember("Entrypoint", makeStringArray(*entry, allocator), allocator);
    }
    if(cmd) {
        object.AddMember("Cmd", makeStringArray(*cmd, allocator), allocator);
    }
    if(!volumes.empty()) {
        auto volumesObject = rapidjson::Value{rapidjson::kObjectType};
        for(const auto& volume : volumes) {
            volumesObject.AddMember(json::makeString(volume, allocator), rapidjson::Value{rapidjson::kObjectType}, allocator);
        }
        object.AddMember("Volumes", volumesObject, allocator);
    }
    if(workdir) {
        object.AddMember("WorkingDir", json::makeString(workdir->string(), allocator), allocator);
    }
    if(!labels.empty()) {
        auto labelsObject = rapidjson::Value{rapidjson::kObjectType};
        for(const auto& label : labels) {
            labelsObject.AddMember(json::makeString(label.first, allocator), json::makeString(label.second, allocator), allocator);
        }
        object.AddMember("Labels", labelsObject, allocator);
    }
    if(stopSignal) {
        object.AddMember("StopSignal", json::makeString(*stopSignal, allocator), allocator);
    }

    return object;
}

void ImageMetadata::parseJSON(const rapidjson::Value& json) {
    if(json.IsNull()) {
        return;
    }
    if(!json.IsObject()) {
        STRATUM_THROW_ERROR("Image runtime configuration is not a JSON object");
    }

    auto parseStringArray = [](const rapidjson::Value& array) {
        auto args = libstratum::CLIArguments{};
        for(const auto& value : array.GetArray()) {
            args.push_back(value.GetString());
        }
        return args;
    };

    if(json.HasMember("User") && json["User"].IsString() && json["User"].GetStringLength() > 0) {
        user = std::string{json["User"].GetString()};
    }
    if(json.HasMember("ExposedPorts") && json["ExposedPorts"].IsObject()) {
        for(const auto& port : json["ExposedPorts"].GetObject()) {
            exposedPorts.insert(port.name.GetString());
        }
    }
    if(json.HasMember("Env") && json["Env"].IsArray()) {
        for(const auto& variable : json["Env"].GetArray()) {
            std::string key, value;
            std::tie(key, value) = libstratum::string::parseKeyValuePair(variable.GetString());
            setEnvironmentVariable(key, value);
        }
    }
    if(json.HasMember("Entrypoint") && json["Entrypoint"].IsArray()) {
        entry = parseStringArray(json["Entrypoint"]);
    }
    if(json.HasMember("Cmd") && json["Cmd"].IsArray()) {
        cmd = parseStringArray(json["Cmd"]);
    }
    if(json.HasMember("Volumes") && json["Volumes"].IsObject()) {
        for(const auto& volume : json["Volumes"].GetObject()) {
            volumes.insert(volume.name.GetString());
        }
    }
    if(json.HasMember("WorkingDir") && json["WorkingDir"].IsString() && json["WorkingDir"].GetStringLength() > 0) {
        workdir = boost::filesystem::path{json["WorkingDir"].GetString()};
    }
    if(json.HasMember("Labels") && json["Labels"].IsObject()) {
        for(const auto& label : json["Labels"].GetObject()) {
            labels[label.name.GetString()] = label.value.GetString();
        }
    }
    if(json.HasMember("StopSignal") && json["StopSignal"].IsString()) {
        stopSignal = std::string{json["StopSignal"].GetString()};
    }
}

bool operator==(const ImageMetadata& lhs, const ImageMetadata& rhs) {
    return lhs.user == rhs.user
        && lhs.exposedPorts == rhs.exposedPorts
        && lhs.env == rhs.env
        && lhs.entry == rhs.entry
        && lhs.cmd == rhs.cmd
        && lhs.volumes == rhs.volumes
        && lhs.workdir == rhs.workdir
        && lhs.labels == rhs.labels
        && lhs.stopSignal == rhs.stopSignal;
}

}
}
