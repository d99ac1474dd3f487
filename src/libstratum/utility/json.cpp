/*
 * Stratum
 *
 * Copyright (c) 2023-2026, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>
#include <sstream>

#include <boost/format.hpp>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include "libstratum/Error.hpp"
#include "libstratum/utility/filesystem.hpp"

/**
 * Utility functions for JSON operations
 */

namespace libstratum {
namespace json {

rapidjson::Document parseStream(std::istream& is) {
    auto json = rapidjson::Document{};

    try {
        rapidjson::IStreamWrapper isw(is);
        json.ParseStream(isw);
    }
    catch (const std::exception& e) {
        STRATUM_RETHROW_ERROR(e, "Error parsing JSON stream");
    }

    return json;
}

rapidjson::Document parse(const std::string& string) {
    auto json = rapidjson::Document{};
    json.Parse(string.c_str(), string.size());
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON string:\n'%s'\nInput data is not valid JSON\n"
            "Error(offset %u): %s")
            % string
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        STRATUM_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    std::ifstream ifs(filename.string());
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % filename;
        STRATUM_THROW_ERROR(message.str());
    }
    auto json = parseStream(ifs);
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON file %s. Input data is not valid JSON\n"
            "Error(offset %u): %s")
            % filename
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        STRATUM_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile) {
    auto schemaJSON = json::read(schemaFile);
    return rapidjson::SchemaDocument{ schemaJSON };
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    auto schema = readSchema(schemaFile);

    rapidjson::Document json;

    try {
        std::ifstream inputStream(jsonFile.string());
        if(!inputStream) {
            auto message = boost::format("Failed to open JSON file %s") % jsonFile;
            STRATUM_THROW_ERROR(message.str());
        }
        rapidjson::IStreamWrapper streamWrapper(inputStream);
        // Parse JSON from reader, validate the SAX events, and populate the Document.
        rapidjson::SchemaValidatingReader<rapidjson::kParseDefaultFlags, rapidjson::IStreamWrapper, rapidjson::UTF8<> > reader(streamWrapper, schema);
        json.Populate(reader);

        if (!reader.GetParseResult()) {
            // Parsing terminates either because the document violates the
            // schema or because the input is not valid JSON
            if (!reader.IsValid()) {
                rapidjson::StringBuffer sb;
                reader.GetInvalidSchemaPointer().StringifyUriFragment(sb);
                auto message = boost::format("Invalid schema: %s\n") % sb.GetString();
                message = boost::format("%sInvalid keyword: %s\n") % message % reader.GetInvalidSchemaKeyword();
                sb.Clear();
                reader.GetInvalidDocumentPointer().StringifyUriFragment(sb);
                message = boost::format("%sInvalid document: %s\n") % message % sb.GetString();
                sb.Clear();
                rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
                reader.GetError().Accept(w);
                message = boost::format("%sError report:\n%s") % message % sb.GetString();
                STRATUM_THROW_ERROR(message.str());
            }
            else {
                auto message = boost::format("Error parsing JSON file: %s") % jsonFile;
                STRATUM_THROW_ERROR(message.str());
            }
        }
    }
    catch(const libstratum::Error&) {
        throw;
    }
    catch (const std::exception& e) {
        auto message = boost::format("Error reading JSON file %s") % jsonFile;
        STRATUM_RETHROW_ERROR(e, message.str());
    }

    return json;
}

void write(const rapidjson::Value& json, const boost::filesystem::path& filename) {
    try {
        filesystem::createFoldersIfNecessary(filename.parent_path());
        std::ofstream ofs(filename.string());
        if(!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            STRATUM_THROW_ERROR(message.str());
        }
        rapidjson::OStreamWrapper osw(ofs);
        rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(osw);
        writer.SetIndent(' ', 3);
        json.Accept(writer);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write JSON to %s") % filename;
        STRATUM_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Compact serialization. Members are written in insertion order, so documents
 * built the same way always serialize to the same bytes.
 */
std::string serialize(const rapidjson::Value& json) {
    namespace rj = rapidjson;
    rj::StringBuffer buffer;
    rj::Writer<rj::StringBuffer> writer(buffer);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

const rapidjson::Value& getMember(const rapidjson::Value& object, const char* name) {
    if(!object.IsObject()) {
        auto message = boost::format("Failed to look up JSON member '%s': value is not an object") % name;
        STRATUM_THROW_ERROR(message.str());
    }
    auto it = object.FindMember(name);
    if(it == object.MemberEnd()) {
        auto message = boost::format("JSON object has no member '%s'") % name;
        STRATUM_THROW_ERROR(message.str());
    }
    return it->value;
}

std::string getString(const rapidjson::Value& object, const char* name) {
    const auto& value = getMember(object, name);
    if(!value.IsString()) {
        auto message = boost::format("JSON member '%s' is not a string") % name;
        STRATUM_THROW_ERROR(message.str());
    }
    return std::string(value.GetString(), value.GetStringLength());
}

int64_t getInt64(const rapidjson::Value& object, const char* name) {
    const auto& value = getMember(object, name);
    if(!value.IsInt64()) {
        auto message = boost::format("JSON member '%s' is not an integer") % name;
        STRATUM_THROW_ERROR(message.str());
    }
    return value.GetInt64();
}

rapidjson::Value makeString(const std::string& s, rapidjson::Document::AllocatorType& allocator) {
    return rapidjson::Value{s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator};
}

}}
