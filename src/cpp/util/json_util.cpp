/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "souk/util/json_util.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace souk::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent, decimals] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    if (json.IsString()) [[likely]] {
        return util::str2decimal(json.GetString());
    } else {
        throw std::invalid_argument{fmt::format(
            "{}: Ill-formed Json value to form a decimal with: {}",
            std::source_location::current().function_name(),
            json2str(json))};
    }
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

void addDecimalMember(rapidjson::Document& json, const char* key, decimal_t val)
{
    auto& allocator = json.GetAllocator();
    const auto str = fmt::format("{}", val);
    json.AddMember(
        rapidjson::Value{key, allocator},
        rapidjson::Value{str.c_str(), allocator},
        allocator);
}

//-------------------------------------------------------------------------

}  // namespace souk::json

//-------------------------------------------------------------------------
