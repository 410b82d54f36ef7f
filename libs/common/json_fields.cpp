/**
 * @file json_fields.cpp
 * @brief Checked field access for input documents
 */

#include "json_fields.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <limits>
#include <utility>

namespace stuckrank::common {

namespace {

[[nodiscard]] Error missing_field(const JsonFieldContext& input)
{
    return Error::make("MissingField",
                       std::format("Missing required field '{}' in {}", input.key, input.context));
}

[[nodiscard]] Error wrong_type(const JsonFieldContext& input, std::string_view expected)
{
    return Error::make(
        "InvalidFieldType",
        std::format("Expected {} field '{}' in {}", expected, input.key, input.context));
}

}  // namespace

bool fits_int32(const nlohmann::json& value)
{
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>()
               <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
    }
    const auto number = value.get<std::int64_t>();
    return number >= std::numeric_limits<std::int32_t>::min()
           && number <= std::numeric_limits<std::int32_t>::max();
}

Result<std::string> require_string(const JsonFieldContext& input)
{
    const nlohmann::json& obj = *input.obj;
    if (!obj.contains(input.key)) {
        return std::unexpected(missing_field(input));
    }
    if (!obj.at(input.key).is_string()) {
        return std::unexpected(wrong_type(input, "string"));
    }
    return obj.at(input.key).get<std::string>();
}

Result<std::int32_t> require_int(const JsonFieldContext& input)
{
    const nlohmann::json& obj = *input.obj;
    if (!obj.contains(input.key)) {
        return std::unexpected(missing_field(input));
    }
    if (!fits_int32(obj.at(input.key))) {
        return std::unexpected(wrong_type(input, "integer"));
    }
    return obj.at(input.key).get<std::int32_t>();
}

Result<const nlohmann::json*> require_array(const JsonFieldContext& input)
{
    const nlohmann::json& obj = *input.obj;
    if (!obj.contains(input.key)) {
        return std::unexpected(missing_field(input));
    }
    if (!obj.at(input.key).is_array()) {
        return std::unexpected(wrong_type(input, "array"));
    }
    return &obj.at(input.key);
}

Result<const nlohmann::json*> require_object(const JsonFieldContext& input)
{
    const nlohmann::json& obj = *input.obj;
    if (!obj.contains(input.key)) {
        return std::unexpected(missing_field(input));
    }
    if (!obj.at(input.key).is_object()) {
        return std::unexpected(wrong_type(input, "object"));
    }
    return &obj.at(input.key);
}

Result<std::optional<std::string>> optional_string(const JsonFieldContext& input)
{
    if (!input.obj->contains(input.key)) {
        return std::optional<std::string>{};
    }
    auto value = require_string(input);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::optional<std::string>{std::move(*value)};
}

Result<std::optional<std::int32_t>> optional_int(const JsonFieldContext& input)
{
    if (!input.obj->contains(input.key)) {
        return std::optional<std::int32_t>{};
    }
    auto value = require_int(input);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::optional<std::int32_t>{*value};
}

Result<bool> optional_bool(const JsonFieldContext& input, bool fallback)
{
    if (!input.obj->contains(input.key)) {
        return fallback;
    }
    const auto& value = input.obj->at(input.key);
    if (!value.is_boolean()) {
        return std::unexpected(wrong_type(input, "boolean"));
    }
    return value.get<bool>();
}

Result<std::vector<std::string>> optional_string_array(const JsonFieldContext& input)
{
    std::vector<std::string> values;
    if (!input.obj->contains(input.key)) {
        return values;
    }
    auto array = require_array(input);
    if (!array) {
        return std::unexpected(array.error());
    }
    values.reserve((*array)->size());
    for (const auto& entry : **array) {
        if (!entry.is_string()) {
            return std::unexpected(wrong_type(input, "string array"));
        }
        values.push_back(entry.get<std::string>());
    }
    return values;
}

Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

}  // namespace stuckrank::common
