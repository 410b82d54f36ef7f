#pragma once

/**
 * @file json_fields.hpp
 * @brief Checked field access for input documents
 */

#include "stuckrank/common.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace stuckrank::common {

struct JsonFieldContext
{
    const nlohmann::json* obj = nullptr;
    std::string_view key;
    std::string_view context;
};

/// Integer value representable as std::int32_t.
[[nodiscard]] bool fits_int32(const nlohmann::json& value);

[[nodiscard]] Result<std::string> require_string(const JsonFieldContext& input);
[[nodiscard]] Result<std::int32_t> require_int(const JsonFieldContext& input);
[[nodiscard]] Result<const nlohmann::json*> require_array(const JsonFieldContext& input);
[[nodiscard]] Result<const nlohmann::json*> require_object(const JsonFieldContext& input);

/// Absent key yields std::nullopt; a present key of the wrong type is an error.
[[nodiscard]] Result<std::optional<std::string>> optional_string(const JsonFieldContext& input);
[[nodiscard]] Result<std::optional<std::int32_t>> optional_int(const JsonFieldContext& input);
[[nodiscard]] Result<bool> optional_bool(const JsonFieldContext& input, bool fallback);
[[nodiscard]] Result<std::vector<std::string>> optional_string_array(const JsonFieldContext& input);

/// Read and parse a JSON file. Fails with IOError or ParseError.
[[nodiscard]] Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

}  // namespace stuckrank::common
