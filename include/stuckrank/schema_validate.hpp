#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of input documents and reports
 */

#include "stuckrank/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace stuckrank::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, SchemaInvalid (or a schema loading error) on failure
 */
[[nodiscard]] VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path);

/**
 * Validate against "<schema_dir>/<schema_version>.schema.json".
 * An empty schema_dir disables validation.
 */
[[nodiscard]] VoidResult validate_document(const nlohmann::json& j,
                                           std::string_view schema_dir,
                                           std::string_view schema_version);

}  // namespace stuckrank::common
