/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "stuckrank/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace stuckrank::common {

namespace {

[[nodiscard]] std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", context, error.description);
    }
    return text;
}

}  // namespace

VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    std::ifstream schema_stream(schema_path);
    if (!schema_stream) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + schema_path));
    }

    nlohmann::json schema_json;
    try {
        schema_stream >> schema_json;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed", std::string("Failed to parse schema JSON: ") + ex.what()));
    }

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaInvalid", std::move(error)));
    }
    return {};
}

VoidResult validate_document(const nlohmann::json& j,
                             std::string_view schema_dir,
                             std::string_view schema_version)
{
    if (schema_dir.empty()) {
        return {};
    }
    const auto schema_path =
        std::filesystem::path(schema_dir) / std::format("{}.schema.json", schema_version);
    return validate_json(j, schema_path.string());
}

}  // namespace stuckrank::common
