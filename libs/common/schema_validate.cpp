/**
 * @file schema_validate.cpp
 * @brief JSON document loading and JSON Schema validation using valijson
 */

#include "panicscan/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <string_view>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace panicscan::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "panicscan:schema/";
constexpr std::string_view kDefsPrefix = "#/$defs/";

/// valijson resolves draft-07 "definitions"; rewrite 2019-09 "$defs" references.
void normalize_schema_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            normalize_schema_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
    }
    for (auto& [key, value] : schema.items()) {
        if (key != "$ref") {
            normalize_schema_defs(value);
            continue;
        }
        if (value.is_string()) {
            const auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
        }
    }
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string message;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!message.empty()) {
            message += '\n';
        }
        message += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return message;
}

}  // namespace

Result<nlohmann::json> read_json_file(const std::string& path)
{
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error::make("ReadError", "Failed to open file: " + path));
    }
    try {
        return nlohmann::json::parse(stream);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Failed to parse JSON in {}: {}", path, ex.what())));
    }
}

VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = read_json_file(schema_path);
    if (!schema_json) {
        const bool unreadable = schema_json.error().code == "ReadError";
        return std::unexpected(Error::make(unreadable ? "SchemaFileOpenFailed" : "SchemaParseFailed",
                                           schema_json.error().message));
    }
    normalize_schema_defs(*schema_json);

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> owned_schemas;
    const auto fetch_doc = [&schema_dir,
                            &owned_schemas](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        const auto name = uri.substr(kSchemaUriPrefix.size());
        auto document = read_json_file((schema_dir / (name + ".schema.json")).string());
        if (!document) {
            return nullptr;
        }
        normalize_schema_defs(*document);
        owned_schemas.push_back(std::make_unique<nlohmann::json>(std::move(*document)));
        return owned_schemas.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
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
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }
    return {};
}

}  // namespace panicscan::common
