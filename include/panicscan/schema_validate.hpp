#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON document loading and JSON Schema validation
 */

#include "panicscan/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace panicscan::common {

/**
 * Read and parse a JSON file.
 * @return ReadError when the file cannot be opened, ParseError on malformed JSON
 */
[[nodiscard]] Result<nlohmann::json> read_json_file(const std::string& path);

/**
 * Validate JSON against a JSON Schema file. `$ref`s of the form
 * "panicscan:schema/<name>" resolve to "<name>.schema.json" beside it.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path);

}  // namespace panicscan::common
