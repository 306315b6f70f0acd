#pragma once

/**
 * @file config.hpp
 * @brief Configuration file: function whitelists
 *
 * {"schema_version": "config.v1",
 *  "function_whitelists": [{"function_name": "...", "crate_name": "...",
 *                           "crate_version": "...", "strict": false}]}
 */

#include "panicscan/common.hpp"
#include "panicscan/panic_analysis.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace panicscan::config {

/// Looked up in the working directory when no file is named explicitly.
inline constexpr std::string_view kDefaultConfigFile = "panicscan.json";

struct FileOptions
{
    std::vector<panic_analysis::FunctionWhitelistEntry> function_whitelists;
};

/**
 * Convert a schema-valid configuration document.
 * @return InvalidConfig for entries the schema cannot rule out (blank names)
 */
[[nodiscard]] Result<FileOptions> parse_config(const nlohmann::json& document);

/**
 * Load, validate and convert a configuration file.
 *
 * A missing file yields default options unless `required` is set (ReadError).
 * Malformed JSON is a ParseError; schema violations are SchemaValidationFailed.
 *
 * @param path Configuration file
 * @param required The file was named on the command line
 * @param schema_dir Directory holding config.v1.schema.json
 */
[[nodiscard]] Result<FileOptions>
load_config(const std::string& path, bool required, const std::string& schema_dir);

}  // namespace panicscan::config
