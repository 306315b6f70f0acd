#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, Result aliases, path normalization
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace panicscan {

/**
 * @brief Error information for Result types
 *
 * Codes used across the pipeline:
 *   IOError       binary or input file could not be opened
 *   ReadError     a referenced file could not be read correctly
 *   ParseError    binary, debug info or JSON could not be parsed
 *   NotSupported  binary needs functionality this tool does not implement
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace panicscan

namespace panicscan::common {

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 * - Optionally make relative to repo_root
 *
 * @param input Input path
 * @param repo_root Optional repository root for relative paths
 * @return Normalized path
 */
[[nodiscard]] std::string normalize_path(std::string_view input, std::string_view repo_root = "");

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Resolve a (possibly relative) source path against a compilation directory.
 * Absolute paths are only normalized.
 */
[[nodiscard]] std::string resolve_path(std::string_view path, std::string_view base_dir);

/**
 * Last non-empty component of a normalized path ("" for "/" or ".")
 */
[[nodiscard]] std::string last_path_component(std::string_view path);

}  // namespace panicscan::common
