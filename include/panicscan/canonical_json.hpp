#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for reproducible call graph exports
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only; addresses are written as "0x..." strings
 */

#include "panicscan/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace panicscan::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string, or FloatingPointNotAllowed naming the offending path
 */
[[nodiscard]] Result<std::string> canonicalize(const nlohmann::json& j);

}  // namespace panicscan::canonical
