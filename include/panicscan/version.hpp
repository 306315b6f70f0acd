#pragma once

/**
 * @file version.hpp
 * @brief panicscan version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace panicscan {

/// panicscan version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of emitted and consumed documents
constexpr const char* kConfigSchemaVersion = "config.v1";
constexpr const char* kTraceSchemaVersion = "trace.v1";
constexpr const char* kCallGraphSchemaVersion = "callgraph.v1";

}  // namespace panicscan
