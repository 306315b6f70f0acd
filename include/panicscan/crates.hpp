#pragma once

/**
 * @file crates.hpp
 * @brief Crate provenance and toolchain version detection
 */

#include "panicscan/callgraph.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace panicscan::callgraph {

/// Crate name used for every standard library compilation unit.
constexpr std::string_view kStdlibCrateName = "stdlib";

/**
 * Extract the toolchain version from a DW_AT_producer string, e.g.
 * "clang LLVM (rustc version 1.26.2 (594fb253c 2018-06-01))" -> "1.26.2".
 */
[[nodiscard]] std::optional<std::string> parse_toolchain_version(std::string_view producer);

/**
 * Compare dotted numeric versions component-wise; pre-release suffixes are
 * ignored. Returns <0, 0 or >0.
 */
[[nodiscard]] int compare_versions(std::string_view lhs, std::string_view rhs);

/// True when `version` is known and at least `minimum`.
[[nodiscard]] bool version_at_least(std::string_view version, std::string_view minimum);

/**
 * Source path prefixes under which the toolchain's standard library sources
 * appear in debug info. Unknown versions accept every known prefix.
 */
[[nodiscard]] std::vector<std::string> stdlib_path_prefixes(std::string_view toolchain_version);

[[nodiscard]] bool is_stdlib_path(std::string_view path, std::string_view toolchain_version);

/// Crate defining a compilation unit, from its DW_AT_name and DW_AT_comp_dir.
[[nodiscard]] Crate crate_for_compilation_unit(std::string_view unit_name,
                                               std::string_view comp_dir,
                                               const CompilationInfo& info);

/// Crate owning a source file; `fallback` when the path carries no crate.
[[nodiscard]] Crate crate_for_file(std::string_view file,
                                   const Crate& fallback,
                                   const CompilationInfo& info);

/// Drop the legacy Rust symbol hash suffix ("::h0123456789abcdef").
[[nodiscard]] std::string strip_symbol_hash(std::string_view demangled);

}  // namespace panicscan::callgraph
