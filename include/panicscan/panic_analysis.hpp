#pragma once

/**
 * @file panic_analysis.hpp
 * @brief Paths from the analysis target to panic primitives of the Rust standard library
 */

#include "panicscan/callgraph.hpp"
#include "panicscan/common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace panicscan::panic_analysis {

/// Functions excluded from panic paths.
struct FunctionWhitelistEntry
{
    std::string function_name;
    std::optional<std::string> crate_name;
    std::optional<std::string> crate_version;
    bool strict = false;  ///< whole-name match instead of substring
};

struct AnalysisOptions
{
    std::vector<std::string> crate_names;  ///< empty: the crate defining `main`
    std::vector<FunctionWhitelistEntry> whitelisted_functions;
    bool full_crate_analysis = false;  ///< every target procedure is an entry point
};

enum class PanicPattern {
    kUnrecognized,
    kDirectCall,
    kUnwrap,
    kIndexing,
    kArithmetic
};

/// "unrecognized", "direct_call", "unwrap", "indexing", "arithmetic"
[[nodiscard]] std::string_view to_string(PanicPattern pattern) noexcept;

/// "Unrecognized", "DirectCall", ...
[[nodiscard]] std::string_view display_name(PanicPattern pattern) noexcept;

struct TraceElement
{
    callgraph::NodeIndex procedure;
    std::optional<callgraph::EdgeIndex> outgoing_invocation;  ///< empty for the panic node
};

struct PanicTrace
{
    std::vector<TraceElement> backtrace;  ///< origin first, panic primitive last
    PanicPattern pattern = PanicPattern::kUnrecognized;
    std::optional<std::string> message;
    bool contains_dynamic_invocation = false;
};

struct PanicCallsCollection
{
    std::vector<PanicTrace> calls;
};

/**
 * Name of a procedure without hash suffix and trailing generic arguments,
 * e.g. "std::panicking::begin_panic::<&str>" -> "std::panicking::begin_panic".
 */
[[nodiscard]] std::string base_name(std::string_view name);

/// Panic primitive of the given toolchain (version may be empty).
[[nodiscard]] bool is_panic_primitive(std::string_view name, std::string_view toolchain_version);

[[nodiscard]] bool matches_whitelist(const FunctionWhitelistEntry& entry,
                                     const callgraph::Procedure& procedure);

/**
 * Mark entry points, reachability, panic nodes, whitelisted procedures and
 * invocations in `graph`, then collect one trace per origin invocation that
 * leaves the analysis target and can reach a panic.
 *
 * Fails with AnalysisTargetNotFound when no crate is given and no `main`
 * outside the standard library exists.
 */
[[nodiscard]] Result<PanicCallsCollection> find_panics(callgraph::CallGraph& graph,
                                                       const callgraph::CompilationInfo& info,
                                                       const AnalysisOptions& options);

}  // namespace panicscan::panic_analysis
