#pragma once

/**
 * @file output.hpp
 * @brief Panic trace rendering and call graph export
 *
 * Trace output modes:
 *   simple   one line per trace: origin, first callee and its crate, origin location
 *   verbose  numbered traces with pattern, message and the full backtrace
 *            including inlined frames
 *   json     a stream of pretty-printed trace.v1 objects
 */

#include "panicscan/callgraph.hpp"
#include "panicscan/common.hpp"
#include "panicscan/panic_analysis.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace panicscan::output {

struct OutputOptions
{
    bool silent = false;
    bool verbose = false;
    bool json = false;  ///< takes precedence over verbose
};

enum class CallGraphKind {
    kFull,
    kFiltered  ///< only procedures and invocations on some panic trace
};

[[nodiscard]] std::string_view to_string(CallGraphKind kind) noexcept;

/// "name (crate@version)"; the version is omitted when unknown.
[[nodiscard]] std::string format_crate(const callgraph::Crate& crate);

[[nodiscard]] std::string format_simple(const callgraph::CallGraph& graph,
                                        const panic_analysis::PanicTrace& trace);

/// `number` is 1-based and zero-padded to `width` digits.
[[nodiscard]] std::string format_verbose(const callgraph::CallGraph& graph,
                                         const panic_analysis::PanicTrace& trace,
                                         std::size_t number,
                                         std::size_t width);

[[nodiscard]] nlohmann::json trace_to_json(const callgraph::CallGraph& graph,
                                           const panic_analysis::PanicTrace& trace,
                                           std::size_t index);

void print_results(const OutputOptions& options,
                   const callgraph::CallGraph& graph,
                   const panic_analysis::PanicCallsCollection& results,
                   std::FILE* out);

[[nodiscard]] nlohmann::json export_call_graph(const callgraph::CallGraph& graph,
                                               const panic_analysis::PanicCallsCollection& results,
                                               CallGraphKind kind,
                                               std::string_view binary_name);

/// "panicscan-callgraph-<binary file name>-<full|filtered>.json"
[[nodiscard]] std::string call_graph_file_name(std::string_view binary_path, CallGraphKind kind);

/// Write `document` as canonical JSON.
[[nodiscard]] VoidResult write_json_file(const std::string& path, const nlohmann::json& document);

}  // namespace panicscan::output
