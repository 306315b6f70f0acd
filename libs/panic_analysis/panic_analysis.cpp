/**
 * @file panic_analysis.cpp
 * @brief Entry point reachability, panic reachability and trace extraction
 */

#include "panicscan/panic_analysis.hpp"

#include "panicscan/crates.hpp"
#include "panicscan/log.hpp"
#include "patterns.hpp"

#include <algorithm>
#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace panicscan::panic_analysis {

namespace {

using callgraph::CallGraph;
using callgraph::EdgeIndex;
using callgraph::InvocationType;
using callgraph::NodeIndex;
using callgraph::Procedure;

constexpr std::string_view kEntryPointName = "main";

[[nodiscard]] Result<std::unordered_set<std::string>> analysis_crates(const CallGraph& graph,
                                                                      const AnalysisOptions& options)
{
    if (!options.crate_names.empty()) {
        return std::unordered_set<std::string>(options.crate_names.begin(), options.crate_names.end());
    }
    for (const NodeIndex idx : graph.graph().node_indices()) {
        const Procedure& procedure = graph.procedure(idx);
        if (!procedure.is_placeholder && procedure.name == kEntryPointName
            && procedure.defining_crate.name != callgraph::kStdlibCrateName) {
            log::info("analysis target: crate {}", procedure.defining_crate.name);
            return std::unordered_set<std::string>{procedure.defining_crate.name};
        }
    }
    return std::unexpected(Error::make("AnalysisTargetNotFound",
                                       "No crate given and no `main` function found outside the standard library"));
}

void mark_reachable(CallGraph& graph, const std::vector<NodeIndex>& entries)
{
    std::unordered_set<NodeIndex> visited(entries.begin(), entries.end());
    std::deque<NodeIndex> queue(entries.begin(), entries.end());
    while (!queue.empty()) {
        const NodeIndex node = queue.front();
        queue.pop_front();
        graph.update_procedure_attributes(node, [](auto& attrs) { attrs.reachable_from_entry_point = true; });
        for (const NodeIndex next : graph.graph().successors(node)) {
            if (visited.insert(next).second) {
                queue.push_back(next);
            }
        }
    }
}

void mark_whitelisted(CallGraph& graph, const std::vector<FunctionWhitelistEntry>& whitelist)
{
    if (whitelist.empty()) {
        return;
    }
    for (const NodeIndex idx : graph.graph().node_indices()) {
        const Procedure& procedure = graph.procedure(idx);
        const bool listed = std::ranges::any_of(whitelist, [&procedure](const auto& entry) {
            return matches_whitelist(entry, procedure);
        });
        if (!listed) {
            continue;
        }
        graph.update_procedure_attributes(idx, [](auto& attrs) { attrs.whitelisted = true; });
        for (const EdgeIndex edge : graph.graph().incoming_edges(idx)) {
            graph.update_invocation_attributes(edge, [](auto& attrs) { attrs.whitelisted = true; });
        }
    }
}

/**
 * Reverse BFS from the panic nodes. For every node that can reach a panic,
 * the edge starting the shortest such path (absent for panic nodes).
 */
[[nodiscard]] std::unordered_map<NodeIndex, std::optional<EdgeIndex>>
panic_paths(const CallGraph& graph, const std::vector<NodeIndex>& panic_nodes)
{
    std::unordered_map<NodeIndex, std::optional<EdgeIndex>> next_edge;
    std::deque<NodeIndex> queue;
    for (const NodeIndex node : panic_nodes) {
        if (!graph.procedure(node).attributes.whitelisted) {
            next_edge.emplace(node, std::nullopt);
            queue.push_back(node);
        }
    }
    while (!queue.empty()) {
        const NodeIndex node = queue.front();
        queue.pop_front();
        for (const EdgeIndex edge : graph.graph().incoming_edges(node)) {
            const NodeIndex caller = graph.graph().edge_source(edge);
            if (graph.invocation(edge).attributes.whitelisted
                || graph.procedure(caller).attributes.whitelisted || next_edge.contains(caller)) {
                continue;
            }
            next_edge.emplace(caller, edge);
            queue.push_back(caller);
        }
    }
    return next_edge;
}

[[nodiscard]] bool is_dynamic(InvocationType type)
{
    return type == InvocationType::kVTable || type == InvocationType::kProcedureReference;
}

}  // namespace

Result<PanicCallsCollection> find_panics(CallGraph& graph,
                                         const callgraph::CompilationInfo& info,
                                         const AnalysisOptions& options)
{
    auto crates = analysis_crates(graph, options);
    if (!crates) {
        return std::unexpected(crates.error());
    }

    std::vector<NodeIndex> target;
    std::unordered_set<NodeIndex> in_target;
    std::vector<NodeIndex> panic_nodes;
    for (const NodeIndex idx : graph.graph().node_indices()) {
        const Procedure& procedure = graph.procedure(idx);
        if (is_panic_primitive(procedure.display_name(), info.toolchain_version)
            || is_panic_primitive(procedure.name, info.toolchain_version)) {
            graph.update_procedure_attributes(idx, [](auto& attrs) { attrs.is_panic = true; });
            panic_nodes.push_back(idx);
        }
        if (!procedure.is_placeholder && crates->contains(procedure.defining_crate.name)) {
            target.push_back(idx);
            in_target.insert(idx);
        }
    }
    std::ranges::sort(target, {}, [&graph](NodeIndex idx) { return graph.procedure(idx).start_address; });
    log::info("{} procedures in analysis target, {} panic primitives", target.size(), panic_nodes.size());

    std::vector<NodeIndex> entries;
    for (const NodeIndex idx : target) {
        if (options.full_crate_analysis || graph.procedure(idx).name == kEntryPointName) {
            entries.push_back(idx);
        }
    }
    if (entries.empty()) {
        log::warn("no `main` in the analysis target; analysing every procedure");
        entries = target;
    }
    for (const NodeIndex idx : entries) {
        graph.update_procedure_attributes(idx, [](auto& attrs) { attrs.entry_point = true; });
    }
    mark_reachable(graph, entries);
    mark_whitelisted(graph, options.whitelisted_functions);

    const auto next_edge = panic_paths(graph, panic_nodes);

    std::unordered_set<NodeIndex> unresolved_origins;
    for (const auto& unresolved : graph.unresolved_invocations()) {
        unresolved_origins.insert(unresolved.enclosing);
    }

    PanicCallsCollection result;
    for (const NodeIndex origin : target) {
        const Procedure& procedure = graph.procedure(origin);
        if (!procedure.attributes.reachable_from_entry_point || procedure.attributes.is_panic
            || procedure.attributes.whitelisted) {
            continue;
        }
        const auto edges = graph.graph().outgoing_edges(origin);
        std::vector<EdgeIndex> outgoing(edges.begin(), edges.end());
        std::ranges::sort(outgoing, {}, [&graph](EdgeIndex e) { return graph.invocation(e).call_site; });

        for (const EdgeIndex edge : outgoing) {
            const NodeIndex callee = graph.graph().edge_target(edge);
            if (in_target.contains(callee) || graph.invocation(edge).attributes.whitelisted
                || !next_edge.contains(callee)) {
                continue;
            }

            PanicTrace trace;
            trace.backtrace.push_back({.procedure = origin, .outgoing_invocation = edge});
            trace.contains_dynamic_invocation = unresolved_origins.contains(origin)
                                                || is_dynamic(graph.invocation(edge).invocation_type);
            for (NodeIndex node = callee;;) {
                const auto& step = next_edge.at(node);
                trace.backtrace.push_back({.procedure = node, .outgoing_invocation = step});
                if (!step) {
                    break;
                }
                trace.contains_dynamic_invocation = trace.contains_dynamic_invocation
                                                    || is_dynamic(graph.invocation(*step).invocation_type);
                node = graph.graph().edge_target(*step);
            }
            trace.pattern = detail::classify(graph, trace);
            trace.message = detail::panic_message(graph, trace);
            result.calls.push_back(std::move(trace));
            graph.update_procedure_attributes(origin, [](auto& attrs) { attrs.is_panic_origin = true; });
        }
    }

    log::info("{} panic traces", result.calls.size());
    return result;
}

}  // namespace panicscan::panic_analysis
