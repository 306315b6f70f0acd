/**
 * @file graph_export.cpp
 * @brief Call graph export as callgraph.v1 canonical JSON
 */

#include "panicscan/output.hpp"

#include "panicscan/canonical_json.hpp"
#include "panicscan/common.hpp"
#include "panicscan/version.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace panicscan::output {

namespace {

using callgraph::Address;
using callgraph::CallGraph;
using callgraph::EdgeIndex;
using callgraph::NodeIndex;

[[nodiscard]] std::string hex(Address address)
{
    return std::format("{:#x}", address);
}

[[nodiscard]] nlohmann::json export_procedure(const CallGraph& graph, NodeIndex idx)
{
    const callgraph::Procedure& procedure = graph.procedure(idx);
    const auto& attrs = procedure.attributes;
    return nlohmann::json{
        {          "id",                                                               idx.value},
        {       "start",                                            hex(procedure.start_address)},
        {         "end",                                              hex(procedure.end_address)},
        {        "name",                                               procedure.display_name()},
        {"linkage_name",                                                 procedure.linkage_name},
        {       "crate",
         nlohmann::json{{"name", procedure.defining_crate.name},
         {"version",
         procedure.defining_crate.version ? nlohmann::json(*procedure.defining_crate.version)
         : nlohmann::json(nullptr)}}                                                             },
        { "placeholder",                                                 procedure.is_placeholder},
        {  "attributes",
         nlohmann::json{{"entry_point", attrs.entry_point},
         {"reachable_from_entry_point", attrs.reachable_from_entry_point},
         {"is_panic", attrs.is_panic},
         {"is_panic_origin", attrs.is_panic_origin},
         {"whitelisted", attrs.whitelisted}}                                                     }
    };
}

[[nodiscard]] nlohmann::json export_invocation(const CallGraph& graph, EdgeIndex idx)
{
    const callgraph::Invocation& invocation = graph.invocation(idx);
    nlohmann::json frames = nlohmann::json::array();
    for (const auto& frame : invocation.frames) {
        frames.push_back(frame.function_name);
    }
    return nlohmann::json{
        {     "source",                           graph.graph().edge_source(idx).value},
        {     "target",                           graph.graph().edge_target(idx).value},
        {  "call_site",                                        hex(invocation.call_site)},
        {       "type", std::string(callgraph::to_string(invocation.invocation_type))},
        {     "frames",                                                std::move(frames)},
        {"whitelisted",                                   invocation.attributes.whitelisted}
    };
}

}  // namespace

std::string_view to_string(CallGraphKind kind) noexcept
{
    return kind == CallGraphKind::kFull ? "full" : "filtered";
}

nlohmann::json export_call_graph(const CallGraph& graph,
                                 const panic_analysis::PanicCallsCollection& results,
                                 CallGraphKind kind,
                                 std::string_view binary_name)
{
    std::set<NodeIndex> nodes;
    std::set<EdgeIndex> edges;
    if (kind == CallGraphKind::kFull) {
        for (const NodeIndex idx : graph.graph().node_indices()) {
            nodes.insert(idx);
        }
        for (const EdgeIndex idx : graph.graph().edge_indices()) {
            edges.insert(idx);
        }
    } else {
        for (const auto& trace : results.calls) {
            for (const auto& element : trace.backtrace) {
                nodes.insert(element.procedure);
                if (element.outgoing_invocation) {
                    edges.insert(*element.outgoing_invocation);
                }
            }
        }
    }

    nlohmann::json procedures = nlohmann::json::array();
    for (const NodeIndex idx : nodes) {
        procedures.push_back(export_procedure(graph, idx));
    }

    std::vector<EdgeIndex> ordered(edges.begin(), edges.end());
    std::ranges::sort(ordered, {}, [&graph](EdgeIndex idx) {
        return std::tuple(graph.invocation(idx).call_site, graph.graph().edge_source(idx).value, idx.value);
    });
    nlohmann::json invocations = nlohmann::json::array();
    for (const EdgeIndex idx : ordered) {
        invocations.push_back(export_invocation(graph, idx));
    }

    nlohmann::json unresolved = nlohmann::json::array();
    for (const auto& site : graph.unresolved_invocations()) {
        if (!nodes.contains(site.enclosing)) {
            continue;
        }
        unresolved.push_back(nlohmann::json{
            {"call_site",  hex(site.call_site)},
            {"procedure", site.enclosing.value},
            {   "reason",          site.reason}
        });
    }

    const auto& version = graph.compilation_info().toolchain_version;
    return nlohmann::json{
        {   "schema_version",                                     kCallGraphSchemaVersion},
        {           "binary",                                     std::string(binary_name)},
        {             "kind",                                std::string(to_string(kind))},
        {"toolchain_version", version.empty() ? nlohmann::json(nullptr) : nlohmann::json(version)},
        {       "procedures",                                        std::move(procedures)},
        {      "invocations",                                       std::move(invocations)},
        {       "unresolved",                                        std::move(unresolved)}
    };
}

std::string call_graph_file_name(std::string_view binary_path, CallGraphKind kind)
{
    return std::format("panicscan-callgraph-{}-{}.json",
                       common::last_path_component(binary_path),
                       to_string(kind));
}

VoidResult write_json_file(const std::string& path, const nlohmann::json& document)
{
    auto canonical = canonical::canonicalize(document);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to open output file: " + path));
    }
    out << *canonical << '\n';
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write output file: " + path));
    }
    return {};
}

}  // namespace panicscan::output
