/**
 * @file trace_output.cpp
 * @brief Simple, verbose and JSON rendering of panic traces
 */

#include "panicscan/output.hpp"

#include <cstddef>
#include <format>
#include <optional>
#include <print>
#include <ranges>
#include <string>
#include <utility>

namespace panicscan::output {

namespace {

using callgraph::CallGraph;
using callgraph::Procedure;
using panic_analysis::PanicTrace;

[[nodiscard]] nlohmann::json version_json(const std::optional<std::string>& version)
{
    return version ? nlohmann::json(*version) : nlohmann::json(nullptr);
}

[[nodiscard]] nlohmann::json crate_json(const callgraph::Crate& crate)
{
    return nlohmann::json{
        {   "name",            crate.name},
        {"version", version_json(crate.version)}
    };
}

[[nodiscard]] nlohmann::json location_json(const callgraph::Location& location)
{
    return nlohmann::json{
        {"file", location.file},
        {"line", location.line}
    };
}

[[nodiscard]] nlohmann::json procedure_json(const Procedure& procedure)
{
    return nlohmann::json{
        {                  "name",                                                                   procedure.name},
        {          "linkage_name",                                                           procedure.linkage_name},
        {"linkage_name_demangled",                                                 procedure.linkage_name_demangled},
        {                 "crate",                                               crate_json(procedure.defining_crate)},
        {              "location", procedure.location ? location_json(*procedure.location) : nlohmann::json(nullptr)},
        {              "is_entry",                                                procedure.attributes.entry_point},
        {          "is_reachable",                                 procedure.attributes.reachable_from_entry_point},
        {              "is_panic",                                                   procedure.attributes.is_panic},
        {       "is_panic_origin",                                            procedure.attributes.is_panic_origin},
        {        "is_whitelisted",                                                procedure.attributes.whitelisted}
    };
}

[[nodiscard]] nlohmann::json invocation_json(const callgraph::Invocation& invocation)
{
    nlohmann::json frames = nlohmann::json::array();
    for (auto [i, frame] : std::views::enumerate(invocation.frames)) {
        frames.push_back(nlohmann::json{
            {   "index",                               i},
            {"function",             frame.function_name},
            {"location",     location_json(frame.location)},
            {   "crate", crate_json(frame.defining_crate)}
        });
    }
    return nlohmann::json{
        {          "type", std::string(callgraph::to_string(invocation.invocation_type))},
        {"is_whitelisted",        invocation.attributes.whitelisted},
        {        "frames",                      std::move(frames)}
    };
}

[[nodiscard]] std::string format_location(const std::optional<callgraph::Location>& location)
{
    if (!location) {
        return {};
    }
    return std::format("{}:{}", location->file, location->line);
}

[[nodiscard]] std::size_t digit_count(std::size_t value)
{
    std::size_t digits = 1;
    for (; value >= 10; value /= 10) {
        ++digits;
    }
    return digits;
}

}  // namespace

std::string format_crate(const callgraph::Crate& crate)
{
    if (crate.version) {
        return std::format("{}@{}", crate.name, *crate.version);
    }
    return crate.name;
}

std::string format_simple(const CallGraph& graph, const PanicTrace& trace)
{
    if (trace.backtrace.empty()) {
        return {};
    }
    const Procedure& origin = graph.procedure(trace.backtrace.front().procedure);
    std::string line = origin.display_name();
    if (trace.backtrace.size() > 1) {
        const Procedure& callee = graph.procedure(trace.backtrace[1].procedure);
        line += std::format(" calls {} ({})", callee.display_name(), format_crate(callee.defining_crate));
    }
    if (origin.location) {
        line += " at " + format_location(origin.location);
    }
    return line;
}

std::string format_verbose(const CallGraph& graph, const PanicTrace& trace, std::size_t number, std::size_t width)
{
    std::string text = std::format("--#{:0{}} --Pattern: {}\n",
                                   number,
                                   width,
                                   panic_analysis::display_name(trace.pattern));
    if (trace.message) {
        text += std::format("--Message: {}\n", *trace.message);
    }
    if (trace.contains_dynamic_invocation) {
        text += "--Contains dynamic invocation, the trace may be a false positive\n";
    }
    text += '\n';
    for (auto [i, element] : std::views::enumerate(trace.backtrace)) {
        const Procedure& procedure = graph.procedure(element.procedure);
        text += std::format("{:>3}: {} ({})\n", i, procedure.display_name(), format_crate(procedure.defining_crate));
        if (procedure.location) {
            text += std::format("         at {}\n", format_location(procedure.location));
        }
        if (!element.outgoing_invocation) {
            continue;
        }
        for (const auto& frame : graph.invocation(*element.outgoing_invocation).frames) {
            text += std::format("         <inline {} at {}:{} >\n",
                                frame.function_name,
                                frame.location.file,
                                frame.location.line);
        }
    }
    return text;
}

nlohmann::json trace_to_json(const CallGraph& graph, const PanicTrace& trace, std::size_t index)
{
    nlohmann::json backtrace = nlohmann::json::array();
    for (auto [i, element] : std::views::enumerate(trace.backtrace)) {
        backtrace.push_back(nlohmann::json{
            {    "index",                                                                                   i},
            {"procedure",                                          procedure_json(graph.procedure(element.procedure))},
            {"invocation", element.outgoing_invocation
                                 ? invocation_json(graph.invocation(*element.outgoing_invocation))
                                 : nlohmann::json(nullptr)}
        });
    }
    return nlohmann::json{
        {             "index",                                                  index},
        {           "pattern",                     std::string(panic_analysis::to_string(trace.pattern))},
        {           "message", trace.message ? nlohmann::json(*trace.message) : nlohmann::json(nullptr)},
        {"dynamic_invocation",                         trace.contains_dynamic_invocation},
        {         "backtrace",                                      std::move(backtrace)}
    };
}

void print_results(const OutputOptions& options,
                   const CallGraph& graph,
                   const panic_analysis::PanicCallsCollection& results,
                   std::FILE* out)
{
    if (options.silent) {
        return;
    }
    if (options.json) {
        for (auto [i, trace] : std::views::enumerate(results.calls)) {
            const auto document = trace_to_json(graph, trace, static_cast<std::size_t>(i));
            std::print(out,
                       "\n\n{}\n\n",
                       document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
        }
        return;
    }
    if (options.verbose) {
        std::println(out, "{} calls found that lead to panic!", results.calls.size());
        const std::size_t width = digit_count(results.calls.size());
        for (auto [i, trace] : std::views::enumerate(results.calls)) {
            std::print(out, "{}", format_verbose(graph, trace, static_cast<std::size_t>(i) + 1, width));
        }
        return;
    }
    for (const auto& trace : results.calls) {
        std::println(out, "{}", format_simple(graph, trace));
    }
}

}  // namespace panicscan::output
