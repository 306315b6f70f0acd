/**
 * @file patterns.cpp
 * @brief Panic primitives, whitelist matching and trace classification
 */

#include "patterns.hpp"

#include "panicscan/crates.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <ranges>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace panicscan::panic_analysis {

namespace {

using callgraph::CallGraph;
using callgraph::Procedure;

constexpr std::array<std::string_view, 9> kPanicPrimitives = {
    "std::panicking::begin_panic",
    "std::panicking::begin_panic_fmt",
    "std::panicking::rust_panic_with_hook",
    "std::panicking::begin_panic_handler",
    "core::panicking::panic",
    "core::panicking::panic_fmt",
    "core::panicking::panic_bounds_check",
    "rust_begin_unwind",
    "rust_panic",
};

/// Primitives that appeared with the panic_const rework of the standard library.
constexpr std::string_view kPanicConstSince = "1.71.0";
constexpr std::string_view kPanicConstPrefix = "core::panicking::panic_const::";
constexpr std::array<std::string_view, 5> kPanicConstPrimitives = {
    "core::panicking::panic_nounwind",
    "core::panicking::panic_explicit",
    "core::option::unwrap_failed",
    "core::result::unwrap_failed",
    "core::option::expect_failed",
};

constexpr std::array<std::string_view, 6> kIndexingMarkers = {
    "panic_bounds_check",
    "slice_index_len_fail",
    "slice_start_index_len_fail",
    "slice_end_index_len_fail",
    "slice_index_order_fail",
    "str::slice_error_fail",
};

constexpr std::array<std::string_view, 6> kUnwrapMarkers = {
    "::unwrap",
    "::expect",
    "::unwrap_err",
    "::expect_err",
    "unwrap_failed",
    "expect_failed",
};

/// panic_const operation -> verb used in the overflow message
constexpr std::array<std::pair<std::string_view, std::string_view>, 8> kArithmeticVerbs = {{
    {"add", "add"},
    {"sub", "subtract"},
    {"mul", "multiply"},
    {"div", "divide"},
    {"rem", "calculate the remainder"},
    {"neg", "negate"},
    {"shl", "shift left"},
    {"shr", "shift right"},
}};

[[nodiscard]] bool contains_any(std::string_view text, std::span<const std::string_view> markers)
{
    return std::ranges::any_of(markers, [text](std::string_view m) { return text.contains(m); });
}

[[nodiscard]] bool is_unwrap_name(std::string_view name)
{
    const std::string base = base_name(name);
    return std::ranges::any_of(kUnwrapMarkers, [&base](std::string_view m) {
        return m.starts_with("::") ? base.ends_with(m) : base.contains(m);
    });
}

[[nodiscard]] bool is_arithmetic_name(std::string_view name)
{
    return name.contains("panic_const_") && (name.contains("overflow") || name.contains("by_zero"));
}

/// Messages of overflow checks that older toolchains pass to `core::panicking::panic`.
[[nodiscard]] bool is_arithmetic_message(std::string_view message)
{
    return message.starts_with("attempt to")
           && (message.ends_with("with overflow") || message.ends_with("by zero")
               || message.ends_with("divisor of zero"));
}

/// Procedure names of the trace, outermost first.
template <typename Visitor>
void visit_names(const CallGraph& graph, const PanicTrace& trace, Visitor&& visit)
{
    for (const TraceElement& element : trace.backtrace) {
        visit(graph.procedure(element.procedure).display_name());
        if (element.outgoing_invocation) {
            for (const auto& frame : graph.invocation(*element.outgoing_invocation).frames) {
                visit(std::string_view(frame.function_name));
            }
        }
    }
}

/// String literals handed to panic primitives along the trace, outermost first.
[[nodiscard]] std::vector<std::string_view> message_arguments(const CallGraph& graph, const PanicTrace& trace)
{
    std::vector<std::string_view> messages;
    for (const TraceElement& element : trace.backtrace) {
        if (!element.outgoing_invocation) {
            continue;
        }
        if (const auto& message = graph.invocation(*element.outgoing_invocation).message_argument) {
            messages.emplace_back(*message);
        }
    }
    return messages;
}

template <typename Predicate>
[[nodiscard]] bool any_name(const CallGraph& graph, const PanicTrace& trace, Predicate&& predicate)
{
    bool found = false;
    visit_names(graph, trace, [&](std::string_view name) { found = found || predicate(name); });
    return found;
}

[[nodiscard]] std::optional<std::string> arithmetic_message(std::string_view name)
{
    // "...::panic_const_add_overflow" / "...::panic_const_div_by_zero"
    const auto pos = name.rfind("panic_const_");
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    const auto kind = name.substr(pos + std::string_view("panic_const_").size());
    if (kind.starts_with("div_by_zero")) {
        return "attempt to divide by zero";
    }
    if (kind.starts_with("rem_by_zero")) {
        return "attempt to calculate the remainder with a divisor of zero";
    }
    for (const auto& [op, verb] : kArithmeticVerbs) {
        if (kind.starts_with(op) && kind.contains("overflow")) {
            return std::format("attempt to {} with overflow", verb);
        }
    }
    return std::nullopt;
}

}  // namespace

std::string_view to_string(PanicPattern pattern) noexcept
{
    switch (pattern) {
        case PanicPattern::kUnrecognized:
            return "unrecognized";
        case PanicPattern::kDirectCall:
            return "direct_call";
        case PanicPattern::kUnwrap:
            return "unwrap";
        case PanicPattern::kIndexing:
            return "indexing";
        case PanicPattern::kArithmetic:
            return "arithmetic";
    }
    return "unrecognized";
}

std::string_view display_name(PanicPattern pattern) noexcept
{
    switch (pattern) {
        case PanicPattern::kUnrecognized:
            return "Unrecognized";
        case PanicPattern::kDirectCall:
            return "DirectCall";
        case PanicPattern::kUnwrap:
            return "Unwrap";
        case PanicPattern::kIndexing:
            return "Indexing";
        case PanicPattern::kArithmetic:
            return "Arithmetic";
    }
    return "Unrecognized";
}

std::string base_name(std::string_view name)
{
    std::string base = callgraph::strip_symbol_hash(name);
    // Drop trailing generic arguments: "f::<T>" / "f<T>"
    while (base.ends_with('>')) {
        int depth = 0;
        std::size_t open = std::string::npos;
        for (std::size_t i = base.size(); i-- > 0;) {
            if (base[i] == '>') {
                ++depth;
            } else if (base[i] == '<' && --depth == 0) {
                open = i;
                break;
            }
        }
        if (open == std::string::npos || open == 0) {
            break;
        }
        base.erase(open);
        if (base.ends_with("::")) {
            base.erase(base.size() - 2);
        }
    }
    return base;
}

bool is_panic_primitive(std::string_view name, std::string_view toolchain_version)
{
    const std::string base = base_name(name);
    if (std::ranges::find(kPanicPrimitives, base) != kPanicPrimitives.end()) {
        return true;
    }
    if (!toolchain_version.empty() && !callgraph::version_at_least(toolchain_version, kPanicConstSince)) {
        return false;
    }
    return base.starts_with(kPanicConstPrefix)
           || std::ranges::find(kPanicConstPrimitives, base) != kPanicConstPrimitives.end();
}

bool matches_whitelist(const FunctionWhitelistEntry& entry, const Procedure& procedure)
{
    if (entry.crate_name && *entry.crate_name != procedure.defining_crate.name) {
        return false;
    }
    if (entry.crate_version && entry.crate_version != procedure.defining_crate.version) {
        return false;
    }
    const std::array<std::string, 2> names = {callgraph::strip_symbol_hash(procedure.display_name()),
                                              procedure.name};
    return std::ranges::any_of(names, [&entry](const std::string& name) {
        return entry.strict ? name == entry.function_name : name.contains(entry.function_name);
    });
}

namespace detail {

PanicPattern classify(const CallGraph& graph, const PanicTrace& trace)
{
    if (trace.backtrace.empty()) {
        return PanicPattern::kUnrecognized;
    }
    if (any_name(graph, trace, [](std::string_view n) { return contains_any(n, kIndexingMarkers); })) {
        return PanicPattern::kIndexing;
    }
    if (any_name(graph, trace, is_arithmetic_name)
        || std::ranges::any_of(message_arguments(graph, trace), is_arithmetic_message)) {
        return PanicPattern::kArithmetic;
    }
    if (any_name(graph, trace, is_unwrap_name)) {
        return PanicPattern::kUnwrap;
    }
    const TraceElement& origin = trace.backtrace.front();
    if (origin.outgoing_invocation) {
        const auto callee = graph.graph().edge_target(*origin.outgoing_invocation);
        if (graph.procedure(callee).attributes.is_panic) {
            return PanicPattern::kDirectCall;
        }
    }
    return PanicPattern::kUnrecognized;
}

std::optional<std::string> panic_message(const CallGraph& graph, const PanicTrace& trace)
{
    std::optional<std::string> message;
    visit_names(graph, trace, [&message](std::string_view name) {
        if (message) {
            return;
        }
        const std::string base = base_name(name);
        if (auto arithmetic = arithmetic_message(base)) {
            message = std::move(arithmetic);
        } else if (base == "core::option::unwrap_failed") {
            message = "called `Option::unwrap()` on a `None` value";
        } else if (base == "core::result::unwrap_failed") {
            message = "called `Result::unwrap()` on an `Err` value";
        } else if (base.ends_with("panic_bounds_check")) {
            message = "index out of bounds";
        }
    });
    if (!message) {
        if (const auto arguments = message_arguments(graph, trace); !arguments.empty()) {
            message = std::string(arguments.front());
        }
    }
    return message;
}

}  // namespace detail

}  // namespace panicscan::panic_analysis
