#pragma once

/**
 * @file patterns.hpp
 * @brief Panic trace classification
 */

#include "panicscan/panic_analysis.hpp"

#include <optional>
#include <string>

namespace panicscan::panic_analysis::detail {

[[nodiscard]] PanicPattern classify(const callgraph::CallGraph& graph, const PanicTrace& trace);

/// Message the panic primitive of `trace` is known to print, if any.
[[nodiscard]] std::optional<std::string> panic_message(const callgraph::CallGraph& graph,
                                                       const PanicTrace& trace);

}  // namespace panicscan::panic_analysis::detail
