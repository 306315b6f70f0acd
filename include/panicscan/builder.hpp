#pragma once

/**
 * @file builder.hpp
 * @brief Call graph construction from a Context
 */

#include "panicscan/callgraph.hpp"
#include "panicscan/context.hpp"
#include "panicscan/invocation_finder.hpp"

#include <memory>
#include <vector>

namespace panicscan::callgraph {

/// Compilation-unit directories and toolchain version, extracted once per build.
[[nodiscard]] CompilationInfo make_compilation_info(const Context& ctx);

class CallGraphBuilder
{
public:
    /// Finders run in the given order; see default_invocation_finders().
    explicit CallGraphBuilder(std::vector<std::unique_ptr<InvocationFinder>> finders);

    /**
     * Populate nodes and call-site indices from every compilation unit, then
     * run each finder once. Missing edges never fail construction.
     */
    [[nodiscard]] CallGraph build_call_graph(const Context& ctx) const;

    [[nodiscard]] const std::vector<std::unique_ptr<InvocationFinder>>& finders() const noexcept
    {
        return m_finders;
    }

private:
    std::vector<std::unique_ptr<InvocationFinder>> m_finders;
};

}  // namespace panicscan::callgraph
