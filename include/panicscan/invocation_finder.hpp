#pragma once

/**
 * @file invocation_finder.hpp
 * @brief Invocation detection strategies that populate call graph edges
 *
 * Finders run sequentially in the builder's configured order. Each finder
 * looks at one calling mechanism. A call site that already owns an outgoing
 * edge is left alone: CallGraph::add_invocation refuses a second claim.
 */

#include "panicscan/callgraph.hpp"
#include "panicscan/context.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace panicscan::callgraph {

class InvocationFinder
{
public:
    virtual ~InvocationFinder() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual void
    find_invocations(CallGraph& graph, const Context& ctx, const CompilationInfo& info) const = 0;
};

/**
 * @brief Calls with a statically encoded target
 *
 * Relative/immediate call targets, and calls through a RIP-relative slot
 * (GOT) whose content the context can resolve.
 */
class DirectCallFinder final : public InvocationFinder
{
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "direct"; }

    void find_invocations(CallGraph& graph,
                          const Context& ctx,
                          const CompilationInfo& info) const override;
};

/// Instructions that materialise the address of a procedure (function pointers).
class ProcedureReferenceFinder final : public InvocationFinder
{
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "procedure_reference"; }

    void find_invocations(CallGraph& graph,
                          const Context& ctx,
                          const CompilationInfo& info) const override;
};

/**
 * @brief Indirect calls through a dispatch table, `call [reg + disp]`
 *
 * The table is found by tracking `reg` backwards inside the enclosing
 * procedure; failing that, a slot is resolved when every known table agrees
 * on a single procedure. Anything else is recorded as unresolved.
 */
class VTableFinder final : public InvocationFinder
{
public:
    static constexpr std::size_t kDefaultScanWindow = 32;

    explicit VTableFinder(std::size_t scan_window = kDefaultScanWindow)
        : m_scan_window(scan_window)
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return "vtable"; }

    void find_invocations(CallGraph& graph,
                          const Context& ctx,
                          const CompilationInfo& info) const override;

private:
    std::size_t m_scan_window;
};

/// Tail calls: jumps whose target lies outside the enclosing procedure.
class JumpFinder final : public InvocationFinder
{
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "jump"; }

    void find_invocations(CallGraph& graph,
                          const Context& ctx,
                          const CompilationInfo& info) const override;
};

/// Canonical production order: direct, jump, vtable, procedure reference.
[[nodiscard]] std::vector<std::unique_ptr<InvocationFinder>> default_invocation_finders();

}  // namespace panicscan::callgraph
