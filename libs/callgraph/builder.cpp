/**
 * @file builder.cpp
 * @brief Call graph construction from a Context
 */

#include "panicscan/builder.hpp"

#include "panicscan/log.hpp"

#include <cstddef>
#include <utility>

namespace panicscan::callgraph {

namespace {

[[nodiscard]] std::vector<Procedure> collect_procedures(const Context& ctx,
                                                        const CompilationInfo& info)
{
    std::vector<Procedure> procedures;
    for (const CompilationUnitRef& unit : ctx.compilation_units()) {
        auto unit_procedures = ctx.procedures_for_compilation_unit(unit, info.compilation_dirs);
        log::debug("compilation unit {} ({}): {} procedures",
                   unit.index,
                   unit.name,
                   unit_procedures.size());
        for (Procedure& procedure : unit_procedures) {
            procedures.push_back(std::move(procedure));
        }
    }
    return procedures;
}

void index_call_sites(CallGraph& graph, NodeIndex node, const InstructionClassifier& classifier)
{
    for (const Instruction& insn : graph.procedure(node).disassembly) {
        if (classifier.is_call(insn) || classifier.is_jump(insn)) {
            graph.index_call_site(insn.address, node);
        }
    }
}

}  // namespace

CompilationInfo make_compilation_info(const Context& ctx)
{
    return CompilationInfo{.compilation_dirs = ctx.compilation_unit_directories(),
                           .toolchain_version = ctx.toolchain_version().value_or("")};
}

CallGraphBuilder::CallGraphBuilder(std::vector<std::unique_ptr<InvocationFinder>> finders)
    : m_finders(std::move(finders))
{}

CallGraph CallGraphBuilder::build_call_graph(const Context& ctx) const
{
    CompilationInfo info = make_compilation_info(ctx);
    if (info.toolchain_version.empty()) {
        log::warn("toolchain version not detected");
    } else {
        log::info("toolchain version {}", info.toolchain_version);
    }

    CallGraph graph;
    const InstructionClassifier& classifier = ctx.classifier();
    std::size_t skipped = 0;
    for (Procedure& procedure : collect_procedures(ctx, info)) {
        const Address start = procedure.start_address;
        auto node = graph.add_procedure(std::move(procedure));
        if (!node) {
            log::debug("duplicate procedure at {:#x} skipped", start);
            ++skipped;
            continue;
        }
        index_call_sites(graph, *node, classifier);
    }
    if (skipped > 0) {
        log::warn("{} procedures share a start address with an earlier one", skipped);
    }
    log::info("{} procedures, {} call sites",
              graph.graph().node_count(),
              graph.call_index().size());

    for (const auto& finder : m_finders) {
        finder->find_invocations(graph, ctx, info);
    }
    log::info("{} invocations, {} unresolved dynamic invocations",
              graph.graph().edge_count(),
              graph.unresolved_invocations().size());

    graph.set_compilation_info(std::move(info));
    return graph;
}

}  // namespace panicscan::callgraph
