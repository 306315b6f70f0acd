/**
 * @file jump_finder.cpp
 * @brief Tail calls: jumps leaving the enclosing procedure
 */

#include "finder_support.hpp"
#include "panicscan/invocation_finder.hpp"
#include "panicscan/log.hpp"

#include <cstddef>

namespace panicscan::callgraph {

void JumpFinder::find_invocations(CallGraph& graph,
                                  const Context& ctx,
                                  const CompilationInfo& info) const
{
    const InstructionClassifier& classifier = ctx.classifier();
    std::size_t added = 0;

    for (const NodeIndex node : detail::defined_procedures(graph)) {
        const Procedure& procedure = graph.procedure(node);
        for (const Instruction& insn : procedure.disassembly) {
            if (!classifier.is_jump(insn) || graph.is_call_site_resolved(insn.address)) {
                continue;
            }
            auto target = detail::static_target(insn, ctx);
            if (!target || procedure.contains(target->address)) {
                // loops and conditionals stay inside the procedure
                continue;
            }
            if (auto other = graph.procedure_containing(target->address);
                other && graph.procedure(*other).start_address != target->address) {
                continue;
            }
            auto edge = graph.add_invocation_to_address(
                node,
                target->address,
                target->placeholder_name,
                detail::make_invocation(InvocationType::kJump, insn, procedure, ctx, info));
            if (edge) {
                ++added;
            }
        }
    }
    log::debug("{} finder: {} invocations", name(), added);
}

}  // namespace panicscan::callgraph
