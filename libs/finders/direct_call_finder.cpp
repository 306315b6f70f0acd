/**
 * @file direct_call_finder.cpp
 * @brief Calls whose target is fixed by the instruction encoding
 */

#include "finder_support.hpp"
#include "panicscan/invocation_finder.hpp"
#include "panicscan/log.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <utility>

namespace panicscan::callgraph {

void DirectCallFinder::find_invocations(CallGraph& graph,
                                        const Context& ctx,
                                        const CompilationInfo& info) const
{
    const InstructionClassifier& classifier = ctx.classifier();
    std::size_t added = 0;

    for (const NodeIndex node : detail::defined_procedures(graph)) {
        const Procedure& procedure = graph.procedure(node);
        const std::span<const Instruction> code(procedure.disassembly);
        for (std::size_t i = 0; i < code.size(); ++i) {
            const Instruction& insn = code[i];
            if (!classifier.is_call(insn) || graph.is_call_site_resolved(insn.address)) {
                continue;
            }
            auto target = detail::static_target(insn, ctx);
            if (!target) {
                continue;
            }
            Invocation invocation = detail::make_invocation(InvocationType::kDirect, insn, procedure, ctx, info);
            const auto callee = graph.find_procedure(target->address);
            const std::string& callee_name =
                callee ? graph.procedure(*callee).display_name() : target->placeholder_name;
            if (detail::takes_static_message(callee_name)) {
                invocation.message_argument = detail::message_argument(code, i, ctx);
            }
            auto edge = graph.add_invocation_to_address(node,
                                                        target->address,
                                                        target->placeholder_name,
                                                        std::move(invocation));
            if (edge) {
                ++added;
            }
        }
    }
    log::debug("{} finder: {} invocations", name(), added);
}

}  // namespace panicscan::callgraph
