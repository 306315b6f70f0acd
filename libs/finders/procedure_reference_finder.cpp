/**
 * @file procedure_reference_finder.cpp
 * @brief Function pointers: instructions that materialise a procedure address
 */

#include "finder_support.hpp"
#include "panicscan/invocation_finder.hpp"
#include "panicscan/log.hpp"

#include <cstddef>
#include <vector>

namespace panicscan::callgraph {

namespace {

[[nodiscard]] std::vector<Address> referenced_addresses(const Instruction& insn)
{
    std::vector<Address> addresses;
    if (insn.mnemonic.starts_with("lea")) {
        if (auto target = insn.rip_relative_target()) {
            addresses.push_back(*target);
        }
    }
    for (const Operand& op : insn.operands) {
        if (op.kind == OperandKind::kImmediate && op.immediate > 0) {
            addresses.push_back(static_cast<Address>(op.immediate));
        }
    }
    return addresses;
}

}  // namespace

void ProcedureReferenceFinder::find_invocations(CallGraph& graph,
                                                const Context& ctx,
                                                const CompilationInfo& info) const
{
    const InstructionClassifier& classifier = ctx.classifier();
    std::size_t added = 0;

    for (const NodeIndex node : detail::defined_procedures(graph)) {
        const Procedure& procedure = graph.procedure(node);
        for (const Instruction& insn : procedure.disassembly) {
            if (classifier.is_call(insn) || classifier.is_jump(insn)
                || graph.is_call_site_resolved(insn.address)) {
                continue;
            }
            for (const Address address : referenced_addresses(insn)) {
                auto target = graph.find_procedure(address);
                if (!target || *target == node) {
                    continue;
                }
                auto edge = graph.add_invocation(
                    node,
                    *target,
                    detail::make_invocation(
                        InvocationType::kProcedureReference, insn, procedure, ctx, info));
                if (edge) {
                    ++added;
                }
                break;
            }
        }
    }
    log::debug("{} finder: {} invocations", name(), added);
}

}  // namespace panicscan::callgraph
