/**
 * @file vtable_finder.cpp
 * @brief Dynamic dispatch through a table of code pointers
 *
 * Handles `call [reg + disp]`, `jmp [reg + disp]` and `call reg` where `reg`
 * was loaded from `[base + disp]` a few instructions earlier.
 */

#include "finder_support.hpp"
#include "panicscan/invocation_finder.hpp"
#include "panicscan/log.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace panicscan::callgraph {

namespace {

constexpr std::int64_t kPointerSize = 8;

struct DispatchSlot
{
    std::string base;
    std::int64_t displacement = 0;
};

struct TableLayout
{
    std::unordered_map<Address, const VirtualTable*> by_address;
    /// slot offset -> defined procedures found there across all tables
    std::map<std::int64_t, std::set<Address>> slot_candidates;
};

[[nodiscard]] TableLayout index_tables(const std::vector<VirtualTable>& tables,
                                       const CallGraph& graph)
{
    TableLayout layout;
    for (const VirtualTable& table : tables) {
        layout.by_address.emplace(table.address, &table);
        for (std::size_t slot = 0; slot < table.entries.size(); ++slot) {
            const Address entry = table.entries[slot];
            if (entry != 0 && graph.find_procedure(entry)) {
                layout.slot_candidates[static_cast<std::int64_t>(slot) * kPointerSize].insert(entry);
            }
        }
    }
    return layout;
}

[[nodiscard]] bool is_dispatch_memory(const MemoryOperand& mem)
{
    return !mem.base.empty() && mem.base != "rip" && mem.index.empty() && mem.displacement >= 0
           && mem.displacement % kPointerSize == 0;
}

/**
 * Walk backwards from `from` while `reg` is only copied between registers.
 * Returns the index of the instruction that last defined it.
 */
[[nodiscard]] std::optional<std::size_t> find_definition(std::span<const Instruction> code,
                                                         std::size_t from,
                                                         std::string& reg,
                                                         std::size_t window)
{
    const std::size_t lower = from > window ? from - window : 0;
    for (std::size_t i = from; i-- > lower;) {
        const Instruction& insn = code[i];
        if (!detail::writes_first_operand(insn)
            || detail::full_register(insn.operands.front().reg) != reg) {
            continue;
        }
        if (insn.mnemonic == "mov" && insn.operands.size() == 2
            && insn.operands[1].kind == OperandKind::kRegister) {
            reg = detail::full_register(insn.operands[1].reg);
            continue;
        }
        return i;
    }
    return std::nullopt;
}

/// `call reg` where reg = [base + disp]
[[nodiscard]] std::optional<DispatchSlot> register_dispatch_slot(std::span<const Instruction> code,
                                                                 std::size_t call_index,
                                                                 std::size_t window)
{
    const Instruction& call = code[call_index];
    if (call.operands.size() != 1 || call.operands.front().kind != OperandKind::kRegister) {
        return std::nullopt;
    }
    std::string reg = detail::full_register(call.operands.front().reg);
    auto def = find_definition(code, call_index, reg, window);
    if (!def) {
        return std::nullopt;
    }
    const Instruction& load = code[*def];
    const MemoryOperand* mem = load.memory_operand();
    if (!load.mnemonic.starts_with("mov") || mem == nullptr || !is_dispatch_memory(*mem)) {
        return std::nullopt;
    }
    return DispatchSlot{.base = detail::full_register(mem->base), .displacement = mem->displacement};
}

/// Address of the table that `reg` points to at instruction `before`.
[[nodiscard]] std::optional<Address> track_table_address(std::span<const Instruction> code,
                                                         std::size_t before,
                                                         std::string reg,
                                                         std::size_t window)
{
    auto def = find_definition(code, before, reg, window);
    if (!def) {
        return std::nullopt;
    }
    const Instruction& insn = code[*def];
    if (insn.mnemonic.starts_with("lea")) {
        return insn.rip_relative_target();
    }
    if (insn.mnemonic.starts_with("mov") && insn.operands.size() == 2
        && insn.operands[1].kind == OperandKind::kImmediate) {
        return static_cast<Address>(insn.operands[1].immediate);
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<Address> table_entry(const TableLayout& layout,
                                                 const Context& ctx,
                                                 Address table,
                                                 std::int64_t displacement)
{
    const auto slot = static_cast<std::size_t>(displacement / kPointerSize);
    if (auto it = layout.by_address.find(table); it != layout.by_address.end()) {
        const auto& entries = it->second->entries;
        if (slot < entries.size() && entries[slot] != 0) {
            return entries[slot];
        }
        return std::nullopt;
    }
    return ctx.read_pointer(table + static_cast<Address>(displacement));
}

[[nodiscard]] std::optional<Address> unique_slot_candidate(const TableLayout& layout,
                                                           std::int64_t displacement)
{
    auto it = layout.slot_candidates.find(displacement);
    if (it == layout.slot_candidates.end() || it->second.size() != 1) {
        return std::nullopt;
    }
    return *it->second.begin();
}

[[nodiscard]] std::string opaque_memory_reason(const MemoryOperand& mem)
{
    if (mem.base == "rip") {
        return std::format("unresolved slot [rip{:+#x}]", mem.displacement);
    }
    if (!mem.index.empty()) {
        return std::format("indexed call through [{}+{}*{}+{:#x}]", mem.base, mem.index, mem.scale, mem.displacement);
    }
    return std::format("call through [{}{:+#x}]", mem.base, mem.displacement);
}

}  // namespace

void VTableFinder::find_invocations(CallGraph& graph,
                                    const Context& ctx,
                                    const CompilationInfo& info) const
{
    const InstructionClassifier& classifier = ctx.classifier();
    const std::vector<VirtualTable> tables = ctx.virtual_tables();
    const TableLayout layout = index_tables(tables, graph);
    std::size_t added = 0;
    std::size_t unresolved = 0;

    for (const NodeIndex node : detail::defined_procedures(graph)) {
        const Procedure& procedure = graph.procedure(node);
        const std::span<const Instruction> code(procedure.disassembly);
        for (std::size_t i = 0; i < code.size(); ++i) {
            const Instruction& insn = code[i];
            const bool is_call = classifier.is_call(insn);
            if ((!is_call && !classifier.is_jump(insn)) || insn.branch_target
                || graph.is_call_site_resolved(insn.address)) {
                continue;
            }

            std::optional<DispatchSlot> slot;
            if (const MemoryOperand* mem = insn.memory_operand()) {
                if (!is_dispatch_memory(*mem)) {
                    // jumps through such operands are switch tables or PLT stubs
                    if (is_call) {
                        graph.record_unresolved({.call_site = insn.address,
                                                 .enclosing = node,
                                                 .reason = opaque_memory_reason(*mem)});
                        ++unresolved;
                    }
                    continue;
                }
                slot = DispatchSlot{.base = detail::full_register(mem->base),
                                    .displacement = mem->displacement};
            } else if (is_call) {
                slot = register_dispatch_slot(code, i, m_scan_window);
                if (!slot) {
                    graph.record_unresolved({.call_site = insn.address,
                                             .enclosing = node,
                                             .reason = "register-indirect call"});
                    ++unresolved;
                    continue;
                }
            } else {
                continue;
            }

            std::optional<Address> target;
            if (auto table = track_table_address(code, i, slot->base, m_scan_window)) {
                target = table_entry(layout, ctx, *table, slot->displacement);
            } else {
                target = unique_slot_candidate(layout, slot->displacement);
            }

            std::optional<NodeIndex> callee;
            if (target) {
                callee = graph.find_procedure(*target);
            }
            if (!callee) {
                graph.record_unresolved(
                    {.call_site = insn.address,
                     .enclosing = node,
                     .reason = std::format("dispatch through [{}+{:#x}]", slot->base, slot->displacement)});
                ++unresolved;
                continue;
            }

            auto edge = graph.add_invocation(
                node,
                *callee,
                detail::make_invocation(InvocationType::kVTable, insn, procedure, ctx, info));
            if (edge) {
                ++added;
            }
        }
    }
    log::debug("{} finder: {} invocations, {} unresolved", name(), added, unresolved);
}

}  // namespace panicscan::callgraph
