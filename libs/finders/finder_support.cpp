/**
 * @file finder_support.cpp
 * @brief Helpers shared by the invocation finders
 */

#include "finder_support.hpp"

#include "panicscan/crates.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <format>
#include <ranges>
#include <string>

namespace panicscan::callgraph::detail {

namespace {

constexpr std::array<std::string_view, 8> kLegacyRegisters = {"ax", "bx", "cx", "dx",
                                                               "si", "di", "bp", "sp"};

constexpr std::array<std::string_view, 6> kNonWritingMnemonics = {"cmp", "test", "push",
                                                                   "bt",  "ucomisd", "comisd"};

constexpr std::size_t kArgumentWindow = 8;
constexpr std::int64_t kMaxMessageLength = 256;

}  // namespace

std::vector<NodeIndex> defined_procedures(const CallGraph& graph)
{
    std::vector<NodeIndex> nodes;
    nodes.reserve(graph.graph().node_count());
    for (const NodeIndex idx : graph.graph().node_indices()) {
        if (!graph.procedure(idx).is_placeholder) {
            nodes.push_back(idx);
        }
    }
    return nodes;
}

std::string placeholder_name(const Context& ctx, Address target)
{
    if (auto symbol = ctx.symbol_name(target)) {
        return *symbol;
    }
    return std::format("<unknown@{:#x}>", target);
}

std::optional<StaticTarget> static_target(const Instruction& insn, const Context& ctx)
{
    if (insn.branch_target) {
        return StaticTarget{.address = *insn.branch_target,
                            .placeholder_name = placeholder_name(ctx, *insn.branch_target)};
    }
    auto slot = insn.rip_relative_target();
    if (!slot) {
        return std::nullopt;
    }
    if (auto value = ctx.read_pointer(*slot); value && *value != 0) {
        auto name = ctx.symbol_name(*value);
        if (!name) {
            name = ctx.symbol_name(*slot);
        }
        return StaticTarget{.address = *value,
                            .placeholder_name = name ? *name : placeholder_name(ctx, *value)};
    }
    if (auto name = ctx.symbol_name(*slot)) {
        return StaticTarget{.address = *slot, .placeholder_name = *name};
    }
    return std::nullopt;
}

Invocation make_invocation(InvocationType type,
                           const Instruction& insn,
                           const Procedure& enclosing,
                           const Context& ctx,
                           const CompilationInfo& info)
{
    Invocation invocation;
    invocation.invocation_type = type;
    invocation.call_site = insn.address;
    invocation.frames = ctx.inlined_frames(insn.address, enclosing, info);
    return invocation;
}

std::optional<std::string> message_argument(std::span<const Instruction> code,
                                            std::size_t call_index,
                                            const Context& ctx)
{
    std::optional<Address> pointer;
    std::optional<std::int64_t> length;
    bool pointer_seen = false;
    bool length_seen = false;
    const std::size_t lower = call_index > kArgumentWindow ? call_index - kArgumentWindow : 0;
    for (std::size_t i = call_index; i-- > lower && !(pointer_seen && length_seen);) {
        const Instruction& insn = code[i];
        if (ctx.classifier().is_call(insn)) {
            break;
        }
        if (!writes_first_operand(insn)) {
            continue;
        }
        const std::string reg = full_register(insn.operands.front().reg);
        if (reg == "rdi" && !pointer_seen) {
            pointer_seen = true;
            if (insn.mnemonic == "lea") {
                pointer = insn.rip_relative_target();
            }
        } else if (reg == "rsi" && !length_seen) {
            length_seen = true;
            if (insn.mnemonic == "mov" && insn.operands.size() == 2
                && insn.operands[1].kind == OperandKind::kImmediate) {
                length = insn.operands[1].immediate;
            }
        }
    }
    if (!pointer || !length || *length <= 0 || *length > kMaxMessageLength) {
        return std::nullopt;
    }
    return ctx.read_string(*pointer, static_cast<std::size_t>(*length));
}

bool takes_static_message(std::string_view callee_name)
{
    return strip_symbol_hash(callee_name) == "core::panicking::panic";
}

std::string full_register(std::string_view reg)
{
    // r8d / r8w / r8b -> r8
    if (reg.size() >= 3 && reg.front() == 'r' && std::isdigit(static_cast<unsigned char>(reg[1]))) {
        const auto last = reg.back();
        if (last == 'd' || last == 'w' || last == 'b') {
            return std::string(reg.substr(0, reg.size() - 1));
        }
        return std::string(reg);
    }
    // eax -> rax
    if (reg.size() == 3 && reg.front() == 'e'
        && std::ranges::find(kLegacyRegisters, reg.substr(1)) != kLegacyRegisters.end()) {
        return "r" + std::string(reg.substr(1));
    }
    return std::string(reg);
}

bool writes_first_operand(const Instruction& insn)
{
    if (insn.operands.empty() || insn.operands.front().kind != OperandKind::kRegister) {
        return false;
    }
    return std::ranges::find(kNonWritingMnemonics, insn.mnemonic) == kNonWritingMnemonics.end();
}

}  // namespace panicscan::callgraph::detail
