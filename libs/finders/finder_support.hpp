#pragma once

/**
 * @file finder_support.hpp
 * @brief Helpers shared by the invocation finders
 */

#include "panicscan/callgraph.hpp"
#include "panicscan/context.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace panicscan::callgraph::detail {

struct StaticTarget
{
    Address address = 0;
    std::string placeholder_name;
};

/// Nodes present when a finder starts; placeholders added later are not revisited.
[[nodiscard]] std::vector<NodeIndex> defined_procedures(const CallGraph& graph);

[[nodiscard]] std::string placeholder_name(const Context& ctx, Address target);

/**
 * Target of a call/jump whose destination is fixed by the instruction:
 * an encoded branch target, or a RIP-relative slot (GOT entry). A slot the
 * context cannot read but can name is keyed by the slot address itself.
 */
[[nodiscard]] std::optional<StaticTarget> static_target(const Instruction& insn, const Context& ctx);

[[nodiscard]] Invocation make_invocation(InvocationType type,
                                         const Instruction& insn,
                                         const Procedure& enclosing,
                                         const Context& ctx,
                                         const CompilationInfo& info);

/**
 * String literal handed to the call at `code[call_index]` as a (pointer,
 * length) pair in rdi/rsi, as rustc passes `&'static str` arguments.
 */
[[nodiscard]] std::optional<std::string> message_argument(std::span<const Instruction> code,
                                                          std::size_t call_index,
                                                          const Context& ctx);

/// Panic primitive that receives its message as a `&'static str` argument.
[[nodiscard]] bool takes_static_message(std::string_view callee_name);

/// 64-bit register containing `reg` ("eax" -> "rax", "r9d" -> "r9").
[[nodiscard]] std::string full_register(std::string_view reg);

/// Instruction overwrites its first (register) operand.
[[nodiscard]] bool writes_first_operand(const Instruction& insn);

}  // namespace panicscan::callgraph::detail
