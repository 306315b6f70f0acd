#pragma once

/**
 * @file instruction.hpp
 * @brief Disassembled instruction records and their semantic classification
 *
 * Records are produced by the loader's disassembly engine. Nothing outside the
 * engine interprets opcode numbers; semantic classes are only available
 * through InstructionClassifier.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace panicscan::callgraph {

using Address = std::uint64_t;

enum class OperandKind {
    kRegister,
    kImmediate,
    kMemory
};

/// [base + index * scale + displacement]; empty register names mean "absent".
struct MemoryOperand
{
    std::string base;
    std::string index;
    std::int64_t scale = 1;
    std::int64_t displacement = 0;
};

struct Operand
{
    OperandKind kind = OperandKind::kRegister;
    std::string reg;             ///< kRegister: lower-case register name
    std::int64_t immediate = 0;  ///< kImmediate
    MemoryOperand memory{};      ///< kMemory
};

struct Instruction
{
    Address address = 0;
    std::uint32_t size = 0;
    std::vector<std::uint8_t> bytes;
    std::string mnemonic;
    std::string operands_text;
    unsigned opcode = 0;  ///< engine-specific, opaque to the core
    std::vector<Operand> operands;
    std::optional<Address> branch_target;  ///< statically encoded call/jump target

    [[nodiscard]] Address next_address() const noexcept { return address + size; }

    /// First memory operand, if any.
    [[nodiscard]] const MemoryOperand* memory_operand() const noexcept
    {
        for (const auto& op : operands) {
            if (op.kind == OperandKind::kMemory) {
                return &op.memory;
            }
        }
        return nullptr;
    }

    /// Absolute address referenced by a RIP-relative memory operand without index.
    [[nodiscard]] std::optional<Address> rip_relative_target() const noexcept
    {
        const MemoryOperand* mem = memory_operand();
        if (mem == nullptr || mem->base != "rip" || !mem->index.empty()) {
            return std::nullopt;
        }
        return next_address() + static_cast<Address>(mem->displacement);
    }
};

/**
 * @brief Semantic instruction classes exposed by the disassembly engine
 */
class InstructionClassifier
{
public:
    virtual ~InstructionClassifier() = default;

    /// Instruction transfers control and saves a return address.
    [[nodiscard]] virtual bool is_call(const Instruction& insn) const = 0;

    /// Conditional, unconditional or indirect jump (returns excluded).
    [[nodiscard]] virtual bool is_jump(const Instruction& insn) const = 0;
};

}  // namespace panicscan::callgraph
