#pragma once

/**
 * @file x86_disassembler.hpp
 * @brief x86-64 decoding on top of the LLVM MC layer
 */

#include "panicscan/common.hpp"
#include "panicscan/instruction.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace llvm {
class MCAsmInfo;
class MCContext;
class MCDisassembler;
class MCInstPrinter;
class MCInstrAnalysis;
class MCInstrInfo;
class MCRegisterInfo;
class MCSubtargetInfo;
}  // namespace llvm

namespace panicscan::loader {

/// Classes from MCInstrDesc flags; the opcode is looked up in the same MCInstrInfo.
class McInstructionClassifier final : public callgraph::InstructionClassifier
{
public:
    explicit McInstructionClassifier(const llvm::MCInstrInfo* instr_info)
        : m_instr_info(instr_info)
    {}

    [[nodiscard]] bool is_call(const callgraph::Instruction& insn) const override;
    [[nodiscard]] bool is_jump(const callgraph::Instruction& insn) const override;

private:
    const llvm::MCInstrInfo* m_instr_info;
};

class X86Disassembler
{
public:
    [[nodiscard]] static Result<X86Disassembler> create();

    X86Disassembler(X86Disassembler&&) noexcept;
    X86Disassembler& operator=(X86Disassembler&&) noexcept;
    ~X86Disassembler();

    /// Decode `code` loaded at `address`. Undecodable bytes are skipped one at a time.
    [[nodiscard]] std::vector<callgraph::Instruction> disassemble(std::span<const std::uint8_t> code,
                                                                  callgraph::Address address) const;

    [[nodiscard]] const callgraph::InstructionClassifier& classifier() const noexcept
    {
        return *m_classifier;
    }

private:
    X86Disassembler();

    std::unique_ptr<llvm::MCRegisterInfo> m_register_info;
    std::unique_ptr<llvm::MCAsmInfo> m_asm_info;
    std::unique_ptr<llvm::MCSubtargetInfo> m_subtarget_info;
    std::unique_ptr<llvm::MCInstrInfo> m_instr_info;
    std::unique_ptr<llvm::MCContext> m_context;
    std::unique_ptr<llvm::MCDisassembler> m_disassembler;
    std::unique_ptr<llvm::MCInstrAnalysis> m_analysis;
    std::unique_ptr<llvm::MCInstPrinter> m_printer;
    std::unique_ptr<McInstructionClassifier> m_classifier;
};

}  // namespace panicscan::loader
