/**
 * @file x86_disassembler.cpp
 * @brief x86-64 decoding on top of the LLVM MC layer
 */

#include "loader/x86_disassembler.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/Triple.h>
#include <llvm/MC/MCAsmInfo.h>
#include <llvm/MC/MCContext.h>
#include <llvm/MC/MCDisassembler/MCDisassembler.h>
#include <llvm/MC/MCInst.h>
#include <llvm/MC/MCInstPrinter.h>
#include <llvm/MC/MCInstrAnalysis.h>
#include <llvm/MC/MCInstrInfo.h>
#include <llvm/MC/MCRegisterInfo.h>
#include <llvm/MC/MCSubtargetInfo.h>
#include <llvm/MC/MCTargetOptions.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>

namespace panicscan::loader {

namespace {

constexpr std::string_view kTriple = "x86_64-unknown-linux-gnu";
constexpr unsigned kIntelSyntax = 1;
/// X86 memory references occupy five MCInst operands: base, scale, index, displacement, segment.
constexpr unsigned kMemoryOperandCount = 5;

void initialize_x86_target()
{
    static const bool initialized = [] {
        LLVMInitializeX86TargetInfo();
        LLVMInitializeX86TargetMC();
        LLVMInitializeX86Disassembler();
        return true;
    }();
    (void)initialized;
}

[[nodiscard]] std::string lower(std::string_view text)
{
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

[[nodiscard]] std::string register_name(const llvm::MCRegisterInfo& info, unsigned reg)
{
    if (reg == 0) {
        return {};
    }
    return lower(info.getName(reg));
}

/// "\tcall\tqword ptr [rip + 0x2fe2]" -> {"call", "qword ptr [rip + 0x2fe2]"}
void split_printed(std::string_view text, std::string& mnemonic, std::string& operands)
{
    auto is_space = [](char c) { return c == ' ' || c == '\t'; };
    auto skip = [&](std::string_view sv) {
        while (!sv.empty() && is_space(sv.front())) {
            sv.remove_prefix(1);
        }
        return sv;
    };
    text = skip(text);
    const auto end = std::ranges::find_if(text, is_space) - text.begin();
    mnemonic = std::string(text.substr(0, static_cast<std::size_t>(end)));
    operands = std::string(skip(text.substr(static_cast<std::size_t>(end))));
}

[[nodiscard]] std::vector<callgraph::Operand> extract_operands(const llvm::MCInst& inst,
                                                               const llvm::MCInstrDesc& desc,
                                                               const llvm::MCRegisterInfo& regs)
{
    std::vector<callgraph::Operand> operands;
    const unsigned count = std::min(inst.getNumOperands(), static_cast<unsigned>(desc.getNumOperands()));
    for (unsigned i = 0; i < count; ++i) {
        if (desc.getOperandConstraint(i, llvm::MCOI::TIED_TO) != -1) {
            continue;
        }
        if (desc.OpInfo[i].OperandType == llvm::MCOI::OPERAND_MEMORY
            && i + kMemoryOperandCount <= inst.getNumOperands()) {
            const llvm::MCOperand& base = inst.getOperand(i);
            const llvm::MCOperand& scale = inst.getOperand(i + 1);
            const llvm::MCOperand& index = inst.getOperand(i + 2);
            const llvm::MCOperand& disp = inst.getOperand(i + 3);
            callgraph::Operand op{.kind = callgraph::OperandKind::kMemory};
            op.memory.base = base.isReg() ? register_name(regs, base.getReg()) : "";
            op.memory.scale = scale.isImm() ? scale.getImm() : 1;
            op.memory.index = index.isReg() ? register_name(regs, index.getReg()) : "";
            op.memory.displacement = disp.isImm() ? disp.getImm() : 0;
            operands.push_back(std::move(op));
            i += kMemoryOperandCount - 1;
            continue;
        }
        const llvm::MCOperand& operand = inst.getOperand(i);
        if (operand.isReg() && operand.getReg() != 0) {
            operands.push_back({.kind = callgraph::OperandKind::kRegister,
                                .reg = register_name(regs, operand.getReg())});
        } else if (operand.isImm()) {
            operands.push_back({.kind = callgraph::OperandKind::kImmediate,
                                .immediate = operand.getImm()});
        }
    }
    return operands;
}

}  // namespace

bool McInstructionClassifier::is_call(const callgraph::Instruction& insn) const
{
    return m_instr_info->get(insn.opcode).isCall();
}

bool McInstructionClassifier::is_jump(const callgraph::Instruction& insn) const
{
    const llvm::MCInstrDesc& desc = m_instr_info->get(insn.opcode);
    return (desc.isBranch() || desc.isIndirectBranch()) && !desc.isReturn() && !desc.isCall();
}

Result<X86Disassembler> X86Disassembler::create()
{
    initialize_x86_target();

    std::string error;
    const std::string triple_name(kTriple);
    const llvm::Target* target = llvm::TargetRegistry::lookupTarget(triple_name, error);
    if (target == nullptr) {
        return std::unexpected(Error::make("NotSupported", "x86-64 target unavailable: " + error));
    }

    X86Disassembler engine;
    engine.m_register_info.reset(target->createMCRegInfo(triple_name));
    llvm::MCTargetOptions options;
    if (engine.m_register_info) {
        engine.m_asm_info.reset(target->createMCAsmInfo(*engine.m_register_info, triple_name, options));
    }
    engine.m_subtarget_info.reset(target->createMCSubtargetInfo(triple_name, "", ""));
    engine.m_instr_info.reset(target->createMCInstrInfo());
    if (!engine.m_register_info || !engine.m_asm_info || !engine.m_subtarget_info
        || !engine.m_instr_info) {
        return std::unexpected(Error::make("NotSupported", "Failed to set up the x86-64 MC layer"));
    }

    const llvm::Triple triple(triple_name);
    engine.m_context = std::make_unique<llvm::MCContext>(triple,
                                                         engine.m_asm_info.get(),
                                                         engine.m_register_info.get(),
                                                         engine.m_subtarget_info.get());
    engine.m_disassembler.reset(target->createMCDisassembler(*engine.m_subtarget_info, *engine.m_context));
    engine.m_analysis.reset(target->createMCInstrAnalysis(engine.m_instr_info.get()));
    engine.m_printer.reset(target->createMCInstPrinter(triple,
                                                       kIntelSyntax,
                                                       *engine.m_asm_info,
                                                       *engine.m_instr_info,
                                                       *engine.m_register_info));
    if (!engine.m_disassembler || !engine.m_analysis || !engine.m_printer) {
        return std::unexpected(Error::make("NotSupported", "Failed to create the x86-64 disassembler"));
    }
    engine.m_printer->setPrintImmHex(true);
    engine.m_classifier = std::make_unique<McInstructionClassifier>(engine.m_instr_info.get());
    return engine;
}

X86Disassembler::X86Disassembler() = default;
X86Disassembler::X86Disassembler(X86Disassembler&&) noexcept = default;
X86Disassembler& X86Disassembler::operator=(X86Disassembler&&) noexcept = default;
X86Disassembler::~X86Disassembler() = default;

std::vector<callgraph::Instruction> X86Disassembler::disassemble(std::span<const std::uint8_t> code,
                                                                 callgraph::Address address) const
{
    std::vector<callgraph::Instruction> instructions;
    std::size_t offset = 0;
    while (offset < code.size()) {
        llvm::MCInst inst;
        std::uint64_t size = 0;
        const llvm::ArrayRef<std::uint8_t> bytes(code.data() + offset, code.size() - offset);
        const callgraph::Address current = address + offset;
        const auto status = m_disassembler->getInstruction(inst, size, bytes, current, llvm::nulls());
        if (status != llvm::MCDisassembler::Success || size == 0) {
            ++offset;
            continue;
        }

        callgraph::Instruction insn;
        insn.address = current;
        insn.size = static_cast<std::uint32_t>(size);
        insn.bytes.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(size));
        insn.opcode = inst.getOpcode();

        std::string printed;
        llvm::raw_string_ostream stream(printed);
        m_printer->printInst(&inst, current, "", *m_subtarget_info, stream);
        stream.flush();
        split_printed(printed, insn.mnemonic, insn.operands_text);

        const llvm::MCInstrDesc& desc = m_instr_info->get(inst.getOpcode());
        insn.operands = extract_operands(inst, desc, *m_register_info);
        if (std::uint64_t target = 0; m_analysis->evaluateBranch(inst, current, size, target)) {
            insn.branch_target = target;
        }

        instructions.push_back(std::move(insn));
        offset += size;
    }
    return instructions;
}

}  // namespace panicscan::loader
