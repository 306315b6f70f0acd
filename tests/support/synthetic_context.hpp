#pragma once

/**
 * @file synthetic_context.hpp
 * @brief In-memory Context for call graph, finder and analysis tests
 */

#include "panicscan/context.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace panicscan::test {

using callgraph::Address;
using callgraph::Instruction;

/// "call" is call-class, "j*" is jump-class; addresses in `dual` are both.
class MnemonicClassifier final : public callgraph::InstructionClassifier
{
public:
    [[nodiscard]] bool is_call(const Instruction& insn) const override
    {
        return insn.mnemonic == "call" || dual.contains(insn.address);
    }

    [[nodiscard]] bool is_jump(const Instruction& insn) const override
    {
        return insn.mnemonic.starts_with('j') || dual.contains(insn.address);
    }

    std::set<Address> dual;
};

class SyntheticContext final : public callgraph::Context
{
public:
    SyntheticContext();

    /// Adds a compilation unit and returns its index.
    std::size_t add_unit(std::string name, std::string directory);

    /// Adds a procedure to `unit`; [start, end) and crate are taken from `procedure`.
    void add_procedure(callgraph::Procedure procedure, std::size_t unit = 0);

    void set_pointer(Address slot, Address value) { m_pointers[slot] = value; }
    void set_symbol(Address address, std::string name) { m_symbols[address] = std::move(name); }
    void set_string(Address address, std::string text) { m_strings[address] = std::move(text); }
    void add_virtual_table(callgraph::VirtualTable table) { m_tables.push_back(std::move(table)); }
    void set_frames(Address call_site, std::vector<callgraph::InlinedFrame> frames)
    {
        m_frames[call_site] = std::move(frames);
    }
    void set_toolchain_version(std::optional<std::string> version) { m_version = std::move(version); }

    MnemonicClassifier& mutable_classifier() { return m_classifier; }

    [[nodiscard]] std::vector<callgraph::CompilationUnitRef> compilation_units() const override
    {
        return m_units;
    }
    [[nodiscard]] std::vector<std::string> compilation_unit_directories() const override;
    [[nodiscard]] std::optional<std::string> toolchain_version() const override { return m_version; }
    [[nodiscard]] std::vector<callgraph::Procedure>
    procedures_for_compilation_unit(const callgraph::CompilationUnitRef& unit,
                                    const std::vector<std::string>& directories) const override;
    [[nodiscard]] const callgraph::InstructionClassifier& classifier() const override
    {
        return m_classifier;
    }
    [[nodiscard]] std::optional<Address> read_pointer(Address address) const override;
    [[nodiscard]] std::optional<std::string> read_string(Address address, std::size_t length) const override;
    [[nodiscard]] std::optional<std::string> symbol_name(Address address) const override;
    [[nodiscard]] std::vector<callgraph::VirtualTable> virtual_tables() const override
    {
        return m_tables;
    }
    [[nodiscard]] std::vector<callgraph::InlinedFrame>
    inlined_frames(Address call_site,
                   const callgraph::Procedure& enclosing,
                   const callgraph::CompilationInfo& info) const override;

private:
    std::vector<callgraph::CompilationUnitRef> m_units;
    std::map<std::size_t, std::vector<callgraph::Procedure>> m_procedures;
    std::map<Address, Address> m_pointers;
    std::map<Address, std::string> m_symbols;
    std::map<Address, std::string> m_strings;
    std::vector<callgraph::VirtualTable> m_tables;
    std::map<Address, std::vector<callgraph::InlinedFrame>> m_frames;
    std::optional<std::string> m_version = "1.75.0";
    MnemonicClassifier m_classifier;
};

// ---------------------------------------------------------------------------
// Instruction and procedure builders
// ---------------------------------------------------------------------------

[[nodiscard]] callgraph::Procedure make_procedure(std::string name,
                                                  Address start,
                                                  Address end,
                                                  std::vector<Instruction> code = {},
                                                  std::string crate = "app");

[[nodiscard]] Instruction call_direct(Address at, Address target);
[[nodiscard]] Instruction jmp_direct(Address at, Address target);
[[nodiscard]] Instruction jcc(Address at, Address target);
/// call qword ptr [rip + disp] reaching `slot`
[[nodiscard]] Instruction call_rip_slot(Address at, Address slot);
/// call/jmp qword ptr [base + disp]
[[nodiscard]] Instruction call_memory(Address at, std::string base, std::int64_t disp);
[[nodiscard]] Instruction jmp_memory(Address at, std::string base, std::int64_t disp);
/// call qword ptr [base + index*scale + disp]
[[nodiscard]] Instruction call_indexed(Address at, std::string base, std::string index, std::int64_t scale, std::int64_t disp);
[[nodiscard]] Instruction call_register(Address at, std::string reg);
[[nodiscard]] Instruction lea_rip(Address at, std::string reg, Address target);
[[nodiscard]] Instruction mov_immediate(Address at, std::string reg, std::int64_t value);
[[nodiscard]] Instruction mov_register(Address at, std::string dst, std::string src);
[[nodiscard]] Instruction mov_load(Address at, std::string dst, std::string base, std::int64_t disp);
[[nodiscard]] Instruction nop(Address at);
[[nodiscard]] Instruction ret(Address at);

}  // namespace panicscan::test
