#pragma once

/**
 * @file context.hpp
 * @brief Debug-info and disassembly context consumed by the call graph builder
 *
 * The loader (panicscan/loader.hpp) provides the production implementation;
 * tests provide synthetic ones.
 */

#include "panicscan/callgraph.hpp"
#include "panicscan/instruction.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace panicscan::callgraph {

struct CompilationUnitRef
{
    std::size_t index = 0;
    std::string name;
    std::string directory;
};

/// Table of code pointers used for dynamic dispatch.
struct VirtualTable
{
    Address address = 0;
    std::vector<Address> entries;  ///< pointer-sized slots, 0 for non-code slots
};

class Context
{
public:
    virtual ~Context() = default;

    [[nodiscard]] virtual std::vector<CompilationUnitRef> compilation_units() const = 0;

    /// Compilation directories of all units, in unit order, without duplicates.
    [[nodiscard]] virtual std::vector<std::string> compilation_unit_directories() const = 0;

    /// Toolchain version of the analysed binary (best effort).
    [[nodiscard]] virtual std::optional<std::string> toolchain_version() const = 0;

    /// Procedures defined by `unit`, with their disassembly attached.
    [[nodiscard]] virtual std::vector<Procedure>
    procedures_for_compilation_unit(const CompilationUnitRef& unit,
                                    const std::vector<std::string>& directories) const = 0;

    [[nodiscard]] virtual const InstructionClassifier& classifier() const = 0;

    /// Pointer-sized value stored at `address` (relocation target or static data).
    [[nodiscard]] virtual std::optional<Address> read_pointer(Address address) const = 0;

    /// `length` bytes of static data at `address`.
    [[nodiscard]] virtual std::optional<std::string> read_string(Address address, std::size_t length) const = 0;

    /// Symbol naming `address`: symbol table entries, PLT stubs, GOT slots.
    [[nodiscard]] virtual std::optional<std::string> symbol_name(Address address) const = 0;

    [[nodiscard]] virtual std::vector<VirtualTable> virtual_tables() const = 0;

    /// Frames inlined into `enclosing` at `call_site`, outermost first.
    [[nodiscard]] virtual std::vector<InlinedFrame>
    inlined_frames(Address call_site,
                   const Procedure& enclosing,
                   const CompilationInfo& info) const = 0;
};

}  // namespace panicscan::callgraph
