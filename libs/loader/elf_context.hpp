#pragma once

/**
 * @file elf_context.hpp
 * @brief Context over an ELF image and its DWARF debug info
 */

#include "loader/binary_image.hpp"
#include "loader/x86_disassembler.hpp"
#include "panicscan/context.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace llvm {
class DWARFContext;
class DWARFUnit;
class MemoryBuffer;
namespace object {
class ObjectFile;
}  // namespace object
}  // namespace llvm

namespace panicscan::loader {

class ElfContext final : public callgraph::Context
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

public:
    /// `object` must have been created from `buffer`.
    [[nodiscard]] static Result<std::unique_ptr<ElfContext>>
    create(std::unique_ptr<llvm::MemoryBuffer> buffer, std::unique_ptr<llvm::object::ObjectFile> object);

    /// Use create().
    ElfContext(PrivateTag tag,
               std::unique_ptr<llvm::MemoryBuffer> buffer,
               std::unique_ptr<llvm::object::ObjectFile> object,
               std::unique_ptr<llvm::DWARFContext> dwarf,
               X86Disassembler disassembler,
               BinaryImage image);

    ~ElfContext() override;

    [[nodiscard]] std::vector<callgraph::CompilationUnitRef> compilation_units() const override
    {
        return m_units;
    }

    [[nodiscard]] std::vector<std::string> compilation_unit_directories() const override
    {
        return m_directories;
    }

    [[nodiscard]] std::optional<std::string> toolchain_version() const override
    {
        return m_toolchain_version;
    }

    [[nodiscard]] std::vector<callgraph::Procedure>
    procedures_for_compilation_unit(const callgraph::CompilationUnitRef& unit,
                                    const std::vector<std::string>& directories) const override;

    [[nodiscard]] const callgraph::InstructionClassifier& classifier() const override
    {
        return m_disassembler.classifier();
    }

    [[nodiscard]] std::optional<callgraph::Address> read_pointer(callgraph::Address address) const override
    {
        return m_image.read_pointer(address);
    }

    [[nodiscard]] std::optional<std::string> read_string(callgraph::Address address,
                                                         std::size_t length) const override
    {
        return m_image.read_string(address, length);
    }

    [[nodiscard]] std::optional<std::string> symbol_name(callgraph::Address address) const override
    {
        return m_image.symbol_name(address);
    }

    [[nodiscard]] std::vector<callgraph::VirtualTable> virtual_tables() const override
    {
        return m_virtual_tables;
    }

    [[nodiscard]] std::vector<callgraph::InlinedFrame>
    inlined_frames(callgraph::Address call_site,
                   const callgraph::Procedure& enclosing,
                   const callgraph::CompilationInfo& info) const override;

private:
    void index_compilation_units();

    std::unique_ptr<llvm::MemoryBuffer> m_buffer;
    std::unique_ptr<llvm::object::ObjectFile> m_object;
    std::unique_ptr<llvm::DWARFContext> m_dwarf;
    X86Disassembler m_disassembler;
    BinaryImage m_image;
    std::vector<llvm::DWARFUnit*> m_dwarf_units;
    std::vector<callgraph::CompilationUnitRef> m_units;
    std::vector<std::string> m_directories;
    std::optional<std::string> m_toolchain_version;
    std::vector<callgraph::VirtualTable> m_virtual_tables;
};

}  // namespace panicscan::loader
