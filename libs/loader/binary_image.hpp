#pragma once

/**
 * @file binary_image.hpp
 * @brief Section contents, symbols and dynamic relocations of an ELF image
 */

#include "loader/x86_disassembler.hpp"
#include "panicscan/context.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace llvm::object {
class ObjectFile;
}  // namespace llvm::object

namespace panicscan::loader {

class BinaryImage
{
public:
    /// Section contents are referenced, not copied: `object` must outlive the image.
    [[nodiscard]] static Result<BinaryImage> create(const llvm::object::ObjectFile& object);

    [[nodiscard]] bool has_section(std::string_view name) const;

    /// Bytes of [start, end) when the range lies inside one executable section.
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> code(callgraph::Address start,
                                                                    callgraph::Address end) const;

    [[nodiscard]] std::optional<callgraph::Address> read_pointer(callgraph::Address address) const;

    [[nodiscard]] std::optional<std::string> read_string(callgraph::Address address, std::size_t length) const;

    [[nodiscard]] std::optional<std::string> symbol_name(callgraph::Address address) const;

    /// Function symbols of the symbol table.
    [[nodiscard]] const std::unordered_set<callgraph::Address>& function_starts() const noexcept
    {
        return m_function_starts;
    }

    /// Names PLT stubs after the jump slot they go through.
    void name_plt_entries(const X86Disassembler& disassembler);

    /**
     * Trait-object tables in read-only data: [drop, size, align, method...]
     * where drop and methods are procedure starts. `seeds` are table addresses
     * known from debug info and are accepted without the layout check.
     */
    [[nodiscard]] std::vector<callgraph::VirtualTable>
    find_virtual_tables(const std::unordered_set<callgraph::Address>& procedure_starts,
                        std::span<const callgraph::Address> seeds) const;

private:
    struct Section
    {
        std::string name;
        callgraph::Address address = 0;
        std::uint64_t size = 0;
        std::span<const std::uint8_t> contents;  ///< empty for NOBITS
        bool executable = false;
    };

    struct SlotRelocation
    {
        std::optional<callgraph::Address> value;
        std::string symbol;
    };

    [[nodiscard]] const Section* section_containing(callgraph::Address address,
                                                    std::uint64_t size) const;

    std::vector<Section> m_sections;
    std::unordered_map<callgraph::Address, std::string> m_symbols;
    std::unordered_map<std::string, callgraph::Address> m_symbol_addresses;
    std::unordered_set<callgraph::Address> m_function_starts;
    std::unordered_map<callgraph::Address, SlotRelocation> m_relocations;
    std::unordered_map<callgraph::Address, std::string> m_plt_names;
};

}  // namespace panicscan::loader
