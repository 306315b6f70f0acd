/**
 * @file binary_image.cpp
 * @brief Section contents, symbols and dynamic relocations of an ELF image
 */

#include "loader/binary_image.hpp"

#include "panicscan/log.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstring>
#include <ranges>
#include <utility>

#include <llvm/BinaryFormat/ELF.h>
#include <llvm/Object/ELFObjectFile.h>
#include <llvm/Object/ObjectFile.h>
#include <llvm/Support/Error.h>

namespace panicscan::loader {

namespace {

using callgraph::Address;

constexpr std::uint64_t kPointerSize = 8;
constexpr std::uint64_t kMaxObjectSize = std::uint64_t{1} << 32;
constexpr std::uint64_t kMaxAlignment = std::uint64_t{1} << 16;
/// drop_in_place, size, align
constexpr std::size_t kVTableHeaderSlots = 3;

constexpr std::array<std::string_view, 3> kPltSections = {".plt", ".plt.sec", ".plt.got"};
constexpr std::array<std::string_view, 3> kReadOnlyDataSections = {".data.rel.ro",
                                                                    ".data.rel.ro.local",
                                                                    ".rodata"};

template <typename T>
[[nodiscard]] std::optional<T> take(llvm::Expected<T> value, std::string_view what)
{
    if (!value) {
        log::debug("{}: {}", what, llvm::toString(value.takeError()));
        return std::nullopt;
    }
    return std::move(*value);
}

void add_symbol(const llvm::object::SymbolRef& symbol,
                std::unordered_map<Address, std::string>& names,
                std::unordered_map<std::string, Address>& addresses,
                std::unordered_set<Address>& function_starts)
{
    auto name = take(symbol.getName(), "symbol name");
    auto address = take(symbol.getAddress(), "symbol address");
    auto type = take(symbol.getType(), "symbol type");
    if (!name || !address || !type || name->empty()) {
        return;
    }
    if (*address == 0) {
        return;
    }
    addresses.emplace(name->str(), *address);
    if (*type == llvm::object::SymbolRef::ST_Function) {
        function_starts.insert(*address);
        names.insert_or_assign(*address, name->str());
    } else if (*type == llvm::object::SymbolRef::ST_Data) {
        names.emplace(*address, name->str());
    }
}

[[nodiscard]] bool is_power_of_two(std::uint64_t value)
{
    return std::has_single_bit(value);
}

}  // namespace

Result<BinaryImage> BinaryImage::create(const llvm::object::ObjectFile& object)
{
    BinaryImage image;

    for (const llvm::object::SectionRef& section : object.sections()) {
        auto name = take(section.getName(), "section name");
        if (!name) {
            continue;
        }
        Section entry{.name = name->str(),
                      .address = section.getAddress(),
                      .size = section.getSize(),
                      .executable = section.isText()};
        if (!section.isBSS() && section.getAddress() != 0) {
            auto contents = section.getContents();
            if (!contents) {
                return std::unexpected(
                    Error::make("ParseError",
                                "Cannot read section " + entry.name + ": "
                                    + llvm::toString(contents.takeError())));
            }
            entry.contents = std::span(reinterpret_cast<const std::uint8_t*>(contents->data()),
                                       contents->size());
        }
        image.m_sections.push_back(std::move(entry));
    }

    for (const llvm::object::SymbolRef& symbol : object.symbols()) {
        add_symbol(symbol, image.m_symbols, image.m_symbol_addresses, image.m_function_starts);
    }
    if (const auto* elf = llvm::dyn_cast<llvm::object::ELFObjectFileBase>(&object)) {
        for (const llvm::object::ELFSymbolRef& symbol : elf->getDynamicSymbolIterators()) {
            add_symbol(symbol, image.m_symbols, image.m_symbol_addresses, image.m_function_starts);
        }
    }

    for (const llvm::object::SectionRef& section : object.dynamic_relocation_sections()) {
        for (const llvm::object::RelocationRef& relocation : section.relocations()) {
            const Address slot = relocation.getOffset();
            const std::uint64_t type = relocation.getType();
            std::int64_t addend = 0;
            if (auto value = llvm::object::ELFRelocationRef(relocation).getAddend()) {
                addend = *value;
            } else {
                llvm::consumeError(value.takeError());  // REL entries carry no addend
            }

            SlotRelocation entry;
            if (auto symbol = relocation.getSymbol(); symbol != object.symbol_end()) {
                if (auto name = take(symbol->getName(), "relocation symbol")) {
                    entry.symbol = name->str();
                }
                auto address = take(symbol->getAddress(), "relocation symbol address");
                if ((!address || *address == 0) && !entry.symbol.empty()) {
                    if (auto it = image.m_symbol_addresses.find(entry.symbol);
                        it != image.m_symbol_addresses.end()) {
                        address = it->second;
                    }
                }
                if (address && *address != 0) {
                    entry.value = *address + static_cast<Address>(addend);
                }
            }
            switch (type) {
                case llvm::ELF::R_X86_64_RELATIVE:
                case llvm::ELF::R_X86_64_IRELATIVE:
                    entry.value = static_cast<Address>(addend);
                    break;
                case llvm::ELF::R_X86_64_64:
                case llvm::ELF::R_X86_64_GLOB_DAT:
                case llvm::ELF::R_X86_64_JUMP_SLOT:
                    break;
                default:
                    continue;
            }
            image.m_relocations.insert_or_assign(slot, std::move(entry));
        }
    }

    log::debug("image: {} sections, {} symbols, {} dynamic relocations",
               image.m_sections.size(),
               image.m_symbols.size(),
               image.m_relocations.size());
    return image;
}

bool BinaryImage::has_section(std::string_view name) const
{
    return std::ranges::any_of(m_sections, [name](const Section& s) { return s.name == name; });
}

const BinaryImage::Section* BinaryImage::section_containing(Address address, std::uint64_t size) const
{
    for (const Section& section : m_sections) {
        if (section.contents.empty()) {
            continue;
        }
        if (address >= section.address && address + size <= section.address + section.contents.size()) {
            return &section;
        }
    }
    return nullptr;
}

std::optional<std::span<const std::uint8_t>> BinaryImage::code(Address start, Address end) const
{
    if (end <= start) {
        return std::nullopt;
    }
    const Section* section = section_containing(start, end - start);
    if (section == nullptr || !section->executable) {
        return std::nullopt;
    }
    return section->contents.subspan(start - section->address, end - start);
}

std::optional<Address> BinaryImage::read_pointer(Address address) const
{
    if (auto it = m_relocations.find(address); it != m_relocations.end()) {
        return it->second.value;
    }
    const Section* section = section_containing(address, kPointerSize);
    if (section == nullptr) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    std::memcpy(&value, section->contents.data() + (address - section->address), sizeof(value));
    if constexpr (std::endian::native == std::endian::big) {
        value = std::byteswap(value);
    }
    return value;
}

std::optional<std::string> BinaryImage::read_string(Address address, std::size_t length) const
{
    const Section* section = section_containing(address, length);
    if (section == nullptr || section->executable) {
        return std::nullopt;
    }
    const auto bytes = section->contents.subspan(address - section->address, length);
    return std::string(bytes.begin(), bytes.end());
}

std::optional<std::string> BinaryImage::symbol_name(Address address) const
{
    if (auto it = m_symbols.find(address); it != m_symbols.end()) {
        return it->second;
    }
    if (auto it = m_plt_names.find(address); it != m_plt_names.end()) {
        return it->second;
    }
    if (auto it = m_relocations.find(address); it != m_relocations.end() && !it->second.symbol.empty()) {
        return it->second.symbol;
    }
    return std::nullopt;
}

void BinaryImage::name_plt_entries(const X86Disassembler& disassembler)
{
    const callgraph::InstructionClassifier& classifier = disassembler.classifier();
    for (const Section& section : m_sections) {
        if (section.contents.empty() || std::ranges::find(kPltSections, section.name) == kPltSections.end()) {
            continue;
        }
        // An entry starts at the first non-padding instruction after a jump.
        std::optional<Address> entry_start;
        bool after_jump = true;
        for (const callgraph::Instruction& insn : disassembler.disassemble(section.contents, section.address)) {
            if (after_jump && !insn.mnemonic.starts_with("nop") && insn.mnemonic != "int3") {
                entry_start = insn.address;
                after_jump = false;
            }
            if (!classifier.is_jump(insn)) {
                continue;
            }
            after_jump = true;
            auto slot = insn.rip_relative_target();
            if (!slot) {
                continue;
            }
            auto it = m_relocations.find(*slot);
            if (it == m_relocations.end() || it->second.symbol.empty()) {
                continue;
            }
            m_plt_names.emplace(insn.address, it->second.symbol);
            if (entry_start) {
                m_plt_names.emplace(*entry_start, it->second.symbol);
            }
        }
    }
    log::debug("image: {} PLT entries named", m_plt_names.size());
}

std::vector<callgraph::VirtualTable>
BinaryImage::find_virtual_tables(const std::unordered_set<Address>& procedure_starts,
                                 std::span<const Address> seeds) const
{
    auto is_procedure = [&](std::optional<Address> value) {
        return value && procedure_starts.contains(*value);
    };
    // Methods following the header, while they are procedure starts.
    auto collect = [&](Address table) {
        callgraph::VirtualTable vtable{.address = table};
        const auto drop = read_pointer(table);
        vtable.entries.push_back(is_procedure(drop) ? *drop : 0);
        vtable.entries.push_back(0);
        vtable.entries.push_back(0);
        for (Address slot = table + kVTableHeaderSlots * kPointerSize;; slot += kPointerSize) {
            const auto method = read_pointer(slot);
            if (!is_procedure(method)) {
                break;
            }
            vtable.entries.push_back(*method);
        }
        return vtable;
    };

    std::vector<callgraph::VirtualTable> tables;
    std::unordered_set<Address> seen;
    for (const Address seed : seeds) {
        if (seen.insert(seed).second) {
            tables.push_back(collect(seed));
        }
    }

    for (const Section& section : m_sections) {
        if (section.contents.empty()
            || std::ranges::find(kReadOnlyDataSections, section.name) == kReadOnlyDataSections.end()) {
            continue;
        }
        const Address begin = (section.address + kPointerSize - 1) & ~(kPointerSize - 1);
        const Address end = section.address + section.contents.size();
        for (Address table = begin; table + (kVTableHeaderSlots + 1) * kPointerSize <= end;) {
            const auto drop = read_pointer(table);
            const auto size = read_pointer(table + kPointerSize);
            const auto align = read_pointer(table + 2 * kPointerSize);
            const auto first_method = read_pointer(table + kVTableHeaderSlots * kPointerSize);
            const bool header_ok = (drop == Address{0} || is_procedure(drop)) && size
                                   && *size < kMaxObjectSize && align && is_power_of_two(*align)
                                   && *align <= kMaxAlignment;
            if (!header_ok || !is_procedure(first_method) || seen.contains(table)) {
                table += kPointerSize;
                continue;
            }
            seen.insert(table);
            tables.push_back(collect(table));
            table += tables.back().entries.size() * kPointerSize;
        }
    }
    log::debug("image: {} virtual tables", tables.size());
    return tables;
}

}  // namespace panicscan::loader
