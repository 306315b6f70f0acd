/**
 * @file elf_context.cpp
 * @brief Context over an ELF image and its DWARF debug info
 */

#include "loader/elf_context.hpp"

#include "panicscan/common.hpp"
#include "panicscan/crates.hpp"
#include "panicscan/log.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <ranges>
#include <string_view>
#include <utility>

#include <llvm/BinaryFormat/Dwarf.h>
#include <llvm/DebugInfo/DIContext.h>
#include <llvm/DebugInfo/DWARF/DWARFContext.h>
#include <llvm/DebugInfo/DWARF/DWARFDie.h>
#include <llvm/DebugInfo/DWARF/DWARFFormValue.h>
#include <llvm/DebugInfo/DWARF/DWARFUnit.h>
#include <llvm/Demangle/Demangle.h>
#include <llvm/Object/ObjectFile.h>
#include <llvm/Support/MemoryBuffer.h>

namespace panicscan::loader {

namespace {

using callgraph::Address;

constexpr std::string_view kVTableVariablePrefix = "vtable";
constexpr std::size_t kAddrExpressionSize = 9;  // DW_OP_addr + 8-byte address

[[nodiscard]] std::string demangle_name(std::string_view linkage_name)
{
    if (linkage_name.empty()) {
        return {};
    }
    return callgraph::strip_symbol_hash(llvm::demangle(std::string(linkage_name)));
}

[[nodiscard]] std::string_view die_string(const llvm::DWARFDie& die, llvm::dwarf::Attribute attribute)
{
    return llvm::dwarf::toString(die.find(attribute), "");
}

[[nodiscard]] bool is_known(const std::string& value)
{
    return !value.empty() && value != llvm::DILineInfo::BadString;
}

/// Address of a variable located by a single DW_OP_addr expression.
[[nodiscard]] std::optional<Address> static_variable_address(const llvm::DWARFDie& die)
{
    auto location = die.find(llvm::dwarf::DW_AT_location);
    if (!location) {
        return std::nullopt;
    }
    auto block = location->getAsBlock();
    if (!block || block->size() != kAddrExpressionSize || (*block)[0] != llvm::dwarf::DW_OP_addr) {
        return std::nullopt;
    }
    Address address = 0;
    std::memcpy(&address, block->data() + 1, sizeof(address));
    return address;
}

}  // namespace

ElfContext::ElfContext(PrivateTag /*tag*/,
                       std::unique_ptr<llvm::MemoryBuffer> buffer,
                       std::unique_ptr<llvm::object::ObjectFile> object,
                       std::unique_ptr<llvm::DWARFContext> dwarf,
                       X86Disassembler disassembler,
                       BinaryImage image)
    : m_buffer(std::move(buffer))
    , m_object(std::move(object))
    , m_dwarf(std::move(dwarf))
    , m_disassembler(std::move(disassembler))
    , m_image(std::move(image))
{}

ElfContext::~ElfContext() = default;

Result<std::unique_ptr<ElfContext>>
ElfContext::create(std::unique_ptr<llvm::MemoryBuffer> buffer, std::unique_ptr<llvm::object::ObjectFile> object)
{
    auto image = BinaryImage::create(*object);
    if (!image) {
        return std::unexpected(image.error());
    }
    if (!image->has_section(".debug_info")) {
        return std::unexpected(Error::make("NotSupported", "binary without debug information"));
    }
    auto disassembler = X86Disassembler::create();
    if (!disassembler) {
        return std::unexpected(disassembler.error());
    }
    image->name_plt_entries(*disassembler);

    auto dwarf = llvm::DWARFContext::create(*object);
    if (!dwarf) {
        return std::unexpected(Error::make("ParseError", "Cannot read DWARF debug information"));
    }

    auto context = std::make_unique<ElfContext>(PrivateTag{},
                                                std::move(buffer),
                                                std::move(object),
                                                std::move(dwarf),
                                                std::move(*disassembler),
                                                std::move(*image));
    context->index_compilation_units();
    if (context->m_units.empty()) {
        return std::unexpected(Error::make("NotSupported", "binary without compilation units"));
    }
    return context;
}

void ElfContext::index_compilation_units()
{
    std::unordered_set<Address> procedure_starts = m_image.function_starts();
    std::vector<Address> vtable_seeds;

    for (const auto& unit : m_dwarf->compile_units()) {
        llvm::DWARFUnit* cu = unit.get();
        const llvm::DWARFDie unit_die = cu->getUnitDIE(false);
        const char* directory = cu->getCompilationDir();

        callgraph::CompilationUnitRef ref{.index = m_dwarf_units.size(),
                                          .name = std::string(die_string(unit_die, llvm::dwarf::DW_AT_name)),
                                          .directory = directory != nullptr ? directory : ""};
        if (!ref.directory.empty() && std::ranges::find(m_directories, ref.directory) == m_directories.end()) {
            m_directories.push_back(ref.directory);
        }
        if (!m_toolchain_version) {
            m_toolchain_version =
                callgraph::parse_toolchain_version(die_string(unit_die, llvm::dwarf::DW_AT_producer));
        }
        m_dwarf_units.push_back(cu);
        m_units.push_back(std::move(ref));

        for (const llvm::DWARFDebugInfoEntry& entry : cu->dies()) {
            const llvm::DWARFDie die(cu, &entry);
            if (die.getTag() == llvm::dwarf::DW_TAG_subprogram) {
                std::uint64_t low = 0;
                std::uint64_t high = 0;
                std::uint64_t section_index = 0;
                if (die.getLowAndHighPC(low, high, section_index) && low != 0) {
                    procedure_starts.insert(low);
                }
            } else if (die.getTag() == llvm::dwarf::DW_TAG_variable) {
                const char* name = die.getShortName();
                if (name != nullptr && std::string_view(name).starts_with(kVTableVariablePrefix)) {
                    if (auto address = static_variable_address(die)) {
                        vtable_seeds.push_back(*address);
                    }
                }
            }
        }
    }

    m_virtual_tables = m_image.find_virtual_tables(procedure_starts, vtable_seeds);
    log::info("{} compilation units, {} virtual tables", m_units.size(), m_virtual_tables.size());
}

std::vector<callgraph::Procedure>
ElfContext::procedures_for_compilation_unit(const callgraph::CompilationUnitRef& unit,
                                            const std::vector<std::string>& directories) const
{
    std::vector<callgraph::Procedure> procedures;
    if (unit.index >= m_dwarf_units.size()) {
        return procedures;
    }
    llvm::DWARFUnit* cu = m_dwarf_units[unit.index];
    const callgraph::CompilationInfo info{.compilation_dirs = directories,
                                          .toolchain_version = m_toolchain_version.value_or("")};
    const callgraph::Crate unit_crate = callgraph::crate_for_compilation_unit(unit.name, unit.directory, info);

    for (const llvm::DWARFDebugInfoEntry& entry : cu->dies()) {
        const llvm::DWARFDie die(cu, &entry);
        if (die.getTag() != llvm::dwarf::DW_TAG_subprogram) {
            continue;
        }
        std::uint64_t low = 0;
        std::uint64_t high = 0;
        std::uint64_t section_index = 0;
        if (!die.getLowAndHighPC(low, high, section_index) || low == 0 || high <= low) {
            continue;
        }

        callgraph::Procedure procedure;
        procedure.start_address = low;
        procedure.end_address = high;
        if (const char* linkage = die.getLinkageName()) {
            procedure.linkage_name = linkage;
            procedure.linkage_name_demangled = demangle_name(linkage);
        }
        if (const char* name = die.getShortName()) {
            procedure.name = name;
        } else if (!procedure.linkage_name_demangled.empty()) {
            procedure.name = procedure.linkage_name_demangled;
        } else {
            procedure.name = std::format("<anonymous@{:#x}>", low);
        }

        procedure.defining_crate = unit_crate;
        std::string file = die.getDeclFile(llvm::DILineInfoSpecifier::FileLineInfoKind::AbsoluteFilePath);
        if (!file.empty()) {
            file = common::resolve_path(file, unit.directory);
            procedure.defining_crate = callgraph::crate_for_file(file, unit_crate, info);
            procedure.location = callgraph::Location{.file = std::move(file),
                                                     .line = static_cast<std::uint32_t>(die.getDeclLine())};
        }

        if (auto code = m_image.code(low, high)) {
            procedure.disassembly = m_disassembler.disassemble(*code, low);
        } else {
            log::debug("no code for {} at {:#x}", procedure.name, low);
        }
        procedures.push_back(std::move(procedure));
    }
    return procedures;
}

std::vector<callgraph::InlinedFrame> ElfContext::inlined_frames(Address call_site,
                                                                const callgraph::Procedure& enclosing,
                                                                const callgraph::CompilationInfo& info) const
{
    const llvm::DILineInfoSpecifier specifier(llvm::DILineInfoSpecifier::FileLineInfoKind::AbsoluteFilePath,
                                              llvm::DILineInfoSpecifier::FunctionNameKind::LinkageName);
    const llvm::DIInliningInfo inlining = m_dwarf->getInliningInfoForAddress(
        {call_site, llvm::object::SectionedAddress::UndefSection},
        specifier);

    // Frame 0 is the innermost; the last frame is the physical procedure.
    std::vector<callgraph::InlinedFrame> frames;
    const std::uint32_t count = inlining.getNumberOfFrames();
    for (std::uint32_t i = count > 0 ? count - 1 : 0; i-- > 0;) {
        const llvm::DILineInfo& line = inlining.getFrame(i);
        callgraph::InlinedFrame frame;
        frame.function_name = is_known(line.FunctionName) ? demangle_name(line.FunctionName) : "<unknown>";
        if (is_known(line.FileName)) {
            frame.location = callgraph::Location{.file = common::normalize_path(line.FileName), .line = line.Line};
            frame.defining_crate = callgraph::crate_for_file(frame.location.file, enclosing.defining_crate, info);
        } else {
            frame.defining_crate = enclosing.defining_crate;
        }
        frames.push_back(std::move(frame));
    }
    return frames;
}

}  // namespace panicscan::loader
