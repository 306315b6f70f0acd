/**
 * @file loader.cpp
 * @brief Binary loading and format checks
 */

#include "panicscan/loader.hpp"

#include "loader/elf_context.hpp"
#include "panicscan/log.hpp"

#include <string>
#include <utility>

#include <llvm/ADT/Triple.h>
#include <llvm/Object/ELFObjectFile.h>
#include <llvm/Object/ObjectFile.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>

namespace panicscan::loader {

Result<std::unique_ptr<callgraph::Context>> load_binary(std::string_view path)
{
    const std::string file(path);
    auto buffer = llvm::MemoryBuffer::getFile(file, /*IsText=*/false, /*RequiresNullTerminator=*/false);
    if (!buffer) {
        return std::unexpected(
            Error::make("IOError", "Failed to open binary: " + file + ": " + buffer.getError().message()));
    }

    auto object = llvm::object::ObjectFile::createObjectFile((*buffer)->getMemBufferRef());
    if (!object) {
        return std::unexpected(Error::make("ParseError",
                                           "Failed to parse binary: " + file + ": "
                                               + llvm::toString(object.takeError())));
    }

    if (!llvm::isa<llvm::object::ELF64LEObjectFile>(object->get())
        || (*object)->getArch() != llvm::Triple::x86_64) {
        return std::unexpected(
            Error::make("NotSupported", "Only ELF64 little-endian x86-64 binaries are supported: " + file));
    }

    log::info("loading {}", file);
    auto context = ElfContext::create(std::move(*buffer), std::move(*object));
    if (!context) {
        return std::unexpected(context.error());
    }
    return std::unique_ptr<callgraph::Context>(std::move(*context));
}

}  // namespace panicscan::loader
