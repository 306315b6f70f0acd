#pragma once

/**
 * @file loader.hpp
 * @brief Opens an ELF x86-64 binary with DWARF debug info as a call graph Context
 *
 * Error codes:
 *   IOError       file missing or unreadable
 *   ParseError    not an object file, or debug info cannot be read
 *   NotSupported  not ELF64 little-endian x86-64, or no .debug_info
 */

#include "panicscan/common.hpp"
#include "panicscan/context.hpp"

#include <memory>
#include <string_view>

namespace panicscan::loader {

[[nodiscard]] Result<std::unique_ptr<callgraph::Context>> load_binary(std::string_view path);

}  // namespace panicscan::loader
