/**
 * @file crates.cpp
 * @brief Crate provenance from debug-info paths and toolchain version parsing
 */

#include "panicscan/crates.hpp"

#include "panicscan/common.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>
#include <string>
#include <vector>

namespace panicscan::callgraph {

namespace {

constexpr std::string_view kProducerMarker = "rustc version ";
constexpr std::string_view kCheckoutPrefix = "/checkout/";
constexpr std::string_view kRemappedPrefix = "/rustc/";
constexpr std::string_view kRustSrcComponent = "/lib/rustlib/src/rust/";
constexpr std::string_view kRegistryComponent = "/.cargo/registry/src/";
constexpr std::string_view kCodegenUnitMarker = "/@/";
/// First toolchain release whose standard library paths are remapped to /rustc/<hash>/.
constexpr std::string_view kRemappedSinceVersion = "1.32.0";
constexpr std::size_t kSymbolHashLength = 16;

[[nodiscard]] bool is_hex_digit(char c) noexcept
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_digit(char c) noexcept
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] std::vector<unsigned> version_components(std::string_view version)
{
    std::vector<unsigned> components;
    const auto release = version.substr(0, version.find('-'));
    for (auto part : release | std::views::split('.')) {
        std::string_view sv(part.begin(), part.end());
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{}) {
            break;
        }
        components.push_back(value);
        if (ptr != sv.data() + sv.size()) {
            break;
        }
    }
    return components;
}

/// "serde-1.0.80" -> {"serde", "1.0.80"}
[[nodiscard]] std::optional<Crate> split_crate_directory(std::string_view directory)
{
    for (auto pos = directory.rfind('-'); pos != std::string_view::npos && pos > 0;
         pos = directory.rfind('-', pos - 1)) {
        const auto version = directory.substr(pos + 1);
        if (version.empty() || !is_digit(version.front())) {
            continue;
        }
        if (version_components(version).empty()) {
            continue;
        }
        return Crate{.name = std::string(directory.substr(0, pos)), .version = std::string(version)};
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<Crate> registry_crate(std::string_view path)
{
    const auto marker = path.find(kRegistryComponent);
    if (marker == std::string_view::npos) {
        return std::nullopt;
    }
    // <registry>/src/<index-dir>/<crate>-<version>/...
    auto rest = path.substr(marker + kRegistryComponent.size());
    const auto index_end = rest.find('/');
    if (index_end == std::string_view::npos) {
        return std::nullopt;
    }
    rest = rest.substr(index_end + 1);
    const auto crate_end = rest.find('/');
    return split_crate_directory(rest.substr(0, crate_end));
}

[[nodiscard]] std::optional<std::string> toolchain_version_of(const CompilationInfo& info)
{
    if (info.toolchain_version.empty()) {
        return std::nullopt;
    }
    return info.toolchain_version;
}

[[nodiscard]] Crate stdlib_crate(const CompilationInfo& info)
{
    return Crate{.name = std::string(kStdlibCrateName), .version = toolchain_version_of(info)};
}

}  // namespace

std::optional<std::string> parse_toolchain_version(std::string_view producer)
{
    const auto marker = producer.find(kProducerMarker);
    if (marker == std::string_view::npos) {
        return std::nullopt;
    }
    auto rest = producer.substr(marker + kProducerMarker.size());
    const auto end = rest.find_first_of(" )");
    auto version = rest.substr(0, end);
    if (version.empty() || !is_digit(version.front())) {
        return std::nullopt;
    }
    return std::string(version);
}

int compare_versions(std::string_view lhs, std::string_view rhs)
{
    const auto a = version_components(lhs);
    const auto b = version_components(rhs);
    const std::size_t count = std::max(a.size(), b.size());
    for (std::size_t i = 0; i < count; ++i) {
        const unsigned left = i < a.size() ? a[i] : 0U;
        const unsigned right = i < b.size() ? b[i] : 0U;
        if (left != right) {
            return left < right ? -1 : 1;
        }
    }
    return 0;
}

bool version_at_least(std::string_view version, std::string_view minimum)
{
    return !version.empty() && compare_versions(version, minimum) >= 0;
}

std::vector<std::string> stdlib_path_prefixes(std::string_view toolchain_version)
{
    if (toolchain_version.empty()) {
        return {std::string(kCheckoutPrefix), std::string(kRemappedPrefix)};
    }
    if (compare_versions(toolchain_version, kRemappedSinceVersion) < 0) {
        return {std::string(kCheckoutPrefix)};
    }
    return {std::string(kRemappedPrefix)};
}

bool is_stdlib_path(std::string_view path, std::string_view toolchain_version)
{
    if (path.empty()) {
        return false;
    }
    std::string normalized = common::normalize_path(path);
    normalized += '/';
    if (normalized.find(kRustSrcComponent) != std::string::npos) {
        return true;
    }
    return std::ranges::any_of(stdlib_path_prefixes(toolchain_version),
                               [&normalized](const std::string& prefix) {
                                   return normalized.starts_with(prefix);
                               });
}

Crate crate_for_compilation_unit(std::string_view unit_name,
                                 std::string_view comp_dir,
                                 const CompilationInfo& info)
{
    const std::string unit_path = common::resolve_path(unit_name, comp_dir);
    if (is_stdlib_path(comp_dir, info.toolchain_version)
        || is_stdlib_path(unit_path, info.toolchain_version)) {
        return stdlib_crate(info);
    }
    if (auto crate = registry_crate(unit_path)) {
        return *crate;
    }

    const std::string directory = common::last_path_component(comp_dir);
    auto from_directory = split_crate_directory(directory);

    if (const auto marker = unit_name.find(kCodegenUnitMarker); marker != std::string_view::npos) {
        // "src/main.rs/@/hello.3a1fbbbh-cgu.0"
        auto codegen_unit = unit_name.substr(marker + kCodegenUnitMarker.size());
        auto crate_name = codegen_unit.substr(0, codegen_unit.find('.'));
        if (!crate_name.empty()) {
            std::optional<std::string> version;
            if (from_directory && from_directory->name == crate_name) {
                version = from_directory->version;
            }
            return Crate{.name = std::string(crate_name), .version = std::move(version)};
        }
    }

    if (from_directory) {
        return *from_directory;
    }
    if (!directory.empty()) {
        return Crate{.name = directory, .version = std::nullopt};
    }
    return Crate{.name = common::last_path_component(unit_name), .version = std::nullopt};
}

Crate crate_for_file(std::string_view file, const Crate& fallback, const CompilationInfo& info)
{
    if (is_stdlib_path(file, info.toolchain_version)) {
        return stdlib_crate(info);
    }
    if (auto crate = registry_crate(common::normalize_path(file))) {
        return *crate;
    }
    return fallback;
}

std::string strip_symbol_hash(std::string_view demangled)
{
    constexpr std::size_t kSuffixLength = 3 + kSymbolHashLength;  // "::h" + hash
    if (demangled.size() > kSuffixLength) {
        const auto suffix = demangled.substr(demangled.size() - kSuffixLength);
        if (suffix.starts_with("::h")
            && std::ranges::all_of(suffix.substr(3), [](char c) { return is_hex_digit(c); })) {
            return std::string(demangled.substr(0, demangled.size() - kSuffixLength));
        }
    }
    return std::string(demangled);
}

}  // namespace panicscan::callgraph
