/**
 * @file config.cpp
 * @brief Configuration file loading and validation
 */

#include "panicscan/config.hpp"

#include "panicscan/log.hpp"
#include "panicscan/schema_validate.hpp"
#include "panicscan/version.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace panicscan::config {

namespace {

[[nodiscard]] bool is_blank(std::string_view text)
{
    return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
}

[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& entry, const char* key)
{
    if (auto it = entry.find(key); it != entry.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

}  // namespace

Result<FileOptions> parse_config(const nlohmann::json& document)
{
    FileOptions options;
    const auto whitelists = document.find("function_whitelists");
    if (whitelists == document.end()) {
        return options;
    }
    for (auto [i, entry] : std::views::enumerate(*whitelists)) {
        panic_analysis::FunctionWhitelistEntry whitelist{
            .function_name = entry.value("function_name", std::string{}),
            .crate_name = optional_string(entry, "crate_name"),
            .crate_version = optional_string(entry, "crate_version"),
            .strict = entry.value("strict", false),
        };
        if (is_blank(whitelist.function_name)) {
            return std::unexpected(Error::make(
                "InvalidConfig",
                std::format("function_whitelists[{}]: function_name must not be blank", i)));
        }
        options.function_whitelists.push_back(std::move(whitelist));
    }
    return options;
}

Result<FileOptions> load_config(const std::string& path, bool required, const std::string& schema_dir)
{
    if (!std::filesystem::exists(path)) {
        if (required) {
            return std::unexpected(Error::make("ReadError", "Configuration file not found: " + path));
        }
        log::debug("no configuration file at {}", path);
        return FileOptions{};
    }

    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }

    const std::string schema_path =
        std::format("{}/{}.schema.json", schema_dir, kConfigSchemaVersion);
    if (auto validated = common::validate_json(*document, schema_path); !validated) {
        return std::unexpected(validated.error());
    }

    auto options = parse_config(*document);
    if (options) {
        log::info("{}: {} function whitelist entries", path, options->function_whitelists.size());
    }
    return options;
}

}  // namespace panicscan::config
