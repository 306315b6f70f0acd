/**
 * @file main.cpp
 * @brief panicscan CLI entry point
 *
 * Loads a Rust binary, builds its call graph and reports every call from the
 * analysis target that can end in a panic.
 *
 * Exit codes:
 *   0  no panic traces
 *   1  error (usage, configuration, binary)
 *   2  panic traces found
 */

#include "panicscan/builder.hpp"
#include "panicscan/common.hpp"
#include "panicscan/config.hpp"
#include "panicscan/loader.hpp"
#include "panicscan/log.hpp"
#include "panicscan/output.hpp"
#include "panicscan/panic_analysis.hpp"
#include "panicscan/version.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitError = 1;
constexpr int kExitPanicsFound = 2;

void print_version()
{
    std::println("panicscan {} ({})", panicscan::kVersion, panicscan::kBuildId);
    std::println("  config:    {}", panicscan::kConfigSchemaVersion);
    std::println("  trace:     {}", panicscan::kTraceSchemaVersion);
    std::println("  callgraph: {}", panicscan::kCallGraphSchemaVersion);
}

void print_help()
{
    std::print(R"(panicscan - find calls that can lead to a panic in Rust binaries

Usage: panicscan --binary FILE [options]

Options:
  --binary, -b FILE          Binary to analyze (ELF x86-64 with debug info)
  --crates, -c NAME...       Crates forming the analysis target
                             (default: the crate defining `main`)
  --full-crate-analysis, -f  Treat every function of the target as an entry point
  --verbose, -v              Print full backtraces including inlined frames
  --json-stream              Print traces as a stream of JSON objects
  --silent, -s               Print nothing; only the exit code reports results
  --config FILE              Configuration file (default: ./panicscan.json if present)
  --schema-dir DIR           Path to schema directory (default: ./schemas)
  --callgraph, -g KIND...    Write the call graph: full and/or filtered
  --log-level LEVEL          quiet|warn|info|debug (default: info)
  --version                  Show version information
  --help, -h                 Show this help

Exit status: 0 no panic found, 1 error, 2 panic traces found
)");
}

struct CliOptions
{
    std::string binary;
    std::vector<std::string> crates;
    std::optional<std::string> config;
    std::string schema_dir;
    std::vector<panicscan::output::CallGraphKind> callgraphs;
    panicscan::output::OutputOptions output;
    bool full_crate_analysis;
    panicscan::log::Level log_level;
    bool show_help;
    bool show_version;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> panicscan::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            panicscan::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

/// Values following `index` up to the next option. At least one is required.
[[nodiscard]] auto read_option_values(std::span<char*> args,
                                      std::size_t index,
                                      std::string_view option) -> panicscan::Result<std::vector<std::string>>
{
    std::vector<std::string> values;
    for (std::size_t i = index + 1; i < args.size() && args[i] != nullptr; ++i) {
        std::string_view value(args[i]);
        if (value.starts_with('-')) {
            break;
        }
        values.emplace_back(value);
    }
    if (values.empty()) {
        return std::unexpected(
            panicscan::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return values;
}

[[nodiscard]] panicscan::Result<panicscan::output::CallGraphKind> parse_callgraph_kind(std::string_view value)
{
    if (value == "full") {
        return panicscan::output::CallGraphKind::kFull;
    }
    if (value == "filtered") {
        return panicscan::output::CallGraphKind::kFiltered;
    }
    return std::unexpected(panicscan::Error::make(
        "InvalidArgument",
        std::string("Invalid --callgraph value (expected full or filtered): ") + std::string(value)));
}

[[nodiscard]] panicscan::Result<panicscan::log::Level> parse_log_level(std::string_view value)
{
    using panicscan::log::Level;
    if (value == "quiet") {
        return Level::kQuiet;
    }
    if (value == "warn") {
        return Level::kWarn;
    }
    if (value == "info") {
        return Level::kInfo;
    }
    if (value == "debug") {
        return Level::kDebug;
    }
    return std::unexpected(
        panicscan::Error::make("InvalidArgument", std::string("Invalid --log-level value: ") + std::string(value)));
}

[[nodiscard]] auto set_value_option(std::string_view arg,
                                    // CLI parsing signature is stable.
                                    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                    std::span<char*> args,
                                    std::size_t idx,
                                    CliOptions& options,
                                    std::size_t& skip) -> panicscan::Result<bool>
{
    if (arg == "--binary" || arg == "-b") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.binary = *value;
        skip = 1;
        return panicscan::Result<bool>{true};
    }
    if (arg == "--config") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.config = *value;
        skip = 1;
        return panicscan::Result<bool>{true};
    }
    if (arg == "--schema-dir") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.schema_dir = *value;
        skip = 1;
        return panicscan::Result<bool>{true};
    }
    if (arg == "--log-level") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto level = parse_log_level(*value);
        if (!level) {
            return std::unexpected(level.error());
        }
        options.log_level = *level;
        skip = 1;
        return panicscan::Result<bool>{true};
    }
    if (arg == "--crates" || arg == "-c") {
        auto values = read_option_values(args, idx, arg);
        if (!values) {
            return std::unexpected(values.error());
        }
        options.crates.insert(options.crates.end(), values->begin(), values->end());
        skip = values->size();
        return panicscan::Result<bool>{true};
    }
    if (arg == "--callgraph" || arg == "-g") {
        auto values = read_option_values(args, idx, arg);
        if (!values) {
            return std::unexpected(values.error());
        }
        for (const auto& value : *values) {
            auto kind = parse_callgraph_kind(value);
            if (!kind) {
                return std::unexpected(kind.error());
            }
            if (std::ranges::find(options.callgraphs, *kind) == options.callgraphs.end()) {
                options.callgraphs.push_back(*kind);
            }
        }
        skip = values->size();
        return panicscan::Result<bool>{true};
    }
    return panicscan::Result<bool>{false};
}

[[nodiscard]] auto set_flag_option(std::string_view arg, CliOptions& options) -> bool
{
    if (arg == "--help" || arg == "-h") {
        options.show_help = true;
    } else if (arg == "--version") {
        options.show_version = true;
    } else if (arg == "--verbose" || arg == "-v") {
        options.output.verbose = true;
    } else if (arg == "--silent" || arg == "-s") {
        options.output.silent = true;
    } else if (arg == "--json-stream") {
        options.output.json = true;
    } else if (arg == "--full-crate-analysis" || arg == "-f") {
        options.full_crate_analysis = true;
    } else {
        return false;
    }
    return true;
}

[[nodiscard]] panicscan::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options{.binary = std::string{},
                       .crates = {},
                       .config = std::nullopt,
                       .schema_dir = "schemas",
                       .callgraphs = {},
                       .output = {},
                       .full_crate_analysis = false,
                       .log_level = panicscan::log::Level::kInfo,
                       .show_help = false,
                       .show_version = false};
    std::size_t skip = 0;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip > 0) {
            --skip;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (set_flag_option(arg, options)) {
            continue;
        }
        auto handled = set_value_option(arg, args, idx, options, skip);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                panicscan::Error::make("InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }

    if (options.show_help || options.show_version) {
        return options;
    }
    if (options.binary.empty()) {
        return std::unexpected(panicscan::Error::make("MissingArgument", "--binary is required"));
    }
    if (options.output.silent && (options.output.verbose || options.output.json)) {
        return std::unexpected(panicscan::Error::make(
            "InvalidArgument",
            "--silent cannot be combined with --verbose or --json-stream"));
    }
    return options;
}

[[nodiscard]] int run_analysis(const CliOptions& options)
{
    namespace ps = panicscan;
    ps::log::set_level(options.log_level);

    const bool config_required = options.config.has_value();
    auto file_options = ps::config::load_config(options.config.value_or(std::string(ps::config::kDefaultConfigFile)),
                                                config_required,
                                                options.schema_dir);
    if (!file_options) {
        std::println(stderr, "Error: configuration: {}", file_options.error().message);
        return kExitError;
    }

    auto context = ps::loader::load_binary(options.binary);
    if (!context) {
        std::println(stderr, "Error: {}: {}", context.error().code, context.error().message);
        return kExitError;
    }

    const ps::callgraph::CallGraphBuilder builder(ps::callgraph::default_invocation_finders());
    ps::callgraph::CallGraph graph = builder.build_call_graph(**context);

    const ps::panic_analysis::AnalysisOptions analysis_options{
        .crate_names = options.crates,
        .whitelisted_functions = std::move(file_options->function_whitelists),
        .full_crate_analysis = options.full_crate_analysis,
    };
    auto results = ps::panic_analysis::find_panics(graph, graph.compilation_info(), analysis_options);
    if (!results) {
        std::println(stderr, "Error: {}", results.error().message);
        return kExitError;
    }

    ps::output::print_results(options.output, graph, *results, stdout);

    for (const auto kind : options.callgraphs) {
        const std::string path = ps::output::call_graph_file_name(options.binary, kind);
        const auto document = ps::output::export_call_graph(graph,
                                                            *results,
                                                            kind,
                                                            ps::common::last_path_component(options.binary));
        if (auto written = ps::output::write_json_file(path, document); !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return kExitError;
        }
        ps::log::info("wrote {}", path);
    }

    return results->calls.empty() ? kExitClean : kExitPanicsFound;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitError;
        }
        auto options = parse_args(std::span<char*>(argv + 1, static_cast<std::size_t>(argc - 1)));
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            print_help();
            return kExitError;
        }
        if (options->show_help) {
            print_help();
            return kExitClean;
        }
        if (options->show_version) {
            print_version();
            return kExitClean;
        }
        return run_analysis(*options);
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
