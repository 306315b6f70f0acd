/**
 * @file test_crates.cpp
 * @brief Crate provenance and toolchain version detection
 */

#include "panicscan/crates.hpp"

#include <gtest/gtest.h>

using namespace panicscan::callgraph;

namespace {

CompilationInfo info_for(std::string version)
{
    return CompilationInfo{.compilation_dirs = {"/work/app"}, .toolchain_version = std::move(version)};
}

}  // namespace

TEST(ToolchainVersion, ParsedFromProducer)
{
    EXPECT_EQ(parse_toolchain_version("clang LLVM (rustc version 1.26.2 (594fb253c 2018-06-01))"),
              "1.26.2");
    EXPECT_EQ(parse_toolchain_version("clang LLVM (rustc version 1.75.0-nightly (abc 2023-10-01))"),
              "1.75.0-nightly");
    EXPECT_FALSE(parse_toolchain_version("GNU C17 12.2.0"));
}

TEST(ToolchainVersion, Comparison)
{
    EXPECT_LT(compare_versions("1.9.0", "1.26.0"), 0);
    EXPECT_EQ(compare_versions("1.71", "1.71.0"), 0);
    EXPECT_GT(compare_versions("1.75.0-nightly", "1.71.0"), 0);
    EXPECT_TRUE(version_at_least("1.32.0", "1.32.0"));
    EXPECT_FALSE(version_at_least("", "1.0.0"));
}

TEST(StdlibPaths, PrefixesDependOnVersion)
{
    EXPECT_EQ(stdlib_path_prefixes("1.26.2"), (std::vector<std::string>{"/checkout/"}));
    EXPECT_EQ(stdlib_path_prefixes("1.75.0"), (std::vector<std::string>{"/rustc/"}));
    EXPECT_EQ(stdlib_path_prefixes("").size(), 2U);
}

TEST(StdlibPaths, Recognition)
{
    EXPECT_TRUE(is_stdlib_path("/checkout/src/libcore/panicking.rs", "1.26.2"));
    EXPECT_FALSE(is_stdlib_path("/checkout/src/libcore/panicking.rs", "1.75.0"));
    EXPECT_TRUE(is_stdlib_path("/rustc/90c541806f23a127002de5b4038be731ba1458ca/library/core/src/panicking.rs",
                               "1.75.0"));
    EXPECT_TRUE(is_stdlib_path("/home/dev/.rustup/toolchains/stable/lib/rustlib/src/rust/library/std/src/lib.rs",
                               "1.75.0"));
    EXPECT_FALSE(is_stdlib_path("/work/app/src/main.rs", ""));
    EXPECT_FALSE(is_stdlib_path("", ""));
}

TEST(CrateProvenance, ApplicationUnit)
{
    const auto crate = crate_for_compilation_unit("src/main.rs/@/hello.3a1fbbbh-cgu.0",
                                                  "/work/hello",
                                                  info_for("1.75.0"));
    EXPECT_EQ(crate.name, "hello");
    EXPECT_FALSE(crate.version);
}

TEST(CrateProvenance, RegistryUnit)
{
    const auto crate = crate_for_compilation_unit(
        "/home/dev/.cargo/registry/src/index.crates.io-6f17d22bba15001f/serde-1.0.80/src/lib.rs/@/serde.1-cgu.0",
        "/home/dev/.cargo/registry/src/index.crates.io-6f17d22bba15001f/serde-1.0.80",
        info_for("1.75.0"));
    EXPECT_EQ(crate, (Crate{.name = "serde", .version = "1.0.80"}));
}

TEST(CrateProvenance, StdlibUnit)
{
    const auto crate = crate_for_compilation_unit("library/std/src/lib.rs/@/std.abc-cgu.0",
                                                  "/rustc/90c541806f23a127002de5b4038be731ba1458ca",
                                                  info_for("1.75.0"));
    EXPECT_EQ(crate, (Crate{.name = std::string(kStdlibCrateName), .version = "1.75.0"}));
}

TEST(CrateProvenance, FileFallsBackToUnitCrate)
{
    const Crate app{.name = "app", .version = std::nullopt};
    const auto info = info_for("1.75.0");
    EXPECT_EQ(crate_for_file("/work/app/src/lib.rs", app, info), app);
    EXPECT_EQ(crate_for_file("/rustc/abc/library/core/src/option.rs", app, info).name, kStdlibCrateName);
    EXPECT_EQ(crate_for_file("/home/dev/.cargo/registry/src/github.com-1ecc6299db9ec823/itoa-1.0.9/src/lib.rs",
                             app,
                             info),
              (Crate{.name = "itoa", .version = "1.0.9"}));
}

TEST(SymbolHash, Stripped)
{
    EXPECT_EQ(strip_symbol_hash("core::panicking::panic::h0123456789abcdef"), "core::panicking::panic");
    EXPECT_EQ(strip_symbol_hash("core::panicking::panic"), "core::panicking::panic");
    EXPECT_EQ(strip_symbol_hash("app::hash::hzzzzzzzzzzzzzzzz"), "app::hash::hzzzzzzzzzzzzzzzz");
}
