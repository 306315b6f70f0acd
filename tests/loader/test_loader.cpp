/**
 * @file test_loader.cpp
 * @brief Binary loading failure modes
 */

#include "panicscan/loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

using namespace panicscan;

TEST(LoadBinary, MissingFile)
{
    auto result = loader::load_binary("/nonexistent/target/debug/app");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "IOError");
}

TEST(LoadBinary, NotAnObjectFile)
{
    const auto path = std::filesystem::temp_directory_path() / "panicscan_not_elf.txt";
    {
        std::ofstream out(path);
        out << "fn main() { panic!() }\n";
    }
    auto result = loader::load_binary(path.string());
    std::filesystem::remove(path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "ParseError");
}

#if defined(__linux__) && defined(__x86_64__)
// The test executable is built with debug info (see CMakeLists.txt).
TEST(LoadBinary, OwnExecutable)
{
    auto result = loader::load_binary("/proc/self/exe");
    ASSERT_TRUE(result) << result.error().message;
    const auto units = (*result)->compilation_units();
    EXPECT_FALSE(units.empty());
    EXPECT_TRUE(std::ranges::any_of(units, [](const callgraph::CompilationUnitRef& unit) {
        return unit.name.ends_with("test_loader.cpp");
    }));
}
#endif
