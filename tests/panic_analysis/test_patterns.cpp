/**
 * @file test_patterns.cpp
 * @brief Panic primitive names, whitelist matching and pattern names
 */

#include "panicscan/panic_analysis.hpp"

#include <gtest/gtest.h>

using namespace panicscan;
using namespace panicscan::panic_analysis;

TEST(BaseName, StripsHashAndGenerics)
{
    EXPECT_EQ(base_name("std::panicking::begin_panic::<&str>"), "std::panicking::begin_panic");
    EXPECT_EQ(base_name("std::panicking::begin_panic::h1a2b3c4d5e6f7081"), "std::panicking::begin_panic");
    EXPECT_EQ(base_name("core::option::Option<T>::unwrap"), "core::option::Option<T>::unwrap");
    EXPECT_EQ(base_name("<T as Trait>"), "<T as Trait>");
}

TEST(PanicPrimitive, LegacyNames)
{
    EXPECT_TRUE(is_panic_primitive("core::panicking::panic", "1.26.2"));
    EXPECT_TRUE(is_panic_primitive("std::panicking::rust_panic_with_hook", ""));
    EXPECT_TRUE(is_panic_primitive("rust_begin_unwind", "1.75.0"));
    EXPECT_FALSE(is_panic_primitive("core::panicking::panic_display_helper", "1.75.0"));
    EXPECT_FALSE(is_panic_primitive("app::panic", "1.75.0"));
}

TEST(PanicPrimitive, PanicConstFamilyIsVersioned)
{
    EXPECT_TRUE(is_panic_primitive("core::panicking::panic_const::panic_const_div_by_zero", "1.75.0"));
    EXPECT_TRUE(is_panic_primitive("core::option::unwrap_failed", ""));
    EXPECT_FALSE(is_panic_primitive("core::option::unwrap_failed", "1.60.0"));
}

TEST(Whitelist, SubstringAndStrictMatching)
{
    callgraph::Procedure procedure;
    procedure.name = "capacity_overflow";
    procedure.linkage_name_demangled = "alloc::raw_vec::capacity_overflow::h0123456789abcdef";
    procedure.defining_crate = {.name = "stdlib", .version = "1.75.0"};

    EXPECT_TRUE(matches_whitelist({.function_name = "raw_vec"}, procedure));
    EXPECT_TRUE(matches_whitelist({.function_name = "alloc::raw_vec::capacity_overflow", .strict = true},
                                  procedure));
    EXPECT_FALSE(matches_whitelist({.function_name = "raw_vec", .strict = true}, procedure));
    EXPECT_TRUE(matches_whitelist({.function_name = "capacity", .crate_name = "stdlib", .crate_version = "1.75.0"},
                                  procedure));
    EXPECT_FALSE(matches_whitelist({.function_name = "capacity", .crate_version = "1.74.0"}, procedure));
}

TEST(PatternNames, Both)
{
    EXPECT_EQ(to_string(PanicPattern::kDirectCall), "direct_call");
    EXPECT_EQ(display_name(PanicPattern::kDirectCall), "DirectCall");
    EXPECT_EQ(to_string(PanicPattern::kArithmetic), "arithmetic");
    EXPECT_EQ(display_name(PanicPattern::kUnrecognized), "Unrecognized");
}
