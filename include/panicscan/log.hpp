#pragma once

/**
 * @file log.hpp
 * @brief Diagnostic output on stderr
 *
 * Messages are written with std::println as "[panicscan] <message>".
 * The library default is kQuiet; the CLI raises it to kInfo.
 */

#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

namespace panicscan::log {

enum class Level {
    kQuiet,
    kWarn,
    kInfo,
    kDebug
};

void set_level(Level level) noexcept;

[[nodiscard]] Level level() noexcept;

[[nodiscard]] inline bool enabled(Level at) noexcept
{
    return at != Level::kQuiet && static_cast<int>(at) <= static_cast<int>(level());
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::kWarn)) {
        std::println(stderr, "[panicscan] warning: {}", std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::kInfo)) {
        std::println(stderr, "[panicscan] {}", std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::kDebug)) {
        std::println(stderr, "[panicscan] {}", std::format(fmt, std::forward<Args>(args)...));
    }
}

}  // namespace panicscan::log
