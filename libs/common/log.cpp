/**
 * @file log.cpp
 * @brief Process-wide diagnostic level
 */

#include "panicscan/log.hpp"

#include <atomic>

namespace panicscan::log {

namespace {

std::atomic<Level> g_level{Level::kQuiet};

}  // namespace

void set_level(Level level) noexcept
{
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept
{
    return g_level.load(std::memory_order_relaxed);
}

}  // namespace panicscan::log
