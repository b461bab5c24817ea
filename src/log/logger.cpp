/**
 * @file logger.cpp
 * @brief Реализация консольного логирования
 */

#include "logger.hpp"

#include <iostream>
#include <mutex>

namespace arbor::log {

namespace {

std::atomic<Level> g_level{Level::Info};

/// @brief Строки разных потоков не перемешиваются
std::mutex g_output_mutex;

} // namespace

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    return std::nullopt;
}

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level get_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(get_level());
}

void write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    auto& out = (level == Level::Error || level == Level::Warn) ? std::cerr : std::cout;
    out << '[' << to_string(level) << "] " << message << std::endl;
}

} // namespace arbor::log
