/**
 * @file logger.hpp
 * @brief Консольное логирование
 *
 * Строки вида "[INFO] сообщение". Ошибки и предупреждения пишутся
 * в stderr, остальное в stdout. Порог задаётся секцией [logging].
 *
 * @code
 * log::info("Блок {} подключён на высоте {}", hex, height);
 * @endcode
 */

#pragma once

#include <atomic>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace arbor::log {

/**
 * @brief Уровень логирования
 */
enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

/**
 * @brief Преобразование уровня в метку строки лога
 */
[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARNING";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

/**
 * @brief Установить порог логирования
 */
void set_level(Level level) noexcept;

[[nodiscard]] Level get_level() noexcept;

/**
 * @brief Будет ли сообщение данного уровня выведено
 */
[[nodiscard]] bool enabled(Level level) noexcept;

/**
 * @brief Вывести готовую строку
 */
void write(Level level, std::string_view message);

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error)) {
        write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) {
        write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) {
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) {
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
    }
}

} // namespace arbor::log
