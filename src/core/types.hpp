/**
 * @file types.hpp
 * @brief Базовые типы arbor
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (block hash, txid, узел аккумулятора)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace arbor {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - Block hash
 * - Transaction ID (txid)
 * - Merkle root
 * - Узлов и корней Utreexo аккумулятора
 *
 * Хранится в little-endian формате (как в Bitcoin протоколе).
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Консенсусные ошибки (300-499) - окончательный вердикт о входных данных,
 * повторять их бессмысленно. Повторяется только StoreIoTransient.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки хранилища (200-299)
    StoreNotFound = 200,
    StoreIoError = 201,
    StoreIoTransient = 202,
    StoreCorruption = 203,
    UndoUnavailable = 204,

    // Ошибки аккумулятора (300-399)
    MalformedForest = 300,
    ProofInvalid = 301,

    // Ошибки консенсуса (400-499)
    InvalidHeader = 400,
    InvalidBlock = 401,
    ScriptInvalid = 402,
    OrphanHeader = 403,
    DuplicateBlock = 404,

    // Ошибки цепи (500-599)
    ReorgDepthExceeded = 500,
    NotOnBestChain = 501,
    Cancelled = 502,

    // Системные ошибки (800-899)
    SystemIOError = 801,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::StoreNotFound: return "Запись не найдена";
        case ErrorCode::StoreIoError: return "Ошибка ввода/вывода хранилища";
        case ErrorCode::StoreIoTransient: return "Временная ошибка ввода/вывода хранилища";
        case ErrorCode::StoreCorruption: return "Повреждение хранилища";
        case ErrorCode::UndoUnavailable: return "Undo данные удалены (pruned)";
        case ErrorCode::MalformedForest: return "Некорректное состояние леса";
        case ErrorCode::ProofInvalid: return "Некорректное доказательство включения";
        case ErrorCode::InvalidHeader: return "Некорректный заголовок";
        case ErrorCode::InvalidBlock: return "Некорректный блок";
        case ErrorCode::ScriptInvalid: return "Скрипты блока отклонены";
        case ErrorCode::OrphanHeader: return "Неизвестен предыдущий блок";
        case ErrorCode::DuplicateBlock: return "Блок уже подключён";
        case ErrorCode::ReorgDepthExceeded: return "Глубина реорганизации превышает окно хранения";
        case ErrorCode::NotOnBestChain: return "Блок не на лучшей цепи";
        case ErrorCode::Cancelled: return "Операция отменена";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/**
 * @brief Проверить, является ли ошибка консенсусной (не повторяется)
 */
[[nodiscard]] constexpr bool is_consensus_error(ErrorCode code) noexcept {
    const auto value = static_cast<int>(code);
    return value >= 300 && value < 500;
}

} // namespace arbor

// Hash для Hash256 - для unordered контейнеров
namespace std {
template<>
struct hash<arbor::Hash256> {
    std::size_t operator()(const arbor::Hash256& h) const noexcept {
        // Хеш блока и так равномерно распределён: берём первые 8 байт
        std::size_t result = 0;
        std::memcpy(&result, h.data(), sizeof(result));
        return result;
    }
};
}
