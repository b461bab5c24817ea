/**
 * @file retry.hpp
 * @brief Повтор операций хранилища при временных ошибках
 */

#pragma once

#include "../core/types.hpp"
#include "../log/logger.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>

namespace arbor::storage {

/**
 * @brief Политика повторов
 */
struct RetryPolicy {
    /// @brief Количество повторов после первой попытки
    uint32_t attempts{3};

    /// @brief Задержка перед первым повтором, удваивается
    std::chrono::milliseconds backoff{50};
};

/**
 * @brief Выполнить операцию, повторяя её при StoreIoTransient
 *
 * Остальные ошибки (включая консенсусные) возвращаются сразу.
 *
 * @param policy Политика повторов
 * @param what Описание операции для лога
 * @param op Callable без аргументов, возвращающий Result<T>
 */
template<typename Op>
[[nodiscard]] auto with_retry(const RetryPolicy& policy, std::string_view what, Op&& op)
    -> decltype(op())
{
    auto delay = policy.backoff;
    auto result = op();
    for (uint32_t attempt = 1;
         attempt <= policy.attempts && !result && result.error().code == ErrorCode::StoreIoTransient;
         ++attempt) {
        log::warn("{}: временная ошибка хранилища ({}), повтор {}/{} через {} мс",
                  what, result.error().message, attempt, policy.attempts, delay.count());
        std::this_thread::sleep_for(delay);
        delay *= 2;
        result = op();
    }
    return result;
}

} // namespace arbor::storage
