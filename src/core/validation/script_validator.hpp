/**
 * @file script_validator.hpp
 * @brief Граница с внешним движком проверки скриптов
 *
 * ChainState передаёт блок и данные листьев, которые он тратит, и
 * получает принятие или отказ с причиной. Вызов синхронный, но
 * реализация обязана периодически проверять флаг отмены.
 */

#pragma once

#include "../../accumulator/leaf.hpp"
#include "../primitives/block.hpp"

#include <atomic>
#include <span>

namespace arbor::core::validation {

/**
 * @brief Проверка скриптов блока
 */
class ScriptValidator {
public:
    virtual ~ScriptValidator() = default;

    /**
     * @brief Проверить скрипты всех входов блока
     *
     * @param block Блок
     * @param spent Данные потраченных листьев (порядок доказательства)
     * @param cancel Флаг отмены (shutdown)
     * @return ScriptInvalid с причиной, Cancelled при отмене
     */
    [[nodiscard]] virtual Result<void> validate(
        const Block& block,
        std::span<const accumulator::LeafData> spent,
        const std::atomic<bool>& cancel
    ) = 0;
};

/**
 * @brief Принимает любые скрипты
 *
 * Используется при validation.script_checks = false.
 */
class TrustingScriptValidator final : public ScriptValidator {
public:
    [[nodiscard]] Result<void> validate(
        const Block& /*block*/,
        std::span<const accumulator::LeafData> /*spent*/,
        const std::atomic<bool>& cancel
    ) override {
        if (cancel.load(std::memory_order_relaxed)) {
            return Err<void>(ErrorCode::Cancelled);
        }
        return {};
    }
};

} // namespace arbor::core::validation
