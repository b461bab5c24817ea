/**
 * @file transaction.hpp
 * @brief Транзакция Bitcoin
 *
 * Модель транзакции с поддержкой segwit сериализации (BIP144).
 * Скрипты не интерпретируются: их проверкой занимается ScriptValidator.
 */

#pragma once

#include "../types.hpp"
#include "../serialization/stream.hpp"

#include <cstdint>
#include <vector>

namespace arbor::core {

/**
 * @brief Ссылка на выход транзакции (txid:vout)
 */
struct OutPoint {
    Hash256 txid{};
    uint32_t vout{0};

    /// @brief Нулевой outpoint coinbase входа
    [[nodiscard]] bool is_null() const noexcept {
        return txid == Hash256{} && vout == 0xFFFFFFFF;
    }

    [[nodiscard]] auto operator<=>(const OutPoint&) const noexcept = default;
};

/**
 * @brief Вход транзакции
 */
struct TxIn {
    OutPoint prevout;
    Bytes script_sig;
    uint32_t sequence{0xFFFFFFFF};

    /// @brief Witness стек (пустой для не-segwit входов)
    std::vector<Bytes> witness;

    [[nodiscard]] bool operator==(const TxIn&) const = default;
};

/**
 * @brief Выход транзакции
 */
struct TxOut {
    /// @brief Сумма в сатоши
    int64_t value{0};
    Bytes script_pubkey;

    /**
     * @brief Заведомо нерасходуемый выход
     *
     * OP_RETURN в начале или скрипт длиннее MAX_SCRIPT_SIZE.
     * Такие выходы не добавляются в аккумулятор.
     */
    [[nodiscard]] bool is_unspendable() const noexcept;

    /**
     * @brief Сериализовать (value + script_pubkey)
     */
    void serialize(serialization::WriteStream& out) const;

    [[nodiscard]] static TxOut deserialize(serialization::ReadStream& in);

    [[nodiscard]] bool operator==(const TxOut&) const = default;
};

/**
 * @brief Транзакция
 */
struct Transaction {
    int32_t version{1};
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;
    uint32_t lock_time{0};

    /// @brief Есть ли у какого-либо входа witness данные
    [[nodiscard]] bool has_witness() const noexcept;

    /// @brief Единственный вход с нулевым outpoint
    [[nodiscard]] bool is_coinbase() const noexcept;

    // =========================================================================
    // Сериализация
    // =========================================================================

    /**
     * @brief Сериализовать транзакцию
     *
     * @param with_witness Использовать BIP144 формат (если есть witness)
     */
    void serialize(serialization::WriteStream& out, bool with_witness = true) const;

    [[nodiscard]] Bytes serialize(bool with_witness = true) const;

    /**
     * @brief Десериализовать транзакцию (оба формата)
     *
     * @throws serialization::StreamError при некорректных данных
     */
    [[nodiscard]] static Transaction deserialize(serialization::ReadStream& in);

    // =========================================================================
    // Идентификаторы и размеры
    // =========================================================================

    /// @brief SHA256d сериализации без witness
    [[nodiscard]] Hash256 txid() const;

    /// @brief SHA256d полной сериализации
    [[nodiscard]] Hash256 wtxid() const;

    /// @brief Вес: base_size * 3 + total_size
    [[nodiscard]] std::size_t weight() const;

    /// @brief Сумма выходов (без проверки переполнения)
    [[nodiscard]] int64_t total_output_value() const noexcept;

    [[nodiscard]] bool operator==(const Transaction&) const = default;
};

} // namespace arbor::core
