/**
 * @file block_validator.cpp
 * @brief Реализация проверок блока
 */

#include "block_validator.hpp"
#include "../constants.hpp"
#include "../../crypto/sha256.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <set>

namespace arbor::core::validation {

namespace {

/// @brief Префикс выхода с witness commitment: OP_RETURN, push 36, 0xaa21a9ed
constexpr std::array<uint8_t, 6> WITNESS_COMMITMENT_HEADER = {
    constants::OP_RETURN, 0x24, 0xaa, 0x21, 0xa9, 0xed
};

[[nodiscard]] bool money_range(int64_t value) noexcept {
    return value >= 0 && value <= constants::MAX_MONEY;
}

[[nodiscard]] Result<void> invalid(std::string message) {
    return Err<void>(ErrorCode::InvalidBlock, std::move(message));
}

} // namespace

BlockValidator::BlockValidator(const ChainParams& params)
    : params_(params)
{
}

// =============================================================================
// Структура
// =============================================================================

Result<void> BlockValidator::check_structure(const Block& block) const {
    if (block.transactions.empty()) {
        return invalid("Блок без транзакций");
    }

    const auto& coinbase = block.transactions.front();
    if (!coinbase.is_coinbase()) {
        return invalid("Первая транзакция не coinbase");
    }
    const std::size_t script_size = coinbase.inputs.front().script_sig.size();
    if (script_size < constants::MIN_COINBASE_SCRIPT_SIZE ||
        script_size > constants::MAX_COINBASE_SCRIPT_SIZE) {
        return invalid(std::format("Длина scriptSig coinbase {} вне [{}, {}]", script_size,
                                   constants::MIN_COINBASE_SCRIPT_SIZE,
                                   constants::MAX_COINBASE_SCRIPT_SIZE));
    }

    for (std::size_t i = 1; i < block.transactions.size(); ++i) {
        const auto& tx = block.transactions[i];
        if (tx.is_coinbase()) {
            return invalid(std::format("Лишняя coinbase транзакция #{}", i));
        }
        if (tx.inputs.empty() || tx.outputs.empty()) {
            return invalid(std::format("Транзакция #{} без входов или выходов", i));
        }
        for (const auto& input : tx.inputs) {
            if (input.prevout.is_null()) {
                return invalid(std::format("Транзакция #{} тратит нулевой outpoint", i));
            }
        }
    }

    if (block.weight() > constants::MAX_BLOCK_WEIGHT) {
        return invalid(std::format("Вес блока {} превышает {}", block.weight(),
                                   constants::MAX_BLOCK_WEIGHT));
    }
    return {};
}

Result<void> BlockValidator::check_merkle_root(const Block& block) const {
    const auto merkle = block.compute_merkle_root();
    if (merkle.mutated) {
        return invalid("Дублирующиеся транзакции (CVE-2012-2459)");
    }
    if (merkle.root != block.header.merkle_root) {
        return invalid("merkle root не совпадает с заголовком");
    }
    return {};
}

Result<void> BlockValidator::check_witness_commitment(const Block& block, uint32_t height) const {
    const bool has_witness = std::any_of(
        block.transactions.begin() + 1, block.transactions.end(),
        [](const Transaction& tx) { return tx.has_witness(); });
    if (!has_witness) {
        return {};
    }
    if (height < params_.segwit_height) {
        return invalid("Witness данные до активации segwit");
    }

    // Используется последний выход с commitment
    const auto& coinbase = block.transactions.front();
    const TxOut* commitment = nullptr;
    for (const auto& output : coinbase.outputs) {
        const auto& script = output.script_pubkey;
        if (script.size() >= WITNESS_COMMITMENT_HEADER.size() + 32 &&
            std::equal(WITNESS_COMMITMENT_HEADER.begin(), WITNESS_COMMITMENT_HEADER.end(),
                       script.begin())) {
            commitment = &output;
        }
    }
    if (commitment == nullptr) {
        return invalid("Нет witness commitment при наличии witness данных");
    }

    const auto& nonce = coinbase.inputs.front().witness;
    if (nonce.size() != 1 || nonce.front().size() != 32) {
        return invalid("Некорректный witness reserved value coinbase");
    }

    std::vector<Hash256> wtxids;
    wtxids.reserve(block.transactions.size());
    for (const auto& tx : block.transactions) {
        wtxids.push_back(tx.wtxid());
    }
    const Hash256 witness_root = compute_witness_merkle_root(wtxids);

    Bytes preimage(witness_root.begin(), witness_root.end());
    preimage.insert(preimage.end(), nonce.front().begin(), nonce.front().end());
    const Hash256 expected = crypto::sha256d(preimage);

    if (!std::equal(expected.begin(), expected.end(),
                    commitment->script_pubkey.begin() + WITNESS_COMMITMENT_HEADER.size())) {
        return invalid("witness commitment не совпадает");
    }
    return {};
}

// =============================================================================
// Полная проверка
// =============================================================================

Result<BlockCheck> BlockValidator::check_block(
    const accumulator::UtreexoBlock& utreexo,
    uint32_t height
) const {
    const Block& block = utreexo.block;

    if (auto result = check_structure(block); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = check_witness_commitment(block, height); !result) {
        return std::unexpected(result.error());
    }

    if (utreexo.spent_leaves.size() != utreexo.proof.targets.size()) {
        return Err<BlockCheck>(ErrorCode::InvalidBlock,
                               std::format("{} листьев на {} позиций доказательства",
                                           utreexo.spent_leaves.size(),
                                           utreexo.proof.targets.size()));
    }

    // Листья доказательства по outpoint
    std::map<OutPoint, std::size_t> proven;
    for (std::size_t i = 0; i < utreexo.spent_leaves.size(); ++i) {
        const auto& leaf = utreexo.spent_leaves[i];
        if (!proven.emplace(leaf.prevout, i).second) {
            return Err<BlockCheck>(ErrorCode::InvalidBlock, "Лист доказательства повторяется");
        }
        if (leaf.height >= height) {
            return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                   std::format("Лист создан на высоте {} не раньше блока {}",
                                               leaf.height, height));
        }
        if (leaf.is_coinbase && height - leaf.height < params_.rewards.coinbase_maturity) {
            return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                   std::format("Трата незрелой coinbase высоты {} на высоте {}",
                                               leaf.height, height));
        }
    }

    BlockCheck check;
    check.height = height;

    std::map<OutPoint, int64_t> created;
    std::set<OutPoint> spent;
    std::vector<bool> leaf_used(utreexo.spent_leaves.size(), false);

    for (std::size_t i = 0; i < block.transactions.size(); ++i) {
        const auto& tx = block.transactions[i];
        const Hash256 txid = tx.txid();

        int64_t value_out = 0;
        for (const auto& output : tx.outputs) {
            if (!money_range(output.value)) {
                return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                       std::format("Сумма выхода {} вне диапазона", output.value));
            }
            value_out += output.value;
            if (!money_range(value_out)) {
                return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                       std::format("Сумма выходов транзакции #{} вне диапазона", i));
            }
        }

        if (i > 0) {
            int64_t value_in = 0;
            for (const auto& input : tx.inputs) {
                if (!spent.insert(input.prevout).second) {
                    return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                           std::format("Двойная трата в транзакции #{}", i));
                }

                int64_t input_value = 0;
                if (auto it = created.find(input.prevout); it != created.end()) {
                    input_value = it->second;
                } else if (auto leaf = proven.find(input.prevout); leaf != proven.end()) {
                    leaf_used[leaf->second] = true;
                    input_value = utreexo.spent_leaves[leaf->second].output.value;
                } else {
                    return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                           std::format("Вход транзакции #{} не покрыт доказательством", i));
                }

                value_in += input_value;
                if (!money_range(value_in)) {
                    return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                           std::format("Сумма входов транзакции #{} вне диапазона", i));
                }
            }

            if (value_in < value_out) {
                return Err<BlockCheck>(ErrorCode::InvalidBlock,
                                       std::format("Транзакция #{} тратит больше, чем получает", i));
            }
            check.fees += value_in - value_out;
            if (!money_range(check.fees)) {
                return Err<BlockCheck>(ErrorCode::InvalidBlock, "Сумма комиссий вне диапазона");
            }
        }

        // Выходы coinbase внутри блока незрелы
        if (i > 0 || params_.rewards.coinbase_maturity == 0) {
            for (uint32_t vout = 0; vout < tx.outputs.size(); ++vout) {
                created.emplace(OutPoint{txid, vout}, tx.outputs[vout].value);
            }
        }
    }

    if (std::find(leaf_used.begin(), leaf_used.end(), false) != leaf_used.end()) {
        return Err<BlockCheck>(ErrorCode::InvalidBlock, "Лист доказательства не тратится блоком");
    }

    const int64_t max_reward = params_.block_subsidy(height) + check.fees;
    const int64_t coinbase_value = block.transactions.front().total_output_value();
    if (coinbase_value > max_reward) {
        return Err<BlockCheck>(ErrorCode::InvalidBlock,
                               std::format("Coinbase выплачивает {} при допустимых {}",
                                           coinbase_value, max_reward));
    }

    check.spent_hashes = accumulator::leaf_hashes(utreexo.spent_leaves);
    check.new_leaves = accumulator::leaf_hashes(accumulator::block_leaves(block, height));
    return check;
}

} // namespace arbor::core::validation
