/**
 * @file pow_validator.cpp
 * @brief Реализация валидатора PoW
 */

#include "pow_validator.hpp"

namespace arbor::core::validation {

PowValidator::PowValidator(const ChainParams& params)
    : params_(params) {}

bool PowValidator::validate_pow(const BlockHeader& header) const noexcept {
    if (!validate_bits(header.bits)) {
        return false;
    }
    return header.hash_uint256() <= bits_to_target(header.bits);
}

bool PowValidator::validate_bits(uint32_t bits) const noexcept {
    auto decoded = decode_compact(bits);
    if (decoded.negative || decoded.overflow || decoded.target.is_zero()) {
        return false;
    }
    return decoded.target <= params_.difficulty.pow_limit;
}

uint32_t PowValidator::next_work_required(
    const HeaderAtHeight& prev,
    uint32_t new_timestamp,
    const AncestorLookup& ancestor
) const {
    const auto& diff = params_.difficulty;
    const uint32_t limit_bits = params_.pow_limit_bits();
    const uint32_t interval = diff.adjustment_interval();

    if ((prev.height + 1) % interval != 0) {
        if (diff.allow_min_difficulty) {
            // Блок минимальной сложности, если сеть молчала 2 * target_spacing
            if (static_cast<int64_t>(new_timestamp) >
                static_cast<int64_t>(prev.header.timestamp) + 2 * diff.target_spacing) {
                return limit_bits;
            }

            // Иначе - последний блок не минимальной сложности в периоде
            HeaderAtHeight cursor = prev;
            while (cursor.height % interval != 0 && cursor.header.bits == limit_bits) {
                auto parent = ancestor(cursor.height - 1);
                if (!parent) {
                    break;
                }
                cursor = *parent;
            }
            return cursor.header.bits;
        }
        return prev.header.bits;
    }

    if (diff.no_retargeting) {
        return prev.header.bits;
    }

    // Первый блок периода
    const uint32_t first_height = prev.height - (interval - 1);
    auto first = ancestor(first_height);
    if (!first) {
        return prev.header.bits;
    }

    const int64_t actual_timespan =
        static_cast<int64_t>(prev.header.timestamp) -
        static_cast<int64_t>(first->header.timestamp);
    return calculate_next_target(prev.header.bits, actual_timespan);
}

uint32_t PowValidator::calculate_next_target(
    uint32_t last_bits,
    int64_t actual_timespan
) const noexcept {
    const int64_t expected = get_expected_timespan();

    // Ограничиваем timespan (не более чем в 4 раза за период)
    if (actual_timespan < expected / 4) {
        actual_timespan = expected / 4;
    }
    if (actual_timespan > expected * 4) {
        actual_timespan = expected * 4;
    }

    // target * actual / expected; actual <= 4 * expected помещается в uint32
    uint256 target = bits_to_target(last_bits);
    target *= static_cast<uint32_t>(actual_timespan);
    target /= uint256{static_cast<uint64_t>(expected)};

    if (target > params_.difficulty.pow_limit) {
        target = params_.difficulty.pow_limit;
    }
    return target_to_bits(target);
}

int64_t PowValidator::get_expected_timespan() const noexcept {
    return static_cast<int64_t>(params_.difficulty.target_timespan);
}

} // namespace arbor::core::validation
