/**
 * @file mtp_calculator.cpp
 * @brief Реализация вычисления Median Time Past
 */

#include "mtp_calculator.hpp"

#include <algorithm>
#include <vector>

namespace arbor::core {

void MtpCalculator::push_timestamp(uint32_t timestamp) noexcept {
    timestamps_[head_] = timestamp;
    head_ = (head_ + 1) % MTP_BLOCK_COUNT;

    if (count_ < MTP_BLOCK_COUNT) {
        ++count_;
    }
}

void MtpCalculator::push_header(const BlockHeader& header) noexcept {
    push_timestamp(header.timestamp);
}

void MtpCalculator::reset() noexcept {
    timestamps_.fill(0);
    count_ = 0;
    head_ = 0;
}

uint32_t MtpCalculator::get_mtp() const noexcept {
    if (count_ == 0) {
        return 0;
    }

    // Пока буфер не заполнен, записи лежат в [0, count_)
    std::array<uint32_t, MTP_BLOCK_COUNT> sorted = timestamps_;
    auto end = sorted.begin() + static_cast<std::ptrdiff_t>(count_);
    std::sort(sorted.begin(), end);
    return sorted[count_ / 2];
}

uint32_t MtpCalculator::get_min_timestamp() const noexcept {
    return get_mtp() + 1;
}

bool MtpCalculator::has_sufficient_data() const noexcept {
    return count_ >= MTP_BLOCK_COUNT;
}

std::size_t MtpCalculator::count() const noexcept {
    return count_;
}

uint32_t median_time_past(std::span<const uint32_t> timestamps) {
    if (timestamps.empty()) {
        return 0;
    }
    std::vector<uint32_t> sorted(timestamps.begin(), timestamps.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted[sorted.size() / 2];
}

} // namespace arbor::core
