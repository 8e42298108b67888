// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fee/fee_state.h"

namespace fee {

core::uint256 FeeState::pack() const {
    const core::uint128 f = core::clamp_to_bits(freq, FREQ_BITS);

    core::uint256 word;
    word.set_bits(FREQ_OFFSET, 64, static_cast<uint64_t>(f));
    word.set_bits(FREQ_OFFSET + 64, FREQ_BITS - 64, static_cast<uint64_t>(f >> 64));
    word.set_bits(BASE_FEE_OFFSET, BASE_FEE_BITS, base_fee_ppm);
    word.set_bits(FREQ_LAST_UPDATE_OFFSET, TIMESTAMP_BITS,
                  clamp_timestamp(freq_last_update));
    word.set_bits(CAP_START_OFFSET, TIMESTAMP_BITS, clamp_timestamp(cap_start));
    word.set_bits(LAST_FEE_UPDATE_OFFSET, TIMESTAMP_BITS,
                  clamp_timestamp(last_fee_update));
    word.set_bits(IN_CAP_OFFSET, 1, in_cap ? 1 : 0);
    return word;
}

FeeState FeeState::unpack(const core::uint256& word) {
    FeeState s;
    s.freq = (static_cast<core::uint128>(
                  word.get_bits(FREQ_OFFSET + 64, FREQ_BITS - 64)) << 64) |
             word.get_bits(FREQ_OFFSET, 64);
    s.base_fee_ppm = static_cast<uint32_t>(
        word.get_bits(BASE_FEE_OFFSET, BASE_FEE_BITS));
    s.freq_last_update = word.get_bits(FREQ_LAST_UPDATE_OFFSET, TIMESTAMP_BITS);
    s.cap_start = word.get_bits(CAP_START_OFFSET, TIMESTAMP_BITS);
    s.last_fee_update = word.get_bits(LAST_FEE_UPDATE_OFFSET, TIMESTAMP_BITS);
    s.in_cap = word.get_bits(IN_CAP_OFFSET, 1) != 0;
    return s;
}

bool FeeState::fits() const noexcept {
    return freq <= FREQ_MAX &&
           freq_last_update <= TIMESTAMP_MAX &&
           cap_start <= TIMESTAMP_MAX &&
           last_fee_update <= TIMESTAMP_MAX;
}

void FeeState::add_freq(core::uint128 increment) noexcept {
    freq = core::sat_add(freq, increment, FREQ_MAX);
}

void FeeState::decay_freq(uint64_t elapsed, uint32_t window) noexcept {
    if (elapsed == 0) return;
    if (window == 0 || elapsed >= window) {
        freq = 0;
        return;
    }
    // freq < 2^96 and elapsed < 2^32: the product fits in 128 bits.
    freq = core::sat_sub(freq, core::mul_div(freq, elapsed, window));
}

} // namespace fee
