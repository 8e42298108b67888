#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/arith.h"
#include "core/types.h"

#include <cstdint>

namespace fee {

// ---------------------------------------------------------------------------
// FeeState -- controller state of one pool
// ---------------------------------------------------------------------------
// Stored as a single packed 256-bit word so that a whole update is one
// replace.  Layout, least significant bit first:
//
//   bits   0.. 95  freq              cap-event frequency accumulator
//   bits  96..127  base_fee_ppm
//   bits 128..167  freq_last_update  unix seconds
//   bits 168..207  cap_start         unix seconds, 0 = no cap event
//   bits 208..247  last_fee_update   unix seconds
//   bit  248       in_cap
//
// The all-zero word means "not initialised"; an initialised state always
// has a non-zero freq_last_update and last_fee_update.
// ---------------------------------------------------------------------------
struct FeeState {
    static constexpr unsigned FREQ_BITS      = 96;
    static constexpr unsigned BASE_FEE_BITS  = 32;
    static constexpr unsigned TIMESTAMP_BITS = 40;

    static constexpr unsigned FREQ_OFFSET             = 0;
    static constexpr unsigned BASE_FEE_OFFSET         = 96;
    static constexpr unsigned FREQ_LAST_UPDATE_OFFSET = 128;
    static constexpr unsigned CAP_START_OFFSET        = 168;
    static constexpr unsigned LAST_FEE_UPDATE_OFFSET  = 208;
    static constexpr unsigned IN_CAP_OFFSET           = 248;

    static constexpr core::uint128 FREQ_MAX = core::max_for_bits(FREQ_BITS);
    static constexpr uint64_t TIMESTAMP_MAX = (uint64_t{1} << TIMESTAMP_BITS) - 1;

    core::uint128 freq = 0;
    uint32_t      base_fee_ppm = 0;
    uint64_t      freq_last_update = 0;
    uint64_t      cap_start = 0;
    uint64_t      last_fee_update = 0;
    bool          in_cap = false;

    bool operator==(const FeeState&) const = default;

    [[nodiscard]] core::uint256 pack() const;
    [[nodiscard]] static FeeState unpack(const core::uint256& word);

    /// The all-zero word.
    [[nodiscard]] static bool is_uninitialized(const core::uint256& word) {
        return word.is_zero();
    }

    /// Every field lies within its packed width.
    [[nodiscard]] bool fits() const noexcept;

    /// freq += increment, clamped at FREQ_MAX.
    void add_freq(core::uint128 increment) noexcept;

    /// Linear decay: freq loses elapsed/window of its value; a full window
    /// or more clears it.  A zero window clears it as well.
    void decay_freq(uint64_t elapsed, uint32_t window) noexcept;

    /// Clamp a timestamp into the 40-bit field.
    [[nodiscard]] static constexpr uint64_t clamp_timestamp(uint64_t t) noexcept {
        return t > TIMESTAMP_MAX ? TIMESTAMP_MAX : t;
    }

    void set_freq_last_update(uint64_t t) noexcept { freq_last_update = clamp_timestamp(t); }
    void set_cap_start(uint64_t t) noexcept { cap_start = clamp_timestamp(t); }
    void set_last_fee_update(uint64_t t) noexcept { last_fee_update = clamp_timestamp(t); }
};

} // namespace fee
