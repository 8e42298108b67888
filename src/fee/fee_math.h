#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/arith.h"

#include <cstdint>

namespace fee {

inline constexpr uint32_t PPM = 1'000'000;
inline constexpr uint32_t SECONDS_PER_DAY = 86'400;

/// Surge premium at @p now for a cap event that began at @p cap_start.
/// Peaks at base * multiplier / 1e6 when now == cap_start and ramps down
/// linearly to exactly 0 at cap_start + decay_seconds.  Zero when no event
/// is recorded (cap_start == 0) or decay_seconds == 0.  A @p now earlier
/// than @p cap_start counts as zero elapsed time.
[[nodiscard]] uint64_t surge_fee_ppm(uint64_t now, uint64_t cap_start,
                                     uint32_t decay_seconds,
                                     uint32_t base_fee_ppm,
                                     uint32_t multiplier_ppm) noexcept;

/// Frequency added per cap event: unit * 1e6, clamped to the 96-bit field.
[[nodiscard]] core::uint128 freq_increment(uint64_t freq_scaling_unit) noexcept;

/// Estimated cap events per day, in ppm (1e6 == one event per day):
/// freq * 86400 / (unit * window).
[[nodiscard]] core::uint128 caps_per_day_ppm(core::uint128 freq,
                                             uint64_t freq_scaling_unit,
                                             uint32_t window_seconds) noexcept;

/// (caps_per_day / target - 1) * 1e6, saturated to int64.
[[nodiscard]] int64_t deviation_ppm(core::uint128 caps_per_day_ppm,
                                    uint32_t target_caps_per_day) noexcept;

/// One rate-limited proportional step.  Inside the dead-band
/// (|deviation| < max_step) the fee is kept; otherwise it moves by
/// base * deviation / 1e6, limited to +/- max(1, base * max_step / 1e6).
/// The result is always clamped to [min_fee, max_fee].
[[nodiscard]] uint32_t step_base_fee(uint32_t base_fee_ppm,
                                     int64_t deviation_ppm,
                                     uint32_t max_step_ppm,
                                     uint32_t min_fee_ppm,
                                     uint32_t max_fee_ppm) noexcept;

/// Clamp @p fee into [lo, hi] (lo <= hi).
[[nodiscard]] constexpr uint32_t clamp_fee(uint64_t fee, uint32_t lo,
                                           uint32_t hi) noexcept {
    if (fee < lo) return lo;
    if (fee > hi) return hi;
    return static_cast<uint32_t>(fee);
}

} // namespace fee
