// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fee/fee_math.h"
#include "fee/fee_state.h"

namespace fee {

uint64_t surge_fee_ppm(uint64_t now, uint64_t cap_start,
                       uint32_t decay_seconds, uint32_t base_fee_ppm,
                       uint32_t multiplier_ppm) noexcept {
    if (cap_start == 0 || decay_seconds == 0) return 0;

    const uint64_t elapsed = now > cap_start ? now - cap_start : 0;
    if (elapsed >= decay_seconds) return 0;

    const uint64_t max_surge =
        static_cast<uint64_t>(base_fee_ppm) * multiplier_ppm / PPM;
    const uint64_t remaining = decay_seconds - elapsed;
    return static_cast<uint64_t>(
        static_cast<core::uint128>(max_surge) * remaining / decay_seconds);
}

core::uint128 freq_increment(uint64_t freq_scaling_unit) noexcept {
    return core::sat_mul(freq_scaling_unit, PPM, FeeState::FREQ_MAX);
}

core::uint128 caps_per_day_ppm(core::uint128 freq, uint64_t freq_scaling_unit,
                               uint32_t window_seconds) noexcept {
    const core::uint128 denom =
        static_cast<core::uint128>(freq_scaling_unit) * window_seconds;
    if (denom == 0) return 0;
    return core::mul_div(freq, SECONDS_PER_DAY, denom);
}

int64_t deviation_ppm(core::uint128 caps_per_day_ppm,
                      uint32_t target_caps_per_day) noexcept {
    if (target_caps_per_day == 0) return 0;
    const core::uint128 ratio = caps_per_day_ppm / target_caps_per_day;
    const core::uint128 capped =
        ratio > static_cast<core::uint128>(INT64_MAX) ? INT64_MAX : ratio;
    return core::sat_to_int64(static_cast<core::int128>(capped) - PPM);
}

uint32_t step_base_fee(uint32_t base_fee_ppm, int64_t deviation_ppm,
                       uint32_t max_step_ppm, uint32_t min_fee_ppm,
                       uint32_t max_fee_ppm) noexcept {
    const core::int128 dev = deviation_ppm;
    const core::int128 magnitude = dev < 0 ? -dev : dev;
    if (magnitude < max_step_ppm) {
        return clamp_fee(base_fee_ppm, min_fee_ppm, max_fee_ppm);
    }

    const core::int128 base = base_fee_ppm;
    core::int128 step_cap = base * max_step_ppm / PPM;
    if (step_cap < 1) step_cap = 1;

    core::int128 step = base * dev / PPM;
    if (step > step_cap) step = step_cap;
    if (step < -step_cap) step = -step_cap;

    const core::int128 next = base + step;
    if (next <= 0) return clamp_fee(0, min_fee_ppm, max_fee_ppm);
    return clamp_fee(static_cast<uint64_t>(next), min_fee_ppm, max_fee_ppm);
}

} // namespace fee
