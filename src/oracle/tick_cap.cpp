// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "oracle/tick_cap.h"

namespace oracle {

std::string_view cap_mode_name(CapMode mode) noexcept {
    switch (mode) {
        case CapMode::PER_STEP:  return "step";
        case CapMode::PER_BLOCK: return "block";
    }
    return "unknown";
}

std::optional<CapMode> parse_cap_mode(std::string_view name) {
    if (name == "step" || name == "per-step")   return CapMode::PER_STEP;
    if (name == "block" || name == "per-block") return CapMode::PER_BLOCK;
    return std::nullopt;
}

TickCapResult classify(int32_t previous, int32_t current,
                       int32_t max_abs_move) noexcept {
    const int64_t limit = max_abs_move < 0 ? 0 : max_abs_move;
    // 64-bit so that extreme int32 ticks cannot overflow the difference.
    const int64_t delta = static_cast<int64_t>(current) - previous;
    const int64_t magnitude = delta < 0 ? -delta : delta;

    if (magnitude <= limit) {
        return {current, false};
    }
    const int64_t moved = delta > 0 ? previous + limit : previous - limit;
    return {static_cast<int32_t>(moved), true};
}

} // namespace oracle
