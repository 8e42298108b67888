#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <string_view>

namespace oracle {

/// Tick bounds of a concentrated-liquidity AMM (int24 price grid).
inline constexpr int32_t MIN_TICK = -887272;
inline constexpr int32_t MAX_TICK = 887272;

/// Which recorded tick a new observation is compared against.
enum class CapMode : uint8_t {
    PER_STEP  = 0,  ///< the immediately preceding observation
    PER_BLOCK = 1,  ///< the tick in force at the start of the current block
};

[[nodiscard]] std::string_view cap_mode_name(CapMode mode) noexcept;

/// Accepts "step" / "per-step" and "block" / "per-block".
[[nodiscard]] std::optional<CapMode> parse_cap_mode(std::string_view name);

struct TickCapResult {
    int32_t truncated = 0;
    bool    capped = false;

    bool operator==(const TickCapResult&) const = default;
};

/// Clamp the move from @p previous to @p current to at most
/// @p max_abs_move ticks.  capped is true when |current - previous|
/// exceeds the limit; the truncated tick then sits exactly max_abs_move
/// ticks from @p previous in the direction of the move.  A negative limit
/// behaves as 0.
[[nodiscard]] TickCapResult classify(int32_t previous, int32_t current,
                                     int32_t max_abs_move) noexcept;

} // namespace oracle
