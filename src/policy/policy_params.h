#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "oracle/tick_cap.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace policy {

// ---------------------------------------------------------------------------
// Policy constants
// ---------------------------------------------------------------------------

/// 100% in parts-per-million.
inline constexpr uint32_t PPM = 1'000'000;

/// Upper bound accepted for max_base_fee_ppm (a 100% fee).
inline constexpr uint32_t MAX_BASE_FEE_LIMIT_PPM = PPM;

/// Upper bound accepted for surge_fee_multiplier_ppm (30x).
inline constexpr uint32_t MAX_SURGE_MULTIPLIER_PPM = 30 * PPM;

/// Largest meaningful tick move: the full tick range.
inline constexpr int32_t MAX_TICK_MOVE_LIMIT =
    oracle::MAX_TICK - oracle::MIN_TICK;

// ---------------------------------------------------------------------------
// PolicyParams -- numeric controller parameters for one pool
// ---------------------------------------------------------------------------
struct PolicyParams {
    /// Cap events per day the base-fee controller steers toward.
    uint32_t target_caps_per_day = 4;

    /// Window over which the cap-event frequency decays linearly to zero.
    uint32_t cap_budget_decay_window_seconds = 86'400;

    /// Fixed-point unit of the frequency accumulator.
    uint64_t freq_scaling_unit = 1'000'000'000'000'000'000ULL;

    uint32_t min_base_fee_ppm = 100;
    uint32_t max_base_fee_ppm = 50'000;

    /// Dead-band half-width and per-recompute step limit.
    uint32_t max_step_ppm = 30'000;

    /// Minimum spacing between base-fee recomputations.
    uint32_t base_fee_update_interval_seconds = 3'600;

    /// Time for the surge fee to ramp from its peak down to zero.
    uint32_t surge_decay_period_seconds = 3'600;

    /// Peak surge as a multiple of the base fee (3x).
    uint32_t surge_fee_multiplier_ppm = 3'000'000;

    /// Largest tick move recorded without truncation.
    int32_t max_abs_tick_move = 50;

    /// Initial base fee per tick of allowed movement.
    uint32_t base_fee_factor_ppm = 100;

    /// Initial base fee when the oracle has no capacity signal.
    uint32_t default_base_fee_ppm = 3'000;

    oracle::CapMode cap_mode = oracle::CapMode::PER_STEP;

    /// Length of the discrete time unit used by per-block capping.
    uint32_t block_duration_seconds = 12;

    bool operator==(const PolicyParams&) const = default;
};

/// Checks every documented bound; VALIDATION_RANGE naming the first
/// violated field.
[[nodiscard]] core::Result<void> validate_params(const PolicyParams& p);

// ---------------------------------------------------------------------------
// PolicyOverride -- a sparse set of field values
// ---------------------------------------------------------------------------
// Unset fields fall back to the layer below (pool override -> global
// default -> built-in default).
// ---------------------------------------------------------------------------
struct PolicyOverride {
    std::optional<uint32_t> target_caps_per_day;
    std::optional<uint32_t> cap_budget_decay_window_seconds;
    std::optional<uint64_t> freq_scaling_unit;
    std::optional<uint32_t> min_base_fee_ppm;
    std::optional<uint32_t> max_base_fee_ppm;
    std::optional<uint32_t> max_step_ppm;
    std::optional<uint32_t> base_fee_update_interval_seconds;
    std::optional<uint32_t> surge_decay_period_seconds;
    std::optional<uint32_t> surge_fee_multiplier_ppm;
    std::optional<int32_t>  max_abs_tick_move;
    std::optional<uint32_t> base_fee_factor_ppm;
    std::optional<uint32_t> default_base_fee_ppm;
    std::optional<oracle::CapMode> cap_mode;
    std::optional<uint32_t> block_duration_seconds;

    /// Copy of @p base with every set field replaced.
    [[nodiscard]] PolicyParams apply_to(const PolicyParams& base) const;

    /// Fields set in @p newer win over fields set here.
    void merge(const PolicyOverride& newer);

    [[nodiscard]] bool empty() const;
};

/// Set the field named by configuration key @p key (e.g. "minbasefee",
/// see core/config.h) from its textual value.  CONFIG_PARSE for an unknown
/// key or a value that does not parse or does not fit the field.
[[nodiscard]] core::Result<void> set_policy_field(PolicyOverride& ov,
                                                  std::string_view key,
                                                  std::string_view value);

/// True when @p key names a policy field.
[[nodiscard]] bool is_policy_key(std::string_view key);

/// One-line rendering for logs.
[[nodiscard]] std::string describe(const PolicyParams& p);

} // namespace policy
