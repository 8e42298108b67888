#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "oracle/tick_cap.h"

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace oracle {

/// Hard ceiling on the ring size (16-bit index).
inline constexpr uint16_t MAX_CARDINALITY = 65535;

/// One recorded sample.  tick is the truncated tick; tick_cumulative is
/// the running sum of truncated tick x seconds since the first sample.
struct Observation {
    uint32_t timestamp = 0;
    int32_t  tick = 0;
    int64_t  tick_cumulative = 0;
    bool     initialized = false;

    bool operator==(const Observation&) const = default;
};

/// Ring position.  cardinality == 0 means the pool is not enabled.
struct ObservationState {
    uint16_t index = 0;
    uint16_t cardinality = 0;
    uint16_t cardinality_next = 0;

    bool operator==(const ObservationState&) const = default;
};

struct WriteResult {
    ObservationState state;
    int32_t truncated = 0;   ///< tick after capping
    bool    capped = false;  ///< the raw move exceeded the limit
    bool    recorded = false;///< false for a repeated or older timestamp
};

// ---------------------------------------------------------------------------
// ObservationBuffer -- truncated tick history of one pool
// ---------------------------------------------------------------------------
// A circular buffer in the style of the Uniswap v3 oracle: writes append at
// (index + 1) mod cardinality, the usable size grows to cardinality_next
// once the write position reaches the current end, and historical
// cumulative ticks are found by binary search between the oldest and the
// newest sample.
//
// Timestamps never go backwards: a write whose timestamp is not newer than
// the latest sample records nothing (it is still classified, so callers can
// observe a cap on the same second).
// ---------------------------------------------------------------------------
class ObservationBuffer {
public:
    ObservationBuffer() = default;

    [[nodiscard]] bool enabled() const noexcept { return state_.cardinality != 0; }
    [[nodiscard]] const ObservationState& state() const noexcept { return state_; }

    /// Seed slot 0.  ORACLE_ALREADY_ENABLED if already seeded.
    core::Result<ObservationState> initialize(uint32_t timestamp, int32_t tick);

    /// Classify @p tick against the reference tick for @p mode and append
    /// the truncated observation.  ORACLE_NOT_ENABLED before initialize().
    core::Result<WriteResult> write(uint32_t timestamp, int32_t tick,
                                    int32_t max_abs_move, CapMode mode,
                                    uint32_t block_duration);

    /// Raise cardinality_next to @p next.  Returns (old, new); a request
    /// that is not larger than the current value changes nothing.
    std::pair<uint16_t, uint16_t> grow(uint16_t next);

    /// The tick a write at @p timestamp would be compared against.
    ///  PER_STEP:  the latest recorded tick.
    ///  PER_BLOCK: the tick of the first observation recorded in the block
    ///             containing @p timestamp (timestamp / block_duration), or
    ///             the latest recorded tick when the block has none yet.
    [[nodiscard]] int32_t reference_tick(uint32_t timestamp, CapMode mode,
                                         uint32_t block_duration) const;

    /// Cumulative tick at now - seconds_ago.  ORACLE_STALE_LOOKBACK when
    /// the target predates the oldest retained sample.
    [[nodiscard]] core::Result<int64_t> observe_single(uint32_t now,
                                                       uint32_t seconds_ago) const;

    /// observe_single() for each entry; fails on the first failure.
    [[nodiscard]] core::Result<std::vector<int64_t>> observe(
        uint32_t now, std::span<const uint32_t> seconds_agos) const;

    /// Newest sample, nullopt before initialize().
    [[nodiscard]] std::optional<Observation> latest() const;

    /// Oldest retained sample, nullopt before initialize().
    [[nodiscard]] std::optional<Observation> oldest() const;

    /// Raw slot access for tests and tooling.
    [[nodiscard]] const Observation& at(uint16_t slot) const { return slots_.at(slot); }

private:
    /// Samples bracketing @p target (oldest.timestamp <= target <
    /// latest.timestamp).
    [[nodiscard]] std::pair<Observation, Observation> bracket(uint32_t target) const;

    std::vector<Observation> slots_;
    ObservationState state_;

    // First observation of the most recent block that received one.
    uint32_t block_start_timestamp_ = 0;
    int32_t  block_start_tick_ = 0;
};

} // namespace oracle
