// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "oracle/observations.h"
#include "core/arith.h"

#include <string>

namespace oracle {

core::Result<ObservationState> ObservationBuffer::initialize(uint32_t timestamp,
                                                             int32_t tick) {
    if (enabled()) {
        return core::make_error(core::ErrorCode::ORACLE_ALREADY_ENABLED,
                                "observation buffer already initialised");
    }
    slots_.assign(1, Observation{timestamp, tick, 0, true});
    state_ = ObservationState{0, 1, 1};
    block_start_timestamp_ = timestamp;
    block_start_tick_ = tick;
    return state_;
}

int32_t ObservationBuffer::reference_tick(uint32_t timestamp, CapMode mode,
                                          uint32_t block_duration) const {
    const int32_t last_tick = slots_.at(state_.index).tick;
    if (mode == CapMode::PER_STEP || block_duration == 0) {
        return last_tick;
    }
    if (block_start_timestamp_ / block_duration == timestamp / block_duration) {
        return block_start_tick_;
    }
    return last_tick;
}

core::Result<WriteResult> ObservationBuffer::write(uint32_t timestamp,
                                                   int32_t tick,
                                                   int32_t max_abs_move,
                                                   CapMode mode,
                                                   uint32_t block_duration) {
    if (!enabled()) {
        return core::make_error(core::ErrorCode::ORACLE_NOT_ENABLED,
                                "observation buffer not initialised");
    }

    const Observation& last = slots_[state_.index];
    const TickCapResult cap =
        classify(reference_tick(timestamp, mode, block_duration), tick,
                 max_abs_move);

    if (timestamp <= last.timestamp) {
        return WriteResult{state_, cap.truncated, cap.capped, false};
    }

    const uint32_t elapsed = timestamp - last.timestamp;
    const int64_t cumulative = core::sat_to_int64(
        static_cast<core::int128>(last.tick_cumulative) +
        static_cast<core::int128>(cap.truncated) * elapsed);

    // Grow into the next size once the write position reaches the end.
    uint16_t cardinality = state_.cardinality;
    if (state_.cardinality_next > cardinality &&
        state_.index == cardinality - 1) {
        cardinality = state_.cardinality_next;
    }
    const auto index = static_cast<uint16_t>((state_.index + 1) % cardinality);

    slots_[index] = Observation{timestamp, cap.truncated, cumulative, true};
    state_.index = index;
    state_.cardinality = cardinality;

    if (block_duration != 0 &&
        block_start_timestamp_ / block_duration != timestamp / block_duration) {
        block_start_timestamp_ = timestamp;
        block_start_tick_ = cap.truncated;
    }

    return WriteResult{state_, cap.truncated, cap.capped, true};
}

std::pair<uint16_t, uint16_t> ObservationBuffer::grow(uint16_t next) {
    const uint16_t current = state_.cardinality_next;
    if (!enabled() || next <= current) {
        return {current, current};
    }
    // New slots stay uninitialised until the ring wraps into them.
    slots_.resize(next);
    state_.cardinality_next = next;
    return {current, next};
}

std::optional<Observation> ObservationBuffer::latest() const {
    if (!enabled()) return std::nullopt;
    return slots_[state_.index];
}

std::optional<Observation> ObservationBuffer::oldest() const {
    if (!enabled()) return std::nullopt;
    const Observation& next = slots_[(state_.index + 1) % state_.cardinality];
    return next.initialized ? next : slots_[0];
}

std::pair<Observation, Observation> ObservationBuffer::bracket(
    uint32_t target) const {
    const uint32_t n = state_.cardinality;
    uint32_t lo = (state_.index + 1) % n;  // oldest
    uint32_t hi = lo + n - 1;              // newest

    for (;;) {
        const uint32_t mid = (lo + hi) / 2;
        const Observation& before = slots_[mid % n];

        // The ring is not full yet: slots past the newest are empty.
        if (!before.initialized) {
            lo = mid + 1;
            continue;
        }

        const Observation& after = slots_[(mid + 1) % n];
        const bool target_at_or_after = before.timestamp <= target;
        if (target_at_or_after && target <= after.timestamp) {
            return {before, after};
        }
        if (!target_at_or_after) {
            hi = mid - 1;
        } else {
            lo = mid + 1;
        }
    }
}

core::Result<int64_t> ObservationBuffer::observe_single(
    uint32_t now, uint32_t seconds_ago) const {
    if (!enabled()) {
        return core::make_error(core::ErrorCode::ORACLE_NOT_ENABLED,
                                "observation buffer not initialised");
    }
    if (seconds_ago > now) {
        return core::make_error(core::ErrorCode::ORACLE_STALE_LOOKBACK,
                                "lookback of " + std::to_string(seconds_ago) +
                                "s precedes the epoch");
    }
    const uint32_t target = now - seconds_ago;

    const Observation& newest = slots_[state_.index];
    if (target >= newest.timestamp) {
        // Extrapolate at the latest truncated tick.
        return core::sat_to_int64(
            static_cast<core::int128>(newest.tick_cumulative) +
            static_cast<core::int128>(newest.tick) * (target - newest.timestamp));
    }

    const Observation first = *oldest();
    if (target < first.timestamp) {
        return core::make_error(core::ErrorCode::ORACLE_STALE_LOOKBACK,
                                "target " + std::to_string(target) +
                                " older than oldest sample " +
                                std::to_string(first.timestamp));
    }
    if (target == first.timestamp) {
        return first.tick_cumulative;
    }

    const auto [before, after] = bracket(target);
    if (target == before.timestamp) return before.tick_cumulative;
    if (target == after.timestamp) return after.tick_cumulative;

    // Between two samples the truncated tick is constant (after.tick), so
    // the per-second slope divides exactly.
    const int64_t span = static_cast<int64_t>(after.timestamp - before.timestamp);
    const int64_t slope = (after.tick_cumulative - before.tick_cumulative) / span;
    return before.tick_cumulative +
           slope * static_cast<int64_t>(target - before.timestamp);
}

core::Result<std::vector<int64_t>> ObservationBuffer::observe(
    uint32_t now, std::span<const uint32_t> seconds_agos) const {
    std::vector<int64_t> out;
    out.reserve(seconds_agos.size());
    for (uint32_t ago : seconds_agos) {
        DYNFEE_TRY_ASSIGN(cumulative, observe_single(now, ago));
        out.push_back(cumulative);
    }
    return out;
}

} // namespace oracle
