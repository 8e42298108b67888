// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "oracle/trunc_oracle.h"
#include "core/logging.h"

#include <algorithm>
#include <string>

namespace oracle {

namespace {

core::Result<void> check_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                "tick " + std::to_string(tick) +
                                " outside the AMM tick range");
    }
    return core::make_ok();
}

} // namespace

TruncOracle::TruncOracle(const pool::Address& owner,
                         const policy::PolicyProvider& policy,
                         uint16_t sample_capacity)
    : policy_(policy),
      sample_capacity_(std::max<uint16_t>(sample_capacity, 1)),
      issuer_("oracle", owner) {}

core::Result<auth::Capability> TruncOracle::authorize_writer(
    const pool::Address& caller, const pool::Address& writer) {
    return issuer_.authorize(caller, writer);
}

core::Result<ObservationState> TruncOracle::enable_pool(
    const auth::Capability& cap, const pool::PoolId& pool,
    int32_t tick, uint32_t now) {
    DYNFEE_TRY_VOID(issuer_.verify(cap));
    DYNFEE_TRY_VOID(check_tick(tick));

    PoolOracle entry;
    DYNFEE_TRY_VOID(entry.buffer.initialize(now, tick));
    entry.buffer.grow(sample_capacity_);
    const ObservationState state = entry.buffer.state();

    if (!pools_.insert_if_absent(pool, std::move(entry))) {
        return core::make_error(core::ErrorCode::ORACLE_ALREADY_ENABLED,
                                "pool " + pool.to_short_hex() +
                                " already enabled");
    }
    LOG_INFO(core::LogCategory::ORACLE,
             "enabled pool " + pool.to_short_hex() + " at tick " +
             std::to_string(tick) + ", capacity " +
             std::to_string(state.cardinality_next));
    return state;
}

core::Result<WriteResult> TruncOracle::push_observation(
    const auth::Capability& cap, const pool::PoolId& pool,
    int32_t tick, uint32_t now) {
    DYNFEE_TRY_VOID(issuer_.verify(cap));
    DYNFEE_TRY_VOID(check_tick(tick));

    const policy::PolicyParams params = policy_.params(pool);
    auto res = pools_.modify(
        pool, core::ErrorCode::ORACLE_NOT_ENABLED,
        [&](PoolOracle& entry) {
            const int32_t limit =
                entry.pinned_max_ticks.value_or(params.max_abs_tick_move);
            return entry.buffer.write(now, tick, limit,
                                      params.cap_mode,
                                      params.block_duration_seconds);
        });
    if (res.ok() && res.value().capped) {
        LOG_DEBUG(core::LogCategory::ORACLE,
                  "pool " + pool.to_short_hex() + ": tick " +
                  std::to_string(tick) + " truncated to " +
                  std::to_string(res.value().truncated));
    }
    return res;
}

core::Result<std::pair<uint16_t, uint16_t>> TruncOracle::increase_cardinality_next(
    const pool::PoolId& pool, uint16_t next) {
    return pools_.modify(
        pool, core::ErrorCode::ORACLE_NOT_ENABLED,
        [&](PoolOracle& entry) -> core::Result<std::pair<uint16_t, uint16_t>> {
            return entry.buffer.grow(next);
        });
}

core::Result<std::vector<int64_t>> TruncOracle::observe(
    const pool::PoolId& pool, uint32_t now,
    std::span<const uint32_t> seconds_agos) const {
    std::optional<core::Result<std::vector<int64_t>>> out;
    pools_.read(pool, [&](const PoolOracle& entry) {
        out = entry.buffer.observe(now, seconds_agos);
    });
    if (!out) {
        return core::make_error(core::ErrorCode::ORACLE_NOT_ENABLED,
                                "pool " + pool.to_short_hex() + " not enabled");
    }
    return std::move(*out);
}

core::Result<Observation> TruncOracle::latest_observation(
    const pool::PoolId& pool) const {
    std::optional<Observation> latest;
    pools_.read(pool, [&](const PoolOracle& entry) {
        latest = entry.buffer.latest();
    });
    if (!latest) {
        return core::make_error(core::ErrorCode::ORACLE_NOT_ENABLED,
                                "pool " + pool.to_short_hex() + " not enabled");
    }
    return *latest;
}

ObservationState TruncOracle::observation_state(const pool::PoolId& pool) const {
    ObservationState state;
    pools_.read(pool, [&](const PoolOracle& entry) {
        state = entry.buffer.state();
    });
    return state;
}

bool TruncOracle::is_enabled(const pool::PoolId& pool) const {
    return pools_.contains(pool);
}

std::optional<int32_t> TruncOracle::max_ticks_per_block(
    const pool::PoolId& pool) const {
    std::optional<int32_t> value;
    pools_.read(pool, [&](const PoolOracle& entry) {
        value = effective_limit(pool, entry);
    });
    return value;
}

core::Result<void> TruncOracle::set_max_ticks_per_block(
    const pool::Address& caller, const pool::PoolId& pool, int32_t value) {
    DYNFEE_TRY_VOID(issuer_.require_owner(caller));
    if (value < 0 || value > policy::MAX_TICK_MOVE_LIMIT) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                "max ticks per block " +
                                std::to_string(value) + " out of range");
    }
    DYNFEE_TRY_VOID(pools_.modify(
        pool, core::ErrorCode::ORACLE_NOT_ENABLED,
        [&](PoolOracle& entry) -> core::Result<void> {
            entry.pinned_max_ticks = value;
            return core::make_ok();
        }));
    LOG_INFO(core::LogCategory::ORACLE,
             "pool " + pool.to_short_hex() + ": max ticks per block " +
             std::to_string(value));
    return core::make_ok();
}

int32_t TruncOracle::effective_limit(const pool::PoolId& pool,
                                     const PoolOracle& entry) const {
    if (entry.pinned_max_ticks) return *entry.pinned_max_ticks;
    return policy_.max_abs_tick_move(pool);
}

} // namespace oracle
