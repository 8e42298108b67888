// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sim/scenario.h"
#include "core/logging.h"
#include "core/random.h"
#include "core/time.h"
#include "fee/fee_manager.h"
#include "hook/fee_tracker.h"
#include "hook/spot_hook.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace sim {

namespace {

const pool::Address OWNER = pool::Address::from_hex("0xd0f0");
const pool::Address HOOK  = pool::Address::from_hex("0x4000000000000000000000000000000000000080");

/// Restores the mock clock on every exit path.
class MockTimeGuard {
public:
    MockTimeGuard() : saved_(core::MockableClock::get_mock_time()) {}
    ~MockTimeGuard() { core::MockableClock::set_mock_time(saved_); }

    MockTimeGuard(const MockTimeGuard&) = delete;
    MockTimeGuard& operator=(const MockTimeGuard&) = delete;

private:
    int64_t saved_;
};

int32_t next_tick(int32_t tick, int32_t cap, Market market,
                  core::InsecureRandom& rng) {
    const int64_t limit = std::max<int32_t>(cap, 1);
    int64_t move = 0;
    if (market == Market::VOLATILE && rng.range(4) == 0) {
        move = rng.uniform(3 * limit, 6 * limit);
        if (rng.range(2) == 0) move = -move;
    } else {
        move = rng.uniform(-limit / 2, limit / 2);
    }
    return static_cast<int32_t>(std::clamp<int64_t>(
        tick + move, oracle::MIN_TICK, oracle::MAX_TICK));
}

} // namespace

// ---------------------------------------------------------------------------
// ScriptedTickSource
// ---------------------------------------------------------------------------

void ScriptedTickSource::set_tick(const pool::PoolId& pool, int32_t tick) {
    LOCK(mutex_);
    ticks_[pool] = tick;
}

core::Result<int32_t> ScriptedTickSource::current_tick(
    const pool::PoolId& pool) const {
    LOCK(mutex_);
    auto it = ticks_.find(pool);
    if (it == ticks_.end()) {
        return core::make_error(core::ErrorCode::ORACLE_ERROR,
                                "no tick scripted for pool " +
                                pool.to_short_hex());
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// Market helpers
// ---------------------------------------------------------------------------

std::string_view market_name(Market m) noexcept {
    switch (m) {
        case Market::CALM:     return "calm";
        case Market::VOLATILE: return "volatile";
    }
    return "unknown";
}

std::optional<Market> parse_market(std::string_view name) {
    if (name == "calm") return Market::CALM;
    if (name == "volatile") return Market::VOLATILE;
    return std::nullopt;
}

pool::PoolKey scenario_pool_key() {
    return pool::make_pool_key(pool::Address::from_hex("0x0a"),
                               pool::Address::from_hex("0x0b"),
                               60, HOOK);
}

// ---------------------------------------------------------------------------
// run_scenario
// ---------------------------------------------------------------------------

core::Result<void> validate_scenario(const ScenarioConfig& cfg) {
    if (cfg.interval_seconds == 0) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                "scenario interval must be positive");
    }
    constexpr uint64_t clock_max = std::numeric_limits<uint32_t>::max();
    // Mock time 0 would fall back to the real clock.
    if (cfg.start_time <= 0 || static_cast<uint64_t>(cfg.start_time) > clock_max) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                "scenario start time " +
                                std::to_string(cfg.start_time) +
                                " outside [1, 2^32-1]");
    }
    const uint64_t span = static_cast<uint64_t>(cfg.steps) * cfg.interval_seconds;
    if (span > clock_max - static_cast<uint64_t>(cfg.start_time)) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                "scenario of " + std::to_string(cfg.steps) +
                                " steps every " +
                                std::to_string(cfg.interval_seconds) +
                                "s runs past the 32-bit clock");
    }
    return core::make_ok();
}

core::Result<ScenarioResult> run_scenario(const ScenarioConfig& cfg,
                                          const policy::PolicyProvider& policy) {
    DYNFEE_TRY_VOID(validate_scenario(cfg));

    MockTimeGuard clock_guard;
    core::MockableClock::set_mock_time(cfg.start_time);

    oracle::TruncOracle oracle(OWNER, policy, cfg.sample_capacity);
    fee::DynamicFeeManager fees(OWNER, policy, oracle);

    DYNFEE_TRY_ASSIGN(oracle_cap, oracle.authorize_writer(OWNER, HOOK));
    DYNFEE_TRY_ASSIGN(fee_cap, fees.authorize_writer(OWNER, HOOK));

    ScriptedTickSource ticks;
    hook::SpotHook spot(HOOK, oracle, fees, ticks, oracle_cap, fee_cap);

    const pool::PoolKey key = scenario_pool_key();
    ScenarioResult result;
    result.pool = key.to_id();

    hook::FeeTracker tracker(fees.notifier(), result.pool);

    int32_t tick = cfg.start_tick;
    ticks.set_tick(result.pool, tick);
    DYNFEE_TRY_VOID(spot.after_initialize(key, tick));
    DYNFEE_TRY_ASSIGN(initial, fees.state(result.pool));
    result.initial_base_fee_ppm = initial.base_fee_ppm;

    LOG_INFO(core::LogCategory::SIM,
             std::string("scenario ") + std::string(market_name(cfg.market)) +
             ": " + std::to_string(cfg.steps) + " steps every " +
             std::to_string(cfg.interval_seconds) + "s, pool " +
             result.pool.to_hex());

    core::InsecureRandom rng(cfg.seed);
    result.trace.reserve(cfg.steps);

    for (uint32_t step = 1; step <= cfg.steps; ++step) {
        core::MockableClock::advance(cfg.interval_seconds);

        const int32_t cap = oracle.max_ticks_per_block(result.pool).value_or(0);
        tick = next_tick(tick, cap, cfg.market, rng);
        ticks.set_tick(result.pool, tick);

        DYNFEE_TRY_ASSIGN(update, spot.after_swap(key));
        DYNFEE_TRY_ASSIGN(latest, oracle.latest_observation(result.pool));

        TracePoint point;
        point.step = step;
        point.timestamp = update.state.freq_last_update;
        point.tick = tick;
        point.recorded_tick = latest.tick;
        point.capped = update.was_capped;
        point.base_fee_ppm = update.quote.base_fee_ppm;
        point.surge_fee_ppm = update.quote.surge_fee_ppm;
        point.total_fee_ppm = update.quote.total();
        point.in_cap = update.state.in_cap;
        if (point.capped) ++result.capped_steps;
        result.trace.push_back(point);
    }

    result.cap_starts = tracker.cap_starts();
    result.cap_ends = tracker.cap_ends();

    LOG_INFO(core::LogCategory::SIM,
             "scenario done: " + std::to_string(result.capped_steps) +
             " capped steps, " + std::to_string(result.cap_starts) +
             " cap starts, " + std::to_string(result.cap_ends) +
             " cap ends, final base fee " +
             std::to_string(result.trace.empty()
                                ? result.initial_base_fee_ppm
                                : result.trace.back().base_fee_ppm) +
             " ppm");
    return result;
}

} // namespace sim
