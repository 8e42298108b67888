#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/sync.h"
#include "hook/tick_source.h"
#include "oracle/trunc_oracle.h"
#include "policy/policy_manager.h"
#include "pool/pool_key.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sim {

/// Tick source driven by the simulator.
class ScriptedTickSource final : public hook::TickSource {
public:
    void set_tick(const pool::PoolId& pool, int32_t tick);

    [[nodiscard]] core::Result<int32_t> current_tick(
        const pool::PoolId& pool) const override;

private:
    mutable core::Mutex mutex_{"scripted_tick_source"};
    std::unordered_map<pool::PoolId, int32_t> ticks_;
};

enum class Market {
    CALM,      ///< every move stays within the tick cap
    VOLATILE,  ///< frequent jumps far beyond the tick cap
};

[[nodiscard]] std::string_view market_name(Market m) noexcept;
[[nodiscard]] std::optional<Market> parse_market(std::string_view name);

struct ScenarioConfig {
    Market   market = Market::CALM;
    uint32_t steps = 200;
    uint32_t interval_seconds = 60;
    uint64_t seed = 1;
    int64_t  start_time = 1'700'000'000;
    int32_t  start_tick = 0;
    uint16_t sample_capacity = oracle::DEFAULT_SAMPLE_CAPACITY;
};

struct TracePoint {
    uint32_t step = 0;
    uint64_t timestamp = 0;
    int32_t  tick = 0;           ///< tick reported by the AMM
    int32_t  recorded_tick = 0;  ///< tick after truncation
    bool     capped = false;
    uint32_t base_fee_ppm = 0;
    uint64_t surge_fee_ppm = 0;
    uint64_t total_fee_ppm = 0;
    bool     in_cap = false;
};

struct ScenarioResult {
    pool::PoolId pool;
    uint32_t initial_base_fee_ppm = 0;
    std::vector<TracePoint> trace;
    std::size_t capped_steps = 0;
    std::size_t cap_starts = 0;
    std::size_t cap_ends = 0;
};

/// The pool every scenario trades in.
[[nodiscard]] pool::PoolKey scenario_pool_key();

/// VALIDATION_RANGE unless the interval is positive and every step's
/// timestamp, start_time + steps * interval_seconds, fits the 32-bit
/// clock the hook reads.
[[nodiscard]] core::Result<void> validate_scenario(const ScenarioConfig& cfg);

/// Drive one pool through @p cfg.steps swaps spaced @p cfg.interval_seconds
/// apart, reading parameters from @p policy.  Sets core::MockableClock for
/// the run and restores the previous mock time afterwards.
[[nodiscard]] core::Result<ScenarioResult> run_scenario(
    const ScenarioConfig& cfg, const policy::PolicyProvider& policy);

} // namespace sim
