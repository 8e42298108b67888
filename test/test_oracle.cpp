// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the truncated tick oracle.

#include "test_framework.h"

#include "oracle/observations.h"
#include "oracle/tick_cap.h"
#include "oracle/trunc_oracle.h"
#include "policy/policy_manager.h"

#include <array>
#include <cstdint>
#include <limits>
#include <vector>

using oracle::CapMode;

namespace {

const pool::Address OWNER = pool::Address::from_hex("0x01");
const pool::Address HOOK  = pool::Address::from_hex("0x80");
const pool::PoolId  POOL  = pool::PoolId::from_hex("0xabcd");

oracle::ObservationBuffer seeded(uint32_t ts, int32_t tick, uint16_t capacity = 1) {
    oracle::ObservationBuffer buf;
    (void)buf.initialize(ts, tick);
    buf.grow(capacity);
    return buf;
}

} // namespace

// ============================================================================
// TickCap -- classify
// ============================================================================

TEST_CASE(TickCap, move_within_limit_passes) {
    CHECK(oracle::classify(0, 50, 50) == (oracle::TickCapResult{50, false}));
    CHECK(oracle::classify(0, -50, 50) == (oracle::TickCapResult{-50, false}));
    CHECK(oracle::classify(7, 7, 0) == (oracle::TickCapResult{7, false}));
}

TEST_CASE(TickCap, move_beyond_limit_truncates) {
    CHECK(oracle::classify(0, 100, 50) == (oracle::TickCapResult{50, true}));
    CHECK(oracle::classify(0, -100, 50) == (oracle::TickCapResult{-50, true}));
    CHECK(oracle::classify(-20, 100, 10) == (oracle::TickCapResult{-10, true}));
}

TEST_CASE(TickCap, zero_limit_pins_previous_tick) {
    CHECK(oracle::classify(10, 11, 0) == (oracle::TickCapResult{10, true}));
    CHECK(oracle::classify(10, 9, -5) == (oracle::TickCapResult{10, true}));
}

TEST_CASE(TickCap, extreme_ticks_do_not_overflow) {
    const int32_t lo = std::numeric_limits<int32_t>::min();
    const int32_t hi = std::numeric_limits<int32_t>::max();
    CHECK(oracle::classify(lo, hi, 5) == (oracle::TickCapResult{lo + 5, true}));
    CHECK(oracle::classify(hi, lo, 5) == (oracle::TickCapResult{hi - 5, true}));
}

TEST_CASE(TickCap, parse_cap_mode_names) {
    CHECK(oracle::parse_cap_mode("step") == CapMode::PER_STEP);
    CHECK(oracle::parse_cap_mode("per-block") == CapMode::PER_BLOCK);
    CHECK(!oracle::parse_cap_mode("sometimes").has_value());
}

// ============================================================================
// Observations -- write / grow
// ============================================================================

TEST_CASE(Observations, write_before_initialize_fails) {
    oracle::ObservationBuffer buf;
    CHECK(!buf.enabled());
    CHECK_ERR_CODE(buf.write(10, 0, 50, CapMode::PER_STEP, 12),
                   core::ErrorCode::ORACLE_NOT_ENABLED);
    CHECK(!buf.latest().has_value());
}

TEST_CASE(Observations, initialize_twice_fails) {
    oracle::ObservationBuffer buf;
    auto st = buf.initialize(100, 5);
    CHECK_OK(st);
    CHECK(st.value() == (oracle::ObservationState{0, 1, 1}));
    CHECK_ERR_CODE(buf.initialize(200, 6), core::ErrorCode::ORACLE_ALREADY_ENABLED);
    CHECK_EQ(buf.latest()->timestamp, uint32_t{100});
}

TEST_CASE(Observations, cumulative_uses_truncated_tick) {
    auto buf = seeded(100, 0, 4);
    auto w1 = buf.write(110, 20, 50, CapMode::PER_STEP, 12).value();
    CHECK(w1.recorded);
    CHECK(!w1.capped);
    CHECK_EQ(buf.latest()->tick_cumulative, int64_t{200});

    auto w2 = buf.write(120, 200, 50, CapMode::PER_STEP, 12).value();
    CHECK(w2.capped);
    CHECK_EQ(w2.truncated, 70);
    CHECK_EQ(buf.latest()->tick, 70);
    CHECK_EQ(buf.latest()->tick_cumulative, int64_t{200 + 70 * 10});
}

TEST_CASE(Observations, same_timestamp_records_nothing) {
    auto buf = seeded(100, 0, 4);
    CHECK_OK(buf.write(110, 10, 50, CapMode::PER_STEP, 12));
    const auto before = buf.state();

    auto again = buf.write(110, 500, 50, CapMode::PER_STEP, 12).value();
    CHECK(!again.recorded);
    CHECK(again.capped);          // still classified
    CHECK_EQ(again.truncated, 60);
    CHECK(buf.state() == before);
    CHECK_EQ(buf.latest()->tick, 10);

    auto older = buf.write(105, 10, 50, CapMode::PER_STEP, 12).value();
    CHECK(!older.recorded);
    CHECK(buf.state() == before);
}

TEST_CASE(Observations, grow_is_monotonic) {
    auto buf = seeded(100, 0);
    auto g1 = buf.grow(5);
    CHECK_EQ(g1.first, uint16_t{1});
    CHECK_EQ(g1.second, uint16_t{5});
    auto g2 = buf.grow(3);
    CHECK_EQ(g2.first, uint16_t{5});
    CHECK_EQ(g2.second, uint16_t{5});
    CHECK_EQ(buf.state().cardinality, uint16_t{1});

    oracle::ObservationBuffer disabled;
    auto g3 = disabled.grow(10);
    CHECK_EQ(g3.second, uint16_t{0});
}

TEST_CASE(Observations, cardinality_fills_then_wraps) {
    auto buf = seeded(100, 0, 3);
    auto s1 = buf.write(110, 1, 50, CapMode::PER_STEP, 12).value().state;
    CHECK(s1 == (oracle::ObservationState{1, 3, 3}));
    auto s2 = buf.write(120, 2, 50, CapMode::PER_STEP, 12).value().state;
    CHECK(s2 == (oracle::ObservationState{2, 3, 3}));
    auto s3 = buf.write(130, 3, 50, CapMode::PER_STEP, 12).value().state;
    CHECK(s3 == (oracle::ObservationState{0, 3, 3}));
    CHECK_EQ(buf.at(0).timestamp, uint32_t{130});
    CHECK_EQ(buf.oldest()->timestamp, uint32_t{110});
}

// ============================================================================
// Observations -- per-block reference tick
// ============================================================================

TEST_CASE(Observations, per_block_compares_against_block_start) {
    // 12 s blocks; t=120 opens block 10.
    auto block = seeded(120, 0, 8);
    auto step = seeded(120, 0, 8);

    CHECK(!block.write(121, 40, 50, CapMode::PER_BLOCK, 12).value().capped);
    CHECK(!step.write(121, 40, 50, CapMode::PER_STEP, 12).value().capped);

    // Same block: per-block still measures from the block's first tick (0).
    auto b = block.write(122, 80, 50, CapMode::PER_BLOCK, 12).value();
    CHECK(b.capped);
    CHECK_EQ(b.truncated, 50);
    auto s = step.write(122, 80, 50, CapMode::PER_STEP, 12).value();
    CHECK(!s.capped);
    CHECK_EQ(s.truncated, 80);
}

TEST_CASE(Observations, first_write_of_new_block_uses_latest_tick) {
    auto buf = seeded(120, 0, 8);
    CHECK_OK(buf.write(121, 40, 50, CapMode::PER_BLOCK, 12));
    CHECK_OK(buf.write(122, 80, 50, CapMode::PER_BLOCK, 12));  // recorded 50

    // t=132 opens block 11, which has no observation yet: reference is the
    // latest recorded tick (50), and this write becomes the block start.
    CHECK_EQ(buf.reference_tick(132, CapMode::PER_BLOCK, 12), 50);
    auto w = buf.write(132, 120, 50, CapMode::PER_BLOCK, 12).value();
    CHECK(w.capped);
    CHECK_EQ(w.truncated, 100);

    CHECK_EQ(buf.reference_tick(133, CapMode::PER_BLOCK, 12), 100);
    CHECK(!buf.write(133, 140, 50, CapMode::PER_BLOCK, 12).value().capped);
    CHECK_EQ(buf.reference_tick(134, CapMode::PER_BLOCK, 12), 100);
    CHECK_EQ(buf.reference_tick(134, CapMode::PER_STEP, 12), 140);
}

// ============================================================================
// Observations -- observe
// ============================================================================

TEST_CASE(Observations, observe_interpolates_and_extrapolates) {
    auto buf = seeded(100, 0, 8);
    CHECK_OK(buf.write(110, 20, 50, CapMode::PER_STEP, 12));  // cum 200
    CHECK_OK(buf.write(130, 40, 50, CapMode::PER_STEP, 12));  // cum 1000

    const std::array<uint32_t, 5> agos{0, 10, 20, 25, 30};
    auto res = buf.observe(130, agos);
    CHECK_OK(res);
    CHECK(res.value() == (std::vector<int64_t>{1000, 600, 200, 100, 0}));

    const std::array<uint32_t, 1> now_only{0};
    CHECK(buf.observe(140, now_only).value() == (std::vector<int64_t>{1400}));
}

TEST_CASE(Observations, lookback_before_oldest_is_stale) {
    auto buf = seeded(100, 0, 8);
    CHECK_OK(buf.write(110, 20, 50, CapMode::PER_STEP, 12));
    CHECK_ERR_CODE(buf.observe_single(130, 31), core::ErrorCode::ORACLE_STALE_LOOKBACK);
    CHECK_ERR_CODE(buf.observe_single(10, 11), core::ErrorCode::ORACLE_STALE_LOOKBACK);

    const std::array<uint32_t, 2> agos{0, 500};
    CHECK_ERR_CODE(buf.observe(130, agos), core::ErrorCode::ORACLE_STALE_LOOKBACK);
}

TEST_CASE(Observations, stale_after_ring_overwrites) {
    auto buf = seeded(100, 0, 3);
    for (uint32_t t = 110; t <= 140; t += 10) {
        CHECK_OK(buf.write(t, 1, 50, CapMode::PER_STEP, 12));
    }
    // Retained: 120, 130, 140.
    CHECK_EQ(buf.oldest()->timestamp, uint32_t{120});
    CHECK_OK(buf.observe_single(140, 20));
    CHECK_ERR_CODE(buf.observe_single(140, 21), core::ErrorCode::ORACLE_STALE_LOOKBACK);
    CHECK_EQ(buf.observe_single(140, 15).value(),
             buf.observe_single(140, 20).value() + 5);
}

TEST_CASE(Observations, binary_search_over_full_ring) {
    auto buf = seeded(1000, 0, 16);
    int32_t tick = 0;
    for (uint32_t i = 1; i <= 40; ++i) {
        tick += (i % 3 == 0) ? -7 : 5;
        CHECK_OK(buf.write(1000 + i * 10, tick, 50, CapMode::PER_STEP, 12));
    }
    const uint32_t now = 1400;
    // Every 10 s boundary inside the retained window matches the sample.
    for (uint32_t ago = 0; ago < 150; ago += 10) {
        auto cum = buf.observe_single(now, ago);
        CHECK_OK(cum);
    }
    // 1345 lies between the samples at 1340 and 1350.
    auto mid = buf.observe_single(now, 55).value();
    auto after = buf.observe_single(now, 50).value();
    auto before = buf.observe_single(now, 60).value();
    CHECK_EQ(mid - before, (after - before) / 2);
}

// ============================================================================
// TruncOracle
// ============================================================================

TEST_CASE(TruncOracle, enable_requires_capability) {
    policy::PolicyManager policy;
    oracle::TruncOracle oracle(OWNER, policy);

    auth::Capability forged{HOOK, core::uint256::from_hex("0x1234")};
    CHECK_ERR_CODE(oracle.enable_pool(forged, POOL, 0, 100),
                   core::ErrorCode::AUTH_UNAUTHORIZED);
    CHECK_ERR_CODE(oracle.authorize_writer(HOOK, HOOK),
                   core::ErrorCode::AUTH_UNAUTHORIZED);

    auto cap = oracle.authorize_writer(OWNER, HOOK).value();
    auto st = oracle.enable_pool(cap, POOL, 0, 100);
    CHECK_OK(st);
    CHECK_EQ(st.value().cardinality, uint16_t{1});
    CHECK_EQ(st.value().cardinality_next, oracle::DEFAULT_SAMPLE_CAPACITY);
    CHECK(oracle.is_enabled(POOL));
    CHECK_ERR_CODE(oracle.enable_pool(cap, POOL, 0, 100),
                   core::ErrorCode::ORACLE_ALREADY_ENABLED);
}

TEST_CASE(TruncOracle, push_uses_policy_tick_limit) {
    policy::PolicyManager policy;
    policy::PolicyOverride ov;
    ov.max_abs_tick_move = 10;
    CHECK_OK(policy.set_override(POOL, ov));

    oracle::TruncOracle oracle(OWNER, policy);
    auto cap = oracle.authorize_writer(OWNER, HOOK).value();
    CHECK_ERR_CODE(oracle.push_observation(cap, POOL, 5, 110),
                   core::ErrorCode::ORACLE_NOT_ENABLED);

    CHECK_OK(oracle.enable_pool(cap, POOL, 0, 100));
    CHECK(oracle.max_ticks_per_block(POOL) == 10);

    auto w = oracle.push_observation(cap, POOL, 25, 110);
    CHECK_OK(w);
    CHECK(w.value().capped);
    CHECK_EQ(w.value().truncated, 10);
    CHECK_EQ(oracle.latest_observation(POOL).value().tick, 10);

    CHECK_ERR_CODE(oracle.push_observation(cap, POOL, oracle::MAX_TICK + 1, 120),
                   core::ErrorCode::VALIDATION_RANGE);
}

TEST_CASE(TruncOracle, failed_write_leaves_state) {
    policy::PolicyManager policy;
    oracle::TruncOracle oracle(OWNER, policy);
    auto cap = oracle.authorize_writer(OWNER, HOOK).value();
    CHECK_OK(oracle.enable_pool(cap, POOL, 0, 100));
    CHECK_OK(oracle.push_observation(cap, POOL, 5, 110));
    const auto before = oracle.observation_state(POOL);

    // Rotate the writer: the old capability no longer writes.
    auto cap2 = oracle.authorize_writer(OWNER, HOOK).value();
    CHECK_ERR_CODE(oracle.push_observation(cap, POOL, 6, 120),
                   core::ErrorCode::AUTH_UNAUTHORIZED);
    CHECK(oracle.observation_state(POOL) == before);
    CHECK_OK(oracle.push_observation(cap2, POOL, 6, 120));
}

TEST_CASE(TruncOracle, reads_on_unknown_pool) {
    policy::PolicyManager policy;
    oracle::TruncOracle oracle(OWNER, policy);
    CHECK(oracle.observation_state(POOL) == oracle::ObservationState{});
    CHECK(!oracle.max_ticks_per_block(POOL).has_value());
    CHECK_ERR_CODE(oracle.latest_observation(POOL), core::ErrorCode::ORACLE_NOT_ENABLED);
    const std::array<uint32_t, 1> agos{0};
    CHECK_ERR_CODE(oracle.observe(POOL, 100, agos), core::ErrorCode::ORACLE_NOT_ENABLED);
    CHECK_ERR_CODE(oracle.increase_cardinality_next(POOL, 50),
                   core::ErrorCode::ORACLE_NOT_ENABLED);
}

TEST_CASE(TruncOracle, cardinality_and_tick_limit_admin) {
    policy::PolicyManager policy;
    oracle::TruncOracle oracle(OWNER, policy, 4);
    auto cap = oracle.authorize_writer(OWNER, HOOK).value();
    CHECK_OK(oracle.enable_pool(cap, POOL, 0, 100));

    auto grown = oracle.increase_cardinality_next(POOL, 10).value();
    CHECK_EQ(grown.first, uint16_t{4});
    CHECK_EQ(grown.second, uint16_t{10});

    CHECK_ERR_CODE(oracle.set_max_ticks_per_block(HOOK, POOL, 5),
                   core::ErrorCode::AUTH_UNAUTHORIZED);
    CHECK_ERR_CODE(oracle.set_max_ticks_per_block(OWNER, POOL, -1),
                   core::ErrorCode::VALIDATION_RANGE);
    CHECK_OK(oracle.set_max_ticks_per_block(OWNER, POOL, 5));
    CHECK(oracle.max_ticks_per_block(POOL) == 5);
    CHECK(oracle.push_observation(cap, POOL, 6, 110).value().capped);
}

TEST_CASE(TruncOracle, tick_limit_follows_policy_changes) {
    policy::PolicyManager policy;
    oracle::TruncOracle oracle(OWNER, policy);
    auto cap = oracle.authorize_writer(OWNER, HOOK).value();
    CHECK_OK(oracle.enable_pool(cap, POOL, 0, 100));
    CHECK(oracle.max_ticks_per_block(POOL) == policy::PolicyParams{}.max_abs_tick_move);

    // Tightened after the pool was enabled.
    policy::PolicyOverride ov;
    ov.max_abs_tick_move = 10;
    CHECK_OK(policy.set_override(POOL, ov));
    CHECK(oracle.max_ticks_per_block(POOL) == 10);

    auto w = oracle.push_observation(cap, POOL, 25, 110);
    CHECK_OK(w);
    CHECK(w.value().capped);
    CHECK_EQ(w.value().truncated, 10);

    // Back to the defaults: the move of 15 now fits.
    CHECK(policy.clear_override(POOL));
    w = oracle.push_observation(cap, POOL, 25, 120);
    CHECK_OK(w);
    CHECK(!w.value().capped);
    CHECK_EQ(w.value().truncated, 25);

    // A value pinned by the owner outlives policy changes.
    CHECK_OK(oracle.set_max_ticks_per_block(OWNER, POOL, 3));
    ov.max_abs_tick_move = 40;
    CHECK_OK(policy.set_override(POOL, ov));
    CHECK(oracle.max_ticks_per_block(POOL) == 3);
    w = oracle.push_observation(cap, POOL, 35, 130);
    CHECK_OK(w);
    CHECK_EQ(w.value().truncated, 28);
}

TEST_CASE(TruncOracle, observe_through_oracle) {
    policy::PolicyManager policy;
    oracle::TruncOracle oracle(OWNER, policy);
    auto cap = oracle.authorize_writer(OWNER, HOOK).value();
    CHECK_OK(oracle.enable_pool(cap, POOL, 0, 100));
    CHECK_OK(oracle.push_observation(cap, POOL, 20, 110));

    const std::array<uint32_t, 2> agos{0, 10};
    CHECK(oracle.observe(POOL, 110, agos).value() == (std::vector<int64_t>{200, 0}));
    const std::array<uint32_t, 1> too_old{11};
    CHECK_ERR_CODE(oracle.observe(POOL, 110, too_old),
                   core::ErrorCode::ORACLE_STALE_LOOKBACK);
}
