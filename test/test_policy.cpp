// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for controller parameters and the policy manager.

#include "test_framework.h"

#include "core/config.h"
#include "policy/policy_manager.h"
#include "policy/policy_params.h"

#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace {

const pool::PoolId POOL_A = pool::PoolId::from_hex("0xaa");
const pool::PoolId POOL_B = pool::PoolId::from_hex("0xbb");

core::Config config_from(std::string_view text) {
    core::Config cfg;
    auto res = cfg.parse_text(text, "<test>");
    if (!res.ok()) {
        throw std::runtime_error("bad test config: " + res.error().message());
    }
    return cfg;
}

} // namespace

// ============================================================================
// PolicyParams
// ============================================================================

TEST_CASE(PolicyParams, defaults_are_valid) {
    policy::PolicyParams p;
    CHECK_OK(policy::validate_params(p));
    CHECK_EQ(p.target_caps_per_day, uint32_t{4});
    CHECK_EQ(p.max_base_fee_ppm, uint32_t{50'000});
    CHECK(p.cap_mode == oracle::CapMode::PER_STEP);
}

TEST_CASE(PolicyParams, rejects_each_bound) {
    auto expect_range = [](auto mutate) {
        policy::PolicyParams p;
        mutate(p);
        CHECK_ERR_CODE(policy::validate_params(p), core::ErrorCode::VALIDATION_RANGE);
    };
    expect_range([](policy::PolicyParams& p) { p.min_base_fee_ppm = 60'000; });
    expect_range([](policy::PolicyParams& p) { p.max_base_fee_ppm = 1'000'001; });
    expect_range([](policy::PolicyParams& p) { p.target_caps_per_day = 0; });
    expect_range([](policy::PolicyParams& p) { p.cap_budget_decay_window_seconds = 0; });
    expect_range([](policy::PolicyParams& p) { p.freq_scaling_unit = 0; });
    expect_range([](policy::PolicyParams& p) { p.max_step_ppm = 0; });
    expect_range([](policy::PolicyParams& p) { p.max_step_ppm = 1'000'001; });
    expect_range([](policy::PolicyParams& p) { p.surge_fee_multiplier_ppm = 30'000'001; });
    expect_range([](policy::PolicyParams& p) { p.max_abs_tick_move = -1; });
    expect_range([](policy::PolicyParams& p) {
        p.max_abs_tick_move = policy::MAX_TICK_MOVE_LIMIT + 1;
    });
    expect_range([](policy::PolicyParams& p) { p.default_base_fee_ppm = 99; });
    expect_range([](policy::PolicyParams& p) { p.default_base_fee_ppm = 50'001; });
    expect_range([](policy::PolicyParams& p) { p.block_duration_seconds = 0; });
}

TEST_CASE(PolicyParams, boundary_values_accepted) {
    policy::PolicyParams p;
    p.max_base_fee_ppm = policy::PPM;
    p.min_base_fee_ppm = policy::PPM;
    p.default_base_fee_ppm = policy::PPM;
    p.max_step_ppm = policy::PPM;
    p.surge_fee_multiplier_ppm = policy::MAX_SURGE_MULTIPLIER_PPM;
    p.max_abs_tick_move = policy::MAX_TICK_MOVE_LIMIT;
    CHECK_OK(policy::validate_params(p));

    p.max_abs_tick_move = 0;
    p.surge_fee_multiplier_ppm = 0;
    CHECK_OK(policy::validate_params(p));
}

TEST_CASE(PolicyParams, override_apply_and_merge) {
    policy::PolicyOverride ov;
    CHECK(ov.empty());
    ov.max_step_ppm = 10'000;
    ov.cap_mode = oracle::CapMode::PER_BLOCK;
    CHECK(!ov.empty());

    policy::PolicyOverride newer;
    newer.max_step_ppm = 20'000;
    newer.min_base_fee_ppm = 500;
    ov.merge(newer);

    auto p = ov.apply_to(policy::PolicyParams{});
    CHECK_EQ(p.max_step_ppm, uint32_t{20'000});
    CHECK_EQ(p.min_base_fee_ppm, uint32_t{500});
    CHECK(p.cap_mode == oracle::CapMode::PER_BLOCK);
    CHECK_EQ(p.max_base_fee_ppm, uint32_t{50'000});
}

TEST_CASE(PolicyParams, set_field_by_key) {
    policy::PolicyOverride ov;
    CHECK_OK(policy::set_policy_field(ov, "minbasefee", "250"));
    CHECK_OK(policy::set_policy_field(ov, "capmode", "per-block"));
    CHECK_OK(policy::set_policy_field(ov, "maxabstickmove", "-5"));
    CHECK(ov.min_base_fee_ppm == 250u);
    CHECK(ov.cap_mode == oracle::CapMode::PER_BLOCK);
    CHECK(ov.max_abs_tick_move == -5);

    CHECK_ERR_CODE(policy::set_policy_field(ov, "nosuchkey", "1"),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(policy::set_policy_field(ov, "minbasefee", "12abc"),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(policy::set_policy_field(ov, "minbasefee", "-1"),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(policy::set_policy_field(ov, "minbasefee", "4294967296"),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(policy::set_policy_field(ov, "capmode", "sometimes"),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK(ov.min_base_fee_ppm == 250u);
}

TEST_CASE(PolicyParams, policy_key_names) {
    CHECK(policy::is_policy_key("targetcapsperday"));
    CHECK(policy::is_policy_key("capmode"));
    CHECK(policy::is_policy_key("blockduration"));
    CHECK(!policy::is_policy_key("loglevel"));
    CHECK(!policy::is_policy_key("pooloverride"));
}

// ============================================================================
// PolicyManager
// ============================================================================

TEST_CASE(PolicyManager, falls_back_to_defaults) {
    policy::PolicyManager mgr;
    CHECK(mgr.params(POOL_A) == policy::PolicyParams{});
    CHECK_EQ(mgr.override_count(), std::size_t{0});
    CHECK_EQ(mgr.max_abs_tick_move(POOL_A), 50);
    CHECK_EQ(mgr.default_base_fee_ppm(POOL_A), uint32_t{3'000});
}

TEST_CASE(PolicyManager, override_applies_to_one_pool) {
    policy::PolicyManager mgr;
    policy::PolicyOverride ov;
    ov.target_caps_per_day = 10;
    CHECK_OK(mgr.set_override(POOL_A, ov));

    CHECK_EQ(mgr.target_caps_per_day(POOL_A), uint32_t{10});
    CHECK_EQ(mgr.target_caps_per_day(POOL_B), uint32_t{4});
    CHECK(mgr.has_override(POOL_A));
    CHECK(!mgr.has_override(POOL_B));

    // Later overrides merge with earlier ones.
    policy::PolicyOverride more;
    more.max_step_ppm = 5'000;
    CHECK_OK(mgr.set_override(POOL_A, more));
    CHECK_EQ(mgr.target_caps_per_day(POOL_A), uint32_t{10});
    CHECK_EQ(mgr.max_step_ppm(POOL_A), uint32_t{5'000});

    CHECK(mgr.clear_override(POOL_A));
    CHECK(!mgr.clear_override(POOL_A));
    CHECK_EQ(mgr.target_caps_per_day(POOL_A), uint32_t{4});
}

TEST_CASE(PolicyManager, invalid_override_changes_nothing) {
    policy::PolicyManager mgr;
    policy::PolicyOverride good;
    good.max_base_fee_ppm = 10'000;
    CHECK_OK(mgr.set_override(POOL_A, good));

    policy::PolicyOverride bad;
    bad.min_base_fee_ppm = 20'000;  // above the pool's max
    CHECK_ERR_CODE(mgr.set_override(POOL_A, bad), core::ErrorCode::VALIDATION_RANGE);
    CHECK_EQ(mgr.min_base_fee_ppm(POOL_A), uint32_t{100});
    CHECK_EQ(mgr.max_base_fee_ppm(POOL_A), uint32_t{10'000});

    CHECK_ERR_CODE(mgr.set_override(POOL_B, bad), core::ErrorCode::VALIDATION_RANGE);
    CHECK(!mgr.has_override(POOL_B));
}

TEST_CASE(PolicyManager, set_defaults_checks_existing_overrides) {
    policy::PolicyManager mgr;
    policy::PolicyOverride ov;
    ov.min_base_fee_ppm = 5'000;
    ov.default_base_fee_ppm = 5'000;
    CHECK_OK(mgr.set_override(POOL_A, ov));

    // Lowering the global max below the pool's min would leave POOL_A
    // invalid.
    policy::PolicyParams lowered;
    lowered.max_base_fee_ppm = 4'000;
    lowered.default_base_fee_ppm = 3'000;
    CHECK_ERR_CODE(mgr.set_defaults(lowered), core::ErrorCode::VALIDATION_RANGE);
    CHECK(mgr.defaults() == policy::PolicyParams{});

    policy::PolicyParams invalid;
    invalid.target_caps_per_day = 0;
    CHECK_ERR_CODE(mgr.set_defaults(invalid), core::ErrorCode::VALIDATION_RANGE);

    policy::PolicyParams raised;
    raised.target_caps_per_day = 8;
    CHECK_OK(mgr.set_defaults(raised));
    CHECK_EQ(mgr.target_caps_per_day(POOL_B), uint32_t{8});
    CHECK_EQ(mgr.target_caps_per_day(POOL_A), uint32_t{8});
    CHECK_EQ(mgr.min_base_fee_ppm(POOL_A), uint32_t{5'000});
}

TEST_CASE(PolicyManager, load_config_defaults_and_overrides) {
    policy::PolicyManager mgr;
    auto cfg = config_from(
        "# controller\n"
        "targetcapsperday=6\n"
        "capmode=block\n"
        "pooloverride=0xaa:maxbasefee=20000\n"
        "pooloverride=0xaa:maxabstickmove=30\n"
        "pooloverride=0xbb:surgemultiplier=0\n");
    CHECK_OK(mgr.load_config(cfg));

    CHECK_EQ(mgr.defaults().target_caps_per_day, uint32_t{6});
    CHECK(mgr.defaults().cap_mode == oracle::CapMode::PER_BLOCK);
    CHECK_EQ(mgr.max_base_fee_ppm(POOL_A), uint32_t{20'000});
    CHECK_EQ(mgr.max_abs_tick_move(POOL_A), 30);
    CHECK_EQ(mgr.target_caps_per_day(POOL_A), uint32_t{6});
    CHECK_EQ(mgr.surge_fee_multiplier_ppm(POOL_B), uint32_t{0});
    CHECK_EQ(mgr.override_count(), std::size_t{2});
}

TEST_CASE(PolicyManager, load_config_replaces_everything) {
    policy::PolicyManager mgr;
    policy::PolicyOverride ov;
    ov.max_step_ppm = 1'000;
    CHECK_OK(mgr.set_override(POOL_B, ov));

    CHECK_OK(mgr.load_config(config_from("pooloverride=0xaa:minbasefee=200\n")));
    CHECK(!mgr.has_override(POOL_B));
    CHECK(mgr.has_override(POOL_A));
    CHECK(mgr.defaults() == policy::PolicyParams{});
}

TEST_CASE(PolicyManager, load_config_rejects_bad_input_atomically) {
    policy::PolicyManager mgr;
    policy::PolicyOverride ov;
    ov.max_step_ppm = 1'000;
    CHECK_OK(mgr.set_override(POOL_B, ov));

    CHECK_ERR_CODE(mgr.load_config(config_from("pooloverride=0xaa\n")),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(mgr.load_config(config_from("pooloverride=zz:minbasefee=1\n")),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(mgr.load_config(config_from("pooloverride=0xaa:bogus=1\n")),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(mgr.load_config(config_from("minbasefee=ten\n")),
                   core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(mgr.load_config(config_from("maxstep=0\n")),
                   core::ErrorCode::VALIDATION_RANGE);
    CHECK_ERR_CODE(mgr.load_config(config_from(
                       "targetcapsperday=9\n"
                       "pooloverride=0xaa:minbasefee=60000\n")),
                   core::ErrorCode::VALIDATION_RANGE);

    // None of the rejected configurations left a trace.
    CHECK(mgr.defaults() == policy::PolicyParams{});
    CHECK(mgr.has_override(POOL_B));
    CHECK(!mgr.has_override(POOL_A));
    CHECK_EQ(mgr.max_step_ppm(POOL_B), uint32_t{1'000});
}
