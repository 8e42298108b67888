// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"

#include "auth/capability.h"
#include "core/arith.h"
#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "core/random.h"
#include "core/sync.h"
#include "core/time.h"
#include "core/types.h"
#include "crypto/keccak.h"
#include "pool/pool_key.h"
#include "pool/pool_store.h"

#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

pool::Address addr(const char* hex) {
    return pool::Address::from_hex(hex);
}

} // namespace

// ============================================================================
// Types -- uint256 / uint160
// ============================================================================

TEST_CASE(Types, uint256_default_is_zero) {
    core::uint256 z;
    CHECK(z.is_zero());
    CHECK_EQ(z.to_hex(),
             "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST_CASE(Types, uint256_from_hex_roundtrip) {
    std::string hex =
        "00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53";
    auto val = core::uint256::from_hex(hex);
    CHECK(!val.is_zero());
    CHECK_EQ(val.to_hex(), hex);
    CHECK_EQ(val.to_short_hex(), std::string("000000000000"));
}

TEST_CASE(Types, hex_is_zero_padded) {
    auto val = core::uint160::from_hex("0x0a");
    CHECK_EQ(val.to_hex(), std::string("000000000000000000000000000000000000000a"));
}

TEST_CASE(Types, parse_hex_rejects_garbage) {
    CHECK(!core::uint256::parse_hex("xyz").has_value());
    CHECK(!core::uint160::parse_hex(std::string(41, 'f')).has_value());
    CHECK(core::uint160::parse_hex(std::string(40, 'f')).has_value());
    CHECK_THROWS_AS(core::uint256::from_hex("0xzz"), std::invalid_argument);
}

TEST_CASE(Types, ordering_is_numeric) {
    auto a = core::uint256::from_hex("0x0100");
    auto b = core::uint256::from_hex("0x00ff");
    CHECK(b < a);
    CHECK(a != b);
    CHECK(a == core::uint256::from_hex("100"));
}

TEST_CASE(Types, bit_fields_round_trip) {
    core::uint256 w;
    w.set_bits(0, 64, 0xFFFFFFFFFFFFFFFFULL);
    w.set_bits(64, 32, 0x12345678);
    w.set_bits(248, 1, 1);
    CHECK_EQ(w.get_bits(0, 64), 0xFFFFFFFFFFFFFFFFULL);
    CHECK_EQ(w.get_bits(64, 32), 0x12345678ULL);
    CHECK_EQ(w.get_bits(96, 32), 0ULL);
    CHECK_EQ(w.get_bits(248, 1), 1ULL);
    CHECK_EQ(w.get_bits(249, 7), 0ULL);

    // Overwrite clears previous bits in the range.
    w.set_bits(64, 32, 0x1);
    CHECK_EQ(w.get_bits(64, 32), 0x1ULL);
}

TEST_CASE(Types, bits_past_the_end_are_ignored) {
    core::uint256 w;
    w.set_bits(250, 16, 0xFFFF);
    CHECK_EQ(w.get_bits(250, 16), 0x3FULL);
}

// ============================================================================
// Arith -- saturating 128-bit helpers
// ============================================================================

TEST_CASE(Arith, sat_add_clamps_at_cap) {
    const core::uint128 cap = core::max_for_bits(96);
    CHECK(core::sat_add(cap - 1, 5, cap) == cap);
    CHECK(core::sat_add(10, 5, cap) == 15);
    CHECK(core::sat_add(core::UINT128_MAX_VALUE, 1) == core::UINT128_MAX_VALUE);
}

TEST_CASE(Arith, sat_sub_floors_at_zero) {
    CHECK(core::sat_sub(5, 10) == 0);
    CHECK(core::sat_sub(10, 5) == 5);
}

TEST_CASE(Arith, sat_mul_and_mul_div) {
    CHECK(core::sat_mul(core::UINT128_MAX_VALUE, 2) == core::UINT128_MAX_VALUE);
    CHECK(core::sat_mul(1000, 1000, 999) == 999);
    CHECK(core::mul_div(10, 3, 4) == 7);
    CHECK(core::mul_div(10, 3, 0) == core::UINT128_MAX_VALUE);
    CHECK(core::mul_div(core::UINT128_MAX_VALUE, 2, 4) == core::UINT128_MAX_VALUE);
}

TEST_CASE(Arith, narrowing_saturates) {
    CHECK_EQ(core::sat_to_int64(core::int128{1} << 100),
             std::numeric_limits<int64_t>::max());
    CHECK_EQ(core::sat_to_int64(-(core::int128{1} << 100)),
             std::numeric_limits<int64_t>::min());
    CHECK_EQ(core::sat_to_uint64(core::uint128{1} << 64),
             std::numeric_limits<uint64_t>::max());
    CHECK_EQ(core::sat_to_uint64(42), uint64_t{42});
}

TEST_CASE(Arith, to_string_renders_128_bit) {
    CHECK_EQ(core::to_string(0), std::string("0"));
    CHECK_EQ(core::to_string(core::uint128{1} << 64),
             std::string("18446744073709551616"));
    CHECK_EQ(core::to_string(core::max_for_bits(96)),
             std::string("79228162514264337593543950335"));
}

// ============================================================================
// Error
// ============================================================================

namespace {

core::Result<int> half(int v) {
    if (v % 2 != 0) {
        return core::make_error(core::ErrorCode::VALIDATION_ERROR, "odd");
    }
    return v / 2;
}

core::Result<int> quarter(int v) {
    int h = DYNFEE_TRY(half(v));
    return half(h);
}

} // namespace

TEST_CASE(Error, try_propagates) {
    CHECK_EQ(quarter(8).value(), 2);
    CHECK_ERR_CODE(quarter(6), core::ErrorCode::VALIDATION_ERROR);
    CHECK(core::has_error_code(quarter(3), core::ErrorCode::VALIDATION_ERROR));
    CHECK(!core::has_error_code(quarter(8), core::ErrorCode::VALIDATION_ERROR));
}

TEST_CASE(Error, names_and_format) {
    CHECK_EQ(core::error_code_name(core::ErrorCode::FEE_NOT_INITIALIZED),
             std::string_view("FEE_NOT_INITIALIZED"));
    auto err = core::make_error(core::ErrorCode::AUTH_UNAUTHORIZED, "nope");
    CHECK(err.format().find("nope") != std::string::npos);
    CHECK(static_cast<bool>(err));
    CHECK(!static_cast<bool>(core::Error{}));
}

TEST_CASE(Error, value_on_error_throws) {
    core::Result<int> r = core::make_error(core::ErrorCode::INTERNAL_ERROR);
    CHECK_THROWS_AS(r.value(), std::runtime_error);
    CHECK_EQ(r.value_or(7), 7);
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_and_priority) {
    core::Config cfg;
    CHECK_OK(cfg.parse_text("maxstep=10000\nminbasefee=200\n# comment\n"));
    const char* argv[] = {"feesim", "-maxstep=20000", "--verbose",
                          "-pooloverride=a", "-pooloverride=b"};
    CHECK_OK(cfg.parse_args(5, argv));
    CHECK_EQ(cfg.get_int("maxstep"), int64_t{20000});
    CHECK_EQ(cfg.get_int("minbasefee"), int64_t{200});
    CHECK(cfg.get_bool("verbose"));
    CHECK_EQ(cfg.get_list("pooloverride").size(), std::size_t{2});
    CHECK(!cfg.has("missing"));
    CHECK_EQ(cfg.get_or("missing", "x"), std::string("x"));
}

TEST_CASE(Config, positional_argument_rejected) {
    core::Config cfg;
    const char* argv[] = {"feesim", "stray"};
    CHECK_ERR_CODE(cfg.parse_args(2, argv), core::ErrorCode::CONFIG_PARSE);
}

TEST_CASE(Config, empty_key_rejected) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_text("=5\n"), core::ErrorCode::CONFIG_PARSE);
}

TEST_CASE(Config, missing_file_is_config_error) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file("/nonexistent/dynfee/test.conf"),
                   core::ErrorCode::CONFIG_ERROR);
}

TEST_CASE(Config, checked_integers) {
    core::Config cfg;
    cfg.set("good", "42");
    cfg.set("bad", "4x2");
    cfg.set("neg", "-1");
    CHECK_EQ(cfg.get_int_checked("good", 0).value(), int64_t{42});
    CHECK_EQ(cfg.get_int_checked("absent", 9).value(), int64_t{9});
    CHECK_ERR_CODE(cfg.get_int_checked("bad", 0), core::ErrorCode::CONFIG_PARSE);
    CHECK_ERR_CODE(cfg.get_uint_checked("neg", 0), core::ErrorCode::CONFIG_PARSE);
    CHECK_EQ(cfg.get_int("bad", 5), int64_t{5});
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, parse_levels_and_categories) {
    CHECK(core::parse_log_level("debug") == core::LogLevel::DEBUG);
    CHECK(core::parse_log_level("WARNING") == core::LogLevel::WARN);
    CHECK(!core::parse_log_level("loud").has_value());

    const uint32_t mask = core::parse_log_categories("fee, oracle");
    CHECK_EQ(mask, static_cast<uint32_t>(core::LogCategory::FEE) |
                   static_cast<uint32_t>(core::LogCategory::ORACLE));
    CHECK_EQ(core::parse_log_categories("all,none"), uint32_t{0});
    CHECK_EQ(core::log_category_string(core::LogCategory::HOOK),
             std::string_view("HOOK"));
}

TEST_CASE(Logging, capture_respects_filters) {
    auto& logger = core::Logger::instance();
    logger.set_capture_limit(16);
    logger.clear_captured();
    logger.set_categories(static_cast<uint32_t>(core::LogCategory::FEE));

    LOG_INFO(core::LogCategory::FEE, "fee line");
    LOG_INFO(core::LogCategory::ORACLE, "oracle line");
    LOG_DEBUG(core::LogCategory::FEE, "debug line");

    CHECK_EQ(logger.count_captured("fee line"), std::size_t{1});
    CHECK_EQ(logger.count_captured("oracle line"), std::size_t{0});
    CHECK_EQ(logger.count_captured("debug line"), std::size_t{0});
    CHECK(logger.captured().back().find("[INFO] [FEE]") != std::string::npos);

    logger.set_categories(static_cast<uint32_t>(core::LogCategory::ALL));
    logger.set_capture_limit(0);
    logger.clear_captured();
}

// ============================================================================
// Sync
// ============================================================================

TEST_CASE(Sync, guards_track_held_locks) {
    core::Mutex a("test.a");
    core::SharedMutex b("test.b");
    const std::size_t before = core::held_lock_count();
    {
        LOCK(a);
        WRITE_LOCK(b);
#ifndef NDEBUG
        CHECK_EQ(core::held_lock_count(), before + 2);
#endif
    }
    {
        READ_LOCK(b);
        CHECK_EQ(core::held_lock_count(), before);
    }
    CHECK_EQ(core::held_lock_count(), before);
}

// ============================================================================
// Time / Random
// ============================================================================

TEST_CASE(Time, mockable_clock) {
    const int64_t saved = core::MockableClock::get_mock_time();
    core::MockableClock::set_mock_time(1'000);
    CHECK_EQ(core::MockableClock::now(), int64_t{1'000});
    CHECK_EQ(core::MockableClock::advance(60), int64_t{1'060});
    CHECK_EQ(core::MockableClock::advance(-5), int64_t{1'060});
    CHECK_EQ(core::format_iso8601(0), std::string("1970-01-01T00:00:00Z"));
    core::MockableClock::set_mock_time(saved);
}

TEST_CASE(Random, insecure_is_deterministic) {
    core::InsecureRandom a(7), b(7);
    for (int i = 0; i < 16; ++i) CHECK_EQ(a.next(), b.next());
    for (int i = 0; i < 100; ++i) {
        const int64_t v = a.uniform(-3, 3);
        CHECK(v >= -3 && v <= 3);
    }
    CHECK_THROWS_AS(a.range(0), std::invalid_argument);
}

// ============================================================================
// Crypto
// ============================================================================

TEST_CASE(Crypto, sha3_empty_vector) {
    // SHA3-256("") = a7ffc6f8...80f8434a
    const auto digest = crypto::keccak256({});
    CHECK_EQ(digest.data()[0], uint8_t{0xa7});
    CHECK_EQ(digest.data()[1], uint8_t{0xff});
    CHECK_EQ(digest.data()[31], uint8_t{0x4a});
}

TEST_CASE(Crypto, hasher_is_single_use) {
    crypto::Keccak256Hasher h;
    h.write_tag("x").write_u64(1);
    (void)h.finalize();
    CHECK_THROWS_AS(h.finalize(), std::runtime_error);
}

TEST_CASE(Crypto, constant_time_equal) {
    auto a = core::uint256::from_hex("0x1234");
    CHECK(crypto::constant_time_equal(a, a));
    CHECK(!crypto::constant_time_equal(a, core::uint256::from_hex("0x1235")));
}

// ============================================================================
// Pool keys and store
// ============================================================================

TEST_CASE(PoolKey, make_sorts_and_hashes) {
    auto hook = addr("0x80");
    auto k1 = pool::make_pool_key(addr("0x0b"), addr("0x0a"), 60, hook);
    auto k2 = pool::make_pool_key(addr("0x0a"), addr("0x0b"), 60, hook);
    CHECK(k1 == k2);
    CHECK(k1.currency0 < k1.currency1);
    CHECK_OK(k1.validate());
    CHECK(k1.is_dynamic_fee());
    CHECK_EQ(k1.to_id(), k2.to_id());

    auto k3 = pool::make_pool_key(addr("0x0a"), addr("0x0b"), 10, hook);
    CHECK_NE(k1.to_id(), k3.to_id());
}

TEST_CASE(PoolKey, validate_rejects_bad_keys) {
    pool::PoolKey key;
    key.currency0 = addr("0x0b");
    key.currency1 = addr("0x0a");
    CHECK_ERR_CODE(key.validate(), core::ErrorCode::VALIDATION_ERROR);

    key = pool::make_pool_key(addr("0x0a"), addr("0x0b"), 0, addr("0x80"));
    CHECK_ERR_CODE(key.validate(), core::ErrorCode::VALIDATION_RANGE);
}

TEST_CASE(PoolStore, modify_commits_only_on_success) {
    pool::PoolStore<int> store;
    auto id = core::uint256::from_hex("0x01");
    CHECK(store.insert_if_absent(id, 5));
    CHECK(!store.insert_if_absent(id, 6));
    CHECK_EQ(store.get(id).value(), 5);

    auto failed = store.modify(id, core::ErrorCode::INTERNAL_ERROR,
                               [](int& v) -> core::Result<void> {
                                   v = 100;
                                   return core::make_error(
                                       core::ErrorCode::VALIDATION_ERROR);
                               });
    CHECK_ERR_CODE(failed, core::ErrorCode::VALIDATION_ERROR);
    CHECK_EQ(store.get(id).value(), 5);

    auto ok = store.modify(id, core::ErrorCode::INTERNAL_ERROR,
                           [](int& v) -> core::Result<int> { return ++v; });
    CHECK_EQ(ok.value(), 6);
    CHECK_EQ(store.get(id).value(), 6);

    auto missing = store.modify(core::uint256::from_hex("0x02"),
                                core::ErrorCode::FEE_NOT_INITIALIZED,
                                [](int&) -> core::Result<void> {
                                    return core::make_ok();
                                });
    CHECK_ERR_CODE(missing, core::ErrorCode::FEE_NOT_INITIALIZED);
    CHECK_EQ(store.size(), std::size_t{1});
}

// ============================================================================
// Capabilities
// ============================================================================

TEST_CASE(Capability, only_owner_authorizes) {
    const auto owner = addr("0x01");
    const auto hook = addr("0x80");
    auth::CapabilityIssuer issuer("fee", owner);

    CHECK_ERR_CODE(issuer.authorize(hook, hook), core::ErrorCode::AUTH_UNAUTHORIZED);
    auto cap = issuer.authorize(owner, hook);
    CHECK_OK(cap);
    CHECK_OK(issuer.verify(cap.value()));
    CHECK_EQ(issuer.epoch(), uint64_t{1});
    CHECK(issuer.writer() == hook);
}

TEST_CASE(Capability, forged_and_rotated_tokens_rejected) {
    const auto owner = addr("0x01");
    const auto hook = addr("0x80");
    auth::CapabilityIssuer issuer("oracle", owner);
    auth::Capability first = issuer.authorize(owner, hook).value();

    auth::Capability forged{hook, core::uint256::from_hex("0xdead")};
    CHECK_ERR_CODE(issuer.verify(forged), core::ErrorCode::AUTH_UNAUTHORIZED);

    auth::Capability wrong_writer{addr("0x81"), first.token};
    CHECK_ERR_CODE(issuer.verify(wrong_writer), core::ErrorCode::AUTH_UNAUTHORIZED);

    // Re-authorising the same writer invalidates the old token.
    auth::Capability second = issuer.authorize(owner, hook).value();
    CHECK_NE(first.token, second.token);
    CHECK_ERR_CODE(issuer.verify(first), core::ErrorCode::AUTH_UNAUTHORIZED);
    CHECK_OK(issuer.verify(second));

    CHECK_ERR_CODE(issuer.revoke(hook), core::ErrorCode::AUTH_UNAUTHORIZED);
    CHECK_OK(issuer.revoke(owner));
    CHECK_ERR_CODE(issuer.verify(second), core::ErrorCode::AUTH_UNAUTHORIZED);
    CHECK(!issuer.writer().has_value());
}

TEST_CASE(Capability, tokens_are_domain_separated) {
    const auto owner = addr("0x01");
    const auto hook = addr("0x80");
    auth::CapabilityIssuer oracle_issuer("oracle", owner);
    auth::CapabilityIssuer fee_issuer("fee", owner);
    auto oracle_cap = oracle_issuer.authorize(owner, hook).value();
    CHECK_OK(fee_issuer.authorize(owner, hook));
    CHECK_ERR_CODE(fee_issuer.verify(oracle_cap), core::ErrorCode::AUTH_UNAUTHORIZED);
}
