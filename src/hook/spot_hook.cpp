// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hook/spot_hook.h"
#include "core/logging.h"
#include "core/time.h"

#include <limits>
#include <string>
#include <utility>

namespace hook {

uint32_t clock_seconds() {
    const int64_t now = core::MockableClock::now();
    if (now <= 0) return 0;
    if (now > std::numeric_limits<uint32_t>::max()) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(now);
}

SpotHook::SpotHook(const pool::Address& address,
                   oracle::TruncOracle& oracle,
                   fee::DynamicFeeManager& fees,
                   const TickSource& ticks,
                   auth::Capability oracle_cap,
                   auth::Capability fee_cap)
    : address_(address),
      oracle_(oracle),
      fees_(fees),
      ticks_(ticks),
      oracle_cap_(std::move(oracle_cap)),
      fee_cap_(std::move(fee_cap)) {}

core::Result<void> SpotHook::check_key(const pool::PoolKey& key) const {
    DYNFEE_TRY_VOID(key.validate());
    if (!key.is_dynamic_fee()) {
        return core::make_error(core::ErrorCode::VALIDATION_ERROR,
                                "pool " + key.to_string() +
                                " does not use the dynamic fee flag");
    }
    if (key.hooks != address_) {
        return core::make_error(core::ErrorCode::VALIDATION_ERROR,
                                "pool " + key.to_string() +
                                " is attached to another hook");
    }
    return core::make_ok();
}

core::Result<void> SpotHook::after_initialize(const pool::PoolKey& key,
                                              int32_t tick) {
    DYNFEE_TRY_VOID(check_key(key));

    const pool::PoolId id = key.to_id();
    const uint32_t now = clock_seconds();

    auto enabled = oracle_.enable_pool(oracle_cap_, id, tick, now);
    if (!enabled.ok() &&
        enabled.error().code() != core::ErrorCode::ORACLE_ALREADY_ENABLED) {
        return std::move(enabled).error();
    }

    DYNFEE_TRY_VOID(fees_.initialize(fee_cap_, id, now));
    LOG_DEBUG(core::LogCategory::HOOK,
              "initialized " + key.to_string() + " at tick " +
              std::to_string(tick));
    return core::make_ok();
}

core::Result<fee::FeeUpdate> SpotHook::after_swap(const pool::PoolKey& key) {
    const pool::PoolId id = key.to_id();
    const uint32_t now = clock_seconds();

    const int32_t tick = DYNFEE_TRY(ticks_.current_tick(id));

    auto written = oracle_.push_observation(oracle_cap_, id, tick, now);
    if (!written.ok()) {
        LOG_WARN(core::LogCategory::HOOK,
                 "pool " + id.to_short_hex() +
                 ": oracle update failed, fee update skipped: " +
                 written.error().message());
        return std::move(written).error();
    }

    return fees_.notify_step(fee_cap_, id, written.value().capped, now);
}

core::Result<fee::FeeQuote> SpotHook::current_fee(const pool::PoolKey& key) const {
    return fees_.get_fee_state(key.to_id(), clock_seconds());
}

} // namespace hook
