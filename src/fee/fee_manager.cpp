// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fee/fee_manager.h"
#include "core/logging.h"
#include "fee/fee_math.h"

#include <algorithm>
#include <string>

namespace fee {

namespace {

uint64_t surge_at(const FeeState& s, uint64_t t, const policy::PolicyParams& p) {
    return surge_fee_ppm(t, s.cap_start, p.surge_decay_period_seconds,
                         s.base_fee_ppm, p.surge_fee_multiplier_ppm);
}

FeeEvent make_event(const pool::PoolId& pool, const FeeQuote& quote,
                    bool in_cap, uint64_t t) {
    FeeEvent ev;
    ev.pool = pool;
    ev.base_fee_ppm = quote.base_fee_ppm;
    ev.surge_fee_ppm = quote.surge_fee_ppm;
    ev.in_cap = in_cap;
    ev.timestamp = t;
    return ev;
}

core::Error not_initialized(const pool::PoolId& pool) {
    return core::make_error(core::ErrorCode::FEE_NOT_INITIALIZED,
                            "pool " + pool.to_short_hex() + " not initialized");
}

} // namespace

DynamicFeeManager::DynamicFeeManager(const pool::Address& owner,
                                     const policy::PolicyProvider& policy,
                                     const oracle::CapacitySignal& capacity)
    : policy_(policy), capacity_(capacity), issuer_("fee", owner) {}

core::Result<auth::Capability> DynamicFeeManager::authorize_writer(
    const pool::Address& caller, const pool::Address& writer) {
    return issuer_.authorize(caller, writer);
}

uint32_t DynamicFeeManager::initial_base_fee(
    const pool::PoolId& pool, const policy::PolicyParams& p) const {
    const std::optional<int32_t> max_ticks = capacity_.max_ticks_per_block(pool);
    if (!max_ticks) return p.default_base_fee_ppm;

    const uint64_t ticks = static_cast<uint64_t>(std::max<int32_t>(*max_ticks, 0));
    return clamp_fee(ticks * p.base_fee_factor_ppm, p.min_base_fee_ppm,
                     p.max_base_fee_ppm);
}

core::Result<bool> DynamicFeeManager::initialize(const auth::Capability& cap,
                                                 const pool::PoolId& pool,
                                                 uint64_t now) {
    DYNFEE_TRY_VOID(issuer_.verify(cap));

    const policy::PolicyParams params = policy_.params(pool);
    const uint64_t t = FeeState::clamp_timestamp(std::max<uint64_t>(now, 1));

    FeeState s;
    s.base_fee_ppm = initial_base_fee(pool, params);
    s.set_freq_last_update(t);
    s.set_last_fee_update(t);

    if (!pools_.insert_if_absent(pool, s.pack())) {
        LOG_INFO(core::LogCategory::FEE,
                 "pool " + pool.to_short_hex() + " already initialized");
        notifier_.notify_already_initialized(pool);
        return false;
    }

    LOG_INFO(core::LogCategory::FEE,
             "initialized pool " + pool.to_short_hex() + " with base fee " +
             std::to_string(s.base_fee_ppm) + " ppm");
    notifier_.notify_state_change(
        make_event(pool, FeeQuote{s.base_fee_ppm, 0}, false, t));
    return true;
}

core::Result<FeeUpdate> DynamicFeeManager::notify_step(
    const auth::Capability& cap, const pool::PoolId& pool,
    bool was_capped, uint64_t now) {
    DYNFEE_TRY_VOID(issuer_.verify(cap));

    const policy::PolicyParams p = policy_.params(pool);
    uint64_t t = 0;

    auto res = pools_.modify(
        pool, core::ErrorCode::FEE_NOT_INITIALIZED,
        [&](core::uint256& word) -> core::Result<FeeUpdate> {
            if (FeeState::is_uninitialized(word)) return not_initialized(pool);

            FeeState s = FeeState::unpack(word);
            t = FeeState::clamp_timestamp(std::max(now, s.freq_last_update));
            const FeeQuote before{s.base_fee_ppm, surge_at(s, t, p)};
            const bool was_in_cap = s.in_cap;

            FeeUpdate update;
            update.was_capped = was_capped;

            // 1. frequency decay
            s.decay_freq(t - s.freq_last_update,
                         p.cap_budget_decay_window_seconds);

            // 2./3. cap entry, or exit once the surge has fully decayed
            if (was_capped) {
                s.in_cap = true;
                s.set_cap_start(t);
                s.add_freq(freq_increment(p.freq_scaling_unit));
                update.cap_started = !was_in_cap;
            } else if (s.in_cap && surge_at(s, t, p) == 0) {
                s.in_cap = false;
                s.cap_start = 0;
                update.cap_ended = true;
            }

            // 4. base fee feedback
            if (t - std::min(t, s.last_fee_update) >=
                p.base_fee_update_interval_seconds) {
                const core::uint128 caps =
                    caps_per_day_ppm(s.freq, p.freq_scaling_unit,
                                     p.cap_budget_decay_window_seconds);
                const int64_t dev = deviation_ppm(caps, p.target_caps_per_day);
                s.base_fee_ppm = step_base_fee(s.base_fee_ppm, dev,
                                               p.max_step_ppm,
                                               p.min_base_fee_ppm,
                                               p.max_base_fee_ppm);
                s.set_last_fee_update(t);
                update.base_fee_recomputed = true;
            } else {
                s.base_fee_ppm = clamp_fee(s.base_fee_ppm, p.min_base_fee_ppm,
                                           p.max_base_fee_ppm);
            }

            // 5. stamp and commit
            s.set_freq_last_update(t);
            word = s.pack();

            update.state = s;
            update.quote = FeeQuote{s.base_fee_ppm, surge_at(s, t, p)};
            update.changed = update.quote != before || s.in_cap != was_in_cap;
            return update;
        });
    if (!res.ok()) return res;

    // 6. notifications, after the shard lock is released
    const FeeUpdate& update = res.value();
    if (update.cap_started) {
        LOG_INFO(core::LogCategory::FEE,
                 "pool " + pool.to_short_hex() + ": cap event started, surge " +
                 std::to_string(update.quote.surge_fee_ppm) + " ppm");
    } else if (update.cap_ended) {
        LOG_INFO(core::LogCategory::FEE,
                 "pool " + pool.to_short_hex() + ": cap event ended");
    }
    if (update.base_fee_recomputed) {
        LOG_DEBUG(core::LogCategory::FEE,
                  "pool " + pool.to_short_hex() + ": base fee " +
                  std::to_string(update.state.base_fee_ppm) + " ppm, freq " +
                  core::to_string(update.state.freq));
    }
    if (update.changed) {
        notifier_.notify_state_change(
            make_event(pool, update.quote, update.state.in_cap, t));
    }
    return res;
}

core::Result<FeeQuote> DynamicFeeManager::get_fee_state(
    const pool::PoolId& pool, uint64_t now) const {
    const std::optional<core::uint256> word = pools_.get(pool);
    if (!word || FeeState::is_uninitialized(*word)) return not_initialized(pool);

    const FeeState s = FeeState::unpack(*word);
    const policy::PolicyParams p = policy_.params(pool);
    return FeeQuote{s.base_fee_ppm, surge_at(s, now, p)};
}

bool DynamicFeeManager::is_cap_event_active(const pool::PoolId& pool) const {
    bool active = false;
    pools_.read(pool, [&](const core::uint256& word) {
        active = FeeState::unpack(word).in_cap;
    });
    return active;
}

bool DynamicFeeManager::is_initialized(const pool::PoolId& pool) const {
    return pools_.contains(pool);
}

core::Result<FeeState> DynamicFeeManager::state(const pool::PoolId& pool) const {
    const std::optional<core::uint256> word = pools_.get(pool);
    if (!word || FeeState::is_uninitialized(*word)) return not_initialized(pool);
    return FeeState::unpack(*word);
}

std::optional<core::uint256> DynamicFeeManager::raw_state(
    const pool::PoolId& pool) const {
    return pools_.get(pool);
}

} // namespace fee
