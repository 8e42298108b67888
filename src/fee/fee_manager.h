#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auth/capability.h"
#include "core/error.h"
#include "fee/fee_notify.h"
#include "fee/fee_state.h"
#include "oracle/trunc_oracle.h"
#include "policy/policy_manager.h"
#include "pool/pool_store.h"

#include <cstdint>
#include <optional>

namespace fee {

/// Fee charged on a swap, both parts in ppm.
struct FeeQuote {
    uint32_t base_fee_ppm = 0;
    uint64_t surge_fee_ppm = 0;

    [[nodiscard]] uint64_t total() const noexcept {
        return base_fee_ppm + surge_fee_ppm;
    }

    bool operator==(const FeeQuote&) const = default;
};

/// Outcome of one notify_step().
struct FeeUpdate {
    FeeState state;           ///< committed state
    FeeQuote quote;           ///< fee at the effective step time
    bool was_capped = false;  ///< the step reported a truncated tick
    bool cap_started = false; ///< Normal -> Capped
    bool cap_ended = false;   ///< Capped -> Normal
    bool base_fee_recomputed = false;
    bool changed = false;     ///< (base, surge, in_cap) differs from before
};

// ---------------------------------------------------------------------------
// DynamicFeeManager -- per-pool base fee controller and surge premium
// ---------------------------------------------------------------------------
// Each pool moves Uninitialized -> Normal <-> Capped.  A capped step enters
// (or restarts) a cap event; the event ends on the first uncapped step at
// which its surge premium has decayed to exactly zero.  Independently, the
// base fee is nudged at most once per update interval so that the decayed
// cap-event frequency tracks the policy's target.
//
// All mutation goes through the capability issued to the designated
// writer.  A pool's state lives in one packed word that is replaced as a
// whole, so readers never see a half-applied step.
// ---------------------------------------------------------------------------
class DynamicFeeManager {
public:
    DynamicFeeManager(const pool::Address& owner,
                      const policy::PolicyProvider& policy,
                      const oracle::CapacitySignal& capacity);

    DynamicFeeManager(const DynamicFeeManager&) = delete;
    DynamicFeeManager& operator=(const DynamicFeeManager&) = delete;

    /// Owner only.  Replaces any previous writer.
    core::Result<auth::Capability> authorize_writer(const pool::Address& caller,
                                                    const pool::Address& writer);

    /// Seed the pool's state.  Returns true when newly initialised and
    /// false (with a logged notice and an already-initialized
    /// notification) when the pool already has state.
    core::Result<bool> initialize(const auth::Capability& cap,
                                  const pool::PoolId& pool, uint64_t now);

    /// Apply one step: decay, cap entry or exit, periodic base-fee
    /// recompute, timestamp refresh.  FEE_NOT_INITIALIZED before
    /// initialize().  A @p now older than the last step counts as zero
    /// elapsed time.
    core::Result<FeeUpdate> notify_step(const auth::Capability& cap,
                                        const pool::PoolId& pool,
                                        bool was_capped, uint64_t now);

    /// Current base and surge fee at @p now.
    [[nodiscard]] core::Result<FeeQuote> get_fee_state(const pool::PoolId& pool,
                                                       uint64_t now) const;

    /// False for a pool without state.
    [[nodiscard]] bool is_cap_event_active(const pool::PoolId& pool) const;

    [[nodiscard]] bool is_initialized(const pool::PoolId& pool) const;

    [[nodiscard]] core::Result<FeeState> state(const pool::PoolId& pool) const;

    /// Packed word as stored, for tooling.
    [[nodiscard]] std::optional<core::uint256> raw_state(
        const pool::PoolId& pool) const;

    FeeNotifier& notifier() noexcept { return notifier_; }

private:
    [[nodiscard]] uint32_t initial_base_fee(const pool::PoolId& pool,
                                            const policy::PolicyParams& p) const;

    const policy::PolicyProvider& policy_;
    const oracle::CapacitySignal& capacity_;
    auth::CapabilityIssuer issuer_;
    FeeNotifier notifier_;
    pool::PoolStore<core::uint256> pools_;
};

} // namespace fee
