#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auth/capability.h"
#include "core/error.h"
#include "fee/fee_manager.h"
#include "hook/tick_source.h"
#include "oracle/trunc_oracle.h"
#include "pool/pool_key.h"

#include <cstdint>

namespace hook {

// ---------------------------------------------------------------------------
// SpotHook -- orchestration between the AMM, the oracle and the fees
// ---------------------------------------------------------------------------
// The hook is the designated writer of both the oracle and the fee
// manager: it holds one capability for each.  Per swap it reads the pool's
// tick, records it through the oracle (which truncates it) and feeds the
// cap flag into the fee controller.  Time comes from core::MockableClock.
// ---------------------------------------------------------------------------
class SpotHook {
public:
    SpotHook(const pool::Address& address,
             oracle::TruncOracle& oracle,
             fee::DynamicFeeManager& fees,
             const TickSource& ticks,
             auth::Capability oracle_cap,
             auth::Capability fee_cap);

    SpotHook(const SpotHook&) = delete;
    SpotHook& operator=(const SpotHook&) = delete;

    [[nodiscard]] const pool::Address& address() const noexcept { return address_; }

    /// Called once the AMM has created the pool.  The key must be valid,
    /// use the dynamic-fee flag and name this hook.  Enables the oracle
    /// (an already-enabled pool is accepted) and initialises the fee state
    /// (idempotent).
    core::Result<void> after_initialize(const pool::PoolKey& key, int32_t tick);

    /// Called after every swap.  If the oracle write fails the fee update
    /// is skipped and the error returned; committed state is unchanged.
    core::Result<fee::FeeUpdate> after_swap(const pool::PoolKey& key);

    /// Fee the next swap pays.
    [[nodiscard]] core::Result<fee::FeeQuote> current_fee(
        const pool::PoolKey& key) const;

private:
    [[nodiscard]] core::Result<void> check_key(const pool::PoolKey& key) const;

    const pool::Address      address_;
    oracle::TruncOracle&     oracle_;
    fee::DynamicFeeManager&  fees_;
    const TickSource&        ticks_;
    const auth::Capability   oracle_cap_;
    const auth::Capability   fee_cap_;
};

/// Wall or mock time as unsigned seconds, clamped to the oracle's 32-bit
/// timestamps.
[[nodiscard]] uint32_t clock_seconds();

} // namespace hook
