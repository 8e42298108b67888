#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auth/capability.h"
#include "core/error.h"
#include "oracle/observations.h"
#include "policy/policy_manager.h"
#include "pool/pool_store.h"

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace oracle {

/// Default number of samples retained per pool.
inline constexpr uint16_t DEFAULT_SAMPLE_CAPACITY = 24;

// ---------------------------------------------------------------------------
// CapacitySignal -- per-pool "max ticks per block"
// ---------------------------------------------------------------------------
class CapacitySignal {
public:
    virtual ~CapacitySignal() = default;

    /// nullopt when the pool has no oracle data.
    [[nodiscard]] virtual std::optional<int32_t> max_ticks_per_block(
        const pool::PoolId& pool) const = 0;
};

// ---------------------------------------------------------------------------
// TruncOracle -- truncated tick oracle for many pools
// ---------------------------------------------------------------------------
// Writes (enable_pool, push_observation) require the capability issued by
// the owner to the single designated writer; everything else is a free
// read.  Each pool's state is replaced as a whole, so a failed write leaves
// nothing behind.
// ---------------------------------------------------------------------------
class TruncOracle final : public CapacitySignal {
public:
    TruncOracle(const pool::Address& owner,
                const policy::PolicyProvider& policy,
                uint16_t sample_capacity = DEFAULT_SAMPLE_CAPACITY);

    TruncOracle(const TruncOracle&) = delete;
    TruncOracle& operator=(const TruncOracle&) = delete;

    /// Owner only.  Replaces any previous writer.
    core::Result<auth::Capability> authorize_writer(const pool::Address& caller,
                                                    const pool::Address& writer);

    /// Start recording @p pool at @p tick, sized to the sample capacity.
    /// ORACLE_ALREADY_ENABLED when already enabled.
    core::Result<ObservationState> enable_pool(const auth::Capability& cap,
                                               const pool::PoolId& pool,
                                               int32_t tick, uint32_t now);

    /// Record the pool's current tick, truncated to max_ticks_per_block.
    /// The limit is read from the pool's policy on every write unless the
    /// owner has pinned one with set_max_ticks_per_block.
    core::Result<WriteResult> push_observation(const auth::Capability& cap,
                                               const pool::PoolId& pool,
                                               int32_t tick, uint32_t now);

    /// Grow the pool's ring.  Open to any caller, never shrinks.
    core::Result<std::pair<uint16_t, uint16_t>> increase_cardinality_next(
        const pool::PoolId& pool, uint16_t next);

    [[nodiscard]] core::Result<std::vector<int64_t>> observe(
        const pool::PoolId& pool, uint32_t now,
        std::span<const uint32_t> seconds_agos) const;

    [[nodiscard]] core::Result<Observation> latest_observation(
        const pool::PoolId& pool) const;

    /// Zero state (cardinality 0) for a pool that is not enabled.
    [[nodiscard]] ObservationState observation_state(
        const pool::PoolId& pool) const;

    [[nodiscard]] bool is_enabled(const pool::PoolId& pool) const;

    [[nodiscard]] std::optional<int32_t> max_ticks_per_block(
        const pool::PoolId& pool) const override;

    /// Owner only; value must lie in [0, full tick range].  Takes priority
    /// over later policy changes for this pool.
    core::Result<void> set_max_ticks_per_block(const pool::Address& caller,
                                               const pool::PoolId& pool,
                                               int32_t value);

    [[nodiscard]] uint16_t sample_capacity() const noexcept { return sample_capacity_; }

private:
    struct PoolOracle {
        ObservationBuffer buffer;
        std::optional<int32_t> pinned_max_ticks;
    };

    [[nodiscard]] int32_t effective_limit(const pool::PoolId& pool,
                                          const PoolOracle& entry) const;

    const policy::PolicyProvider& policy_;
    const uint16_t sample_capacity_;
    auth::CapabilityIssuer issuer_;
    pool::PoolStore<PoolOracle> pools_;
};

} // namespace oracle
