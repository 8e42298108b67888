#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/error.h"
#include "core/sync.h"
#include "policy/policy_params.h"
#include "pool/pool_key.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace policy {

// ---------------------------------------------------------------------------
// PolicyProvider -- read-only source of per-pool controller parameters
// ---------------------------------------------------------------------------
// The oracle and the fee manager only ever read through this interface;
// storing and governing parameters is the implementation's concern.
// ---------------------------------------------------------------------------
class PolicyProvider {
public:
    virtual ~PolicyProvider() = default;

    /// Effective (validated) parameters for @p pool: the pool's override
    /// where one exists, the global default otherwise.
    [[nodiscard]] virtual PolicyParams params(const pool::PoolId& pool) const = 0;

    // Per-field accessors.
    uint32_t target_caps_per_day(const pool::PoolId& pool) const {
        return params(pool).target_caps_per_day;
    }
    uint32_t cap_budget_decay_window_seconds(const pool::PoolId& pool) const {
        return params(pool).cap_budget_decay_window_seconds;
    }
    uint64_t freq_scaling_unit(const pool::PoolId& pool) const {
        return params(pool).freq_scaling_unit;
    }
    uint32_t min_base_fee_ppm(const pool::PoolId& pool) const {
        return params(pool).min_base_fee_ppm;
    }
    uint32_t max_base_fee_ppm(const pool::PoolId& pool) const {
        return params(pool).max_base_fee_ppm;
    }
    uint32_t max_step_ppm(const pool::PoolId& pool) const {
        return params(pool).max_step_ppm;
    }
    uint32_t base_fee_update_interval_seconds(const pool::PoolId& pool) const {
        return params(pool).base_fee_update_interval_seconds;
    }
    uint32_t surge_decay_period_seconds(const pool::PoolId& pool) const {
        return params(pool).surge_decay_period_seconds;
    }
    uint32_t surge_fee_multiplier_ppm(const pool::PoolId& pool) const {
        return params(pool).surge_fee_multiplier_ppm;
    }
    int32_t max_abs_tick_move(const pool::PoolId& pool) const {
        return params(pool).max_abs_tick_move;
    }
    uint32_t base_fee_factor_ppm(const pool::PoolId& pool) const {
        return params(pool).base_fee_factor_ppm;
    }
    uint32_t default_base_fee_ppm(const pool::PoolId& pool) const {
        return params(pool).default_base_fee_ppm;
    }
    oracle::CapMode cap_mode(const pool::PoolId& pool) const {
        return params(pool).cap_mode;
    }
    uint32_t block_duration_seconds(const pool::PoolId& pool) const {
        return params(pool).block_duration_seconds;
    }
};

// ---------------------------------------------------------------------------
// PolicyManager -- global defaults plus sparse per-pool overrides
// ---------------------------------------------------------------------------
// Every accepted change is validated as the merged parameter set it
// produces, so params() always returns a valid set.
// ---------------------------------------------------------------------------
class PolicyManager final : public PolicyProvider {
public:
    /// Starts from the built-in PolicyParams defaults.
    PolicyManager() = default;

    [[nodiscard]] PolicyParams params(const pool::PoolId& pool) const override;

    [[nodiscard]] PolicyParams defaults() const;

    /// Replace the global defaults.  Rejected (VALIDATION_RANGE) when the
    /// new defaults, or any pool's overrides on top of them, are invalid.
    core::Result<void> set_defaults(const PolicyParams& p);

    /// Merge @p ov into the pool's existing override.  The merged result
    /// must validate; otherwise nothing changes.
    core::Result<void> set_override(const pool::PoolId& pool,
                                    const PolicyOverride& ov);

    /// Remove the pool's override.  Returns false if it had none.
    bool clear_override(const pool::PoolId& pool);

    [[nodiscard]] bool has_override(const pool::PoolId& pool) const;
    [[nodiscard]] std::size_t override_count() const;

    /// Read the policy keys (core/config.h) as global defaults and every
    /// `pooloverride=<pool-id-hex>:<key>=<value>` entry.  CONFIG_PARSE for
    /// malformed entries, VALIDATION_RANGE for out-of-range results.
    /// The configuration is authoritative: on success it replaces the
    /// defaults and all existing overrides.  Nothing is applied unless the
    /// whole configuration is accepted.
    core::Result<void> load_config(const core::Config& config);

private:
    mutable core::SharedMutex mutex_{"policy_manager"};
    PolicyParams defaults_;
    std::unordered_map<pool::PoolId, PolicyOverride> overrides_;
};

} // namespace policy
