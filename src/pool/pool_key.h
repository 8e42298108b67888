#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <cstdint>
#include <string>

namespace pool {

/// Opaque 32-byte pool identifier.  The oracle and fee manager use it only
/// as a map key.
using PoolId = core::uint256;

/// Account / contract address.
using Address = core::uint160;

/// Fee field value marking a pool whose LP fee is supplied by its hook.
inline constexpr uint32_t DYNAMIC_FEE_FLAG = 0x800000;

/// Largest tick spacing an AMM pool may declare.
inline constexpr int32_t MAX_TICK_SPACING = 32767;

// ---------------------------------------------------------------------------
// PoolKey -- the tuple that names a pool at the orchestration layer
// ---------------------------------------------------------------------------
struct PoolKey {
    Address  currency0;
    Address  currency1;
    uint32_t fee = DYNAMIC_FEE_FLAG;
    int32_t  tick_spacing = 60;
    Address  hooks;

    /// SHA3-256 over the fixed little-endian field layout.
    [[nodiscard]] PoolId to_id() const;

    /// currency0 < currency1 and tick_spacing in [1, MAX_TICK_SPACING].
    [[nodiscard]] core::Result<void> validate() const;

    [[nodiscard]] bool is_dynamic_fee() const noexcept {
        return fee == DYNAMIC_FEE_FLAG;
    }

    /// "c0/c1 fee=.. spacing=.." with shortened addresses.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const PoolKey& other) const = default;
};

/// Builds a key with the currencies sorted, as AMMs require.
[[nodiscard]] PoolKey make_pool_key(const Address& token_a,
                                    const Address& token_b,
                                    int32_t tick_spacing,
                                    const Address& hooks,
                                    uint32_t fee = DYNAMIC_FEE_FLAG);

} // namespace pool
