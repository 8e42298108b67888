#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "pool/pool_key.h"

#include <cstdint>

namespace hook {

// ---------------------------------------------------------------------------
// TickSource -- the AMM's current price tick per pool
// ---------------------------------------------------------------------------
// Queried once per swap, before the tick is classified and recorded.
// ---------------------------------------------------------------------------
class TickSource {
public:
    virtual ~TickSource() = default;

    /// Current tick of @p pool.  An error when the pool is unknown.
    [[nodiscard]] virtual core::Result<int32_t> current_tick(
        const pool::PoolId& pool) const = 0;
};

} // namespace hook
