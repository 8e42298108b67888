// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_key.h"
#include "crypto/keccak.h"

namespace pool {

PoolId PoolKey::to_id() const {
    crypto::Keccak256Hasher hasher;
    hasher.write_tag("dynfee/poolkey/v1")
          .write_blob(currency0)
          .write_blob(currency1)
          .write_u32(fee)
          .write_i32(tick_spacing)
          .write_blob(hooks);
    return hasher.finalize();
}

core::Result<void> PoolKey::validate() const {
    if (!(currency0 < currency1)) {
        return core::make_error(core::ErrorCode::VALIDATION_ERROR,
                                "currency0 must sort below currency1");
    }
    if (tick_spacing < 1 || tick_spacing > MAX_TICK_SPACING) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                "tick spacing " +
                                std::to_string(tick_spacing) +
                                " out of range");
    }
    return core::make_ok();
}

std::string PoolKey::to_string() const {
    return currency0.to_short_hex(8) + "/" + currency1.to_short_hex(8) +
           " fee=" + (is_dynamic_fee() ? std::string("dynamic")
                                       : std::to_string(fee)) +
           " spacing=" + std::to_string(tick_spacing);
}

PoolKey make_pool_key(const Address& token_a, const Address& token_b,
                      int32_t tick_spacing, const Address& hooks,
                      uint32_t fee) {
    PoolKey key;
    key.currency0 = token_a < token_b ? token_a : token_b;
    key.currency1 = token_a < token_b ? token_b : token_a;
    key.fee = fee;
    key.tick_spacing = tick_spacing;
    key.hooks = hooks;
    return key;
}

} // namespace pool
