#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/sync.h"
#include "core/types.h"
#include "pool/pool_key.h"

#include <cstdint>
#include <optional>
#include <string>

namespace auth {

// ---------------------------------------------------------------------------
// Capability -- proof that the holder is the designated writer
// ---------------------------------------------------------------------------
// Issued by a component's owner through CapabilityIssuer::authorize() and
// passed explicitly into every mutating call.  The token binds the issuing
// component (domain), a per-issuer random salt, the owner, the writer and
// the authorisation epoch, so it cannot be forged from public data or
// replayed across components or after the writer is replaced.
// ---------------------------------------------------------------------------
struct Capability {
    pool::Address writer;
    core::uint256 token;
};

class CapabilityIssuer {
public:
    /// @p domain separates the tokens of different components
    /// (e.g. "oracle", "fee").  The salt is drawn from the OpenSSL RNG.
    CapabilityIssuer(std::string domain, const pool::Address& owner);

    CapabilityIssuer(const CapabilityIssuer&) = delete;
    CapabilityIssuer& operator=(const CapabilityIssuer&) = delete;

    /// Designate @p writer as the single writer and return its capability.
    /// Only the owner may call this; every earlier capability stops
    /// verifying.  AUTH_UNAUTHORIZED for any other caller.
    core::Result<Capability> authorize(const pool::Address& caller,
                                       const pool::Address& writer);

    /// Drop the current writer.  Owner only.
    core::Result<void> revoke(const pool::Address& caller);

    /// ok when @p cap is the current writer's capability, otherwise
    /// AUTH_UNAUTHORIZED.  Token comparison is constant-time.
    [[nodiscard]] core::Result<void> verify(const Capability& cap) const;

    /// AUTH_UNAUTHORIZED unless @p caller is the owner.
    [[nodiscard]] core::Result<void> require_owner(
        const pool::Address& caller) const;

    [[nodiscard]] const pool::Address& owner() const noexcept { return owner_; }
    [[nodiscard]] std::optional<pool::Address> writer() const;
    [[nodiscard]] uint64_t epoch() const;

private:
    [[nodiscard]] core::uint256 derive_token(const pool::Address& writer,
                                             uint64_t epoch) const;

    const std::string   domain_;
    const pool::Address owner_;
    core::uint256       salt_;

    mutable core::Mutex mutex_{"capability_issuer"};
    uint64_t            epoch_ = 0;
    std::optional<pool::Address> writer_;
    core::uint256       token_;
};

} // namespace auth
