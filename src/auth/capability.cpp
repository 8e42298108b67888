// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auth/capability.h"
#include "core/logging.h"
#include "core/random.h"
#include "crypto/keccak.h"

#include <array>

namespace auth {

CapabilityIssuer::CapabilityIssuer(std::string domain,
                                   const pool::Address& owner)
    : domain_(std::move(domain)), owner_(owner) {
    std::array<uint8_t, core::uint256::SIZE> raw{};
    core::get_random_bytes(raw);
    salt_ = core::uint256::from_bytes(std::span<const uint8_t, 32>(raw));
}

core::uint256 CapabilityIssuer::derive_token(const pool::Address& writer,
                                             uint64_t epoch) const {
    crypto::Keccak256Hasher hasher;
    hasher.write_tag("dynfee/capability/v1")
          .write_tag(domain_)
          .write_blob(salt_)
          .write_blob(owner_)
          .write_blob(writer)
          .write_u64(epoch);
    return hasher.finalize();
}

core::Result<void> CapabilityIssuer::require_owner(
    const pool::Address& caller) const {
    if (caller != owner_) {
        LOG_WARN(core::LogCategory::AUTH,
                 domain_ + ": rejected non-owner " + caller.to_short_hex());
        return core::make_error(core::ErrorCode::AUTH_UNAUTHORIZED,
                                domain_ + ": caller is not the owner");
    }
    return core::make_ok();
}

core::Result<Capability> CapabilityIssuer::authorize(
    const pool::Address& caller, const pool::Address& writer) {
    DYNFEE_TRY_VOID(require_owner(caller));

    LOCK(mutex_);
    ++epoch_;
    writer_ = writer;
    token_ = derive_token(writer, epoch_);

    LOG_INFO(core::LogCategory::AUTH,
             domain_ + ": writer " + writer.to_short_hex() +
             " authorised (epoch " + std::to_string(epoch_) + ")");
    return Capability{writer, token_};
}

core::Result<void> CapabilityIssuer::revoke(const pool::Address& caller) {
    DYNFEE_TRY_VOID(require_owner(caller));

    LOCK(mutex_);
    ++epoch_;
    writer_.reset();
    token_ = core::uint256{};
    LOG_INFO(core::LogCategory::AUTH, domain_ + ": writer revoked");
    return core::make_ok();
}

core::Result<void> CapabilityIssuer::verify(const Capability& cap) const {
    bool valid = false;
    {
        LOCK(mutex_);
        valid = writer_.has_value() && *writer_ == cap.writer &&
                crypto::constant_time_equal(token_, cap.token);
    }
    if (!valid) {
        LOG_WARN(core::LogCategory::AUTH,
                 domain_ + ": rejected writer " + cap.writer.to_short_hex());
        return core::make_error(core::ErrorCode::AUTH_UNAUTHORIZED,
                                domain_ + ": invalid writer capability");
    }
    return core::make_ok();
}

std::optional<pool::Address> CapabilityIssuer::writer() const {
    LOCK(mutex_);
    return writer_;
}

uint64_t CapabilityIssuer::epoch() const {
    LOCK(mutex_);
    return epoch_;
}

} // namespace auth
