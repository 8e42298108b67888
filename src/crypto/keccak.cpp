// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <array>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace crypto {

namespace {

template <typename UInt>
std::array<uint8_t, sizeof(UInt)> to_le_bytes(UInt v) {
    std::array<uint8_t, sizeof(UInt)> out{};
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return out;
}

}  // namespace

core::uint256 keccak256(std::span<const uint8_t> data) {
    Keccak256Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

bool constant_time_equal(const core::uint256& a,
                         const core::uint256& b) noexcept {
    return CRYPTO_memcmp(a.data(), b.data(), core::uint256::SIZE) == 0;
}

// ===================================================================
// Keccak256Hasher
// ===================================================================

Keccak256Hasher::Keccak256Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_MD_CTX_new() allocation failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error(
            "Keccak256Hasher: EVP_DigestInit_ex() failed");
    }
}

Keccak256Hasher::~Keccak256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Keccak256Hasher::Keccak256Hasher(Keccak256Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Keccak256Hasher& Keccak256Hasher::operator=(
    Keccak256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Keccak256Hasher& Keccak256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Keccak256Hasher::write(): context consumed");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Keccak256Hasher::write(): EVP_DigestUpdate() failed");
    }
    return *this;
}

Keccak256Hasher& Keccak256Hasher::write_tag(std::string_view tag) {
    write_u32(static_cast<uint32_t>(tag.size()));
    return write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(tag.data()), tag.size()));
}

Keccak256Hasher& Keccak256Hasher::write_u32(uint32_t v) {
    auto bytes = to_le_bytes(v);
    return write(bytes);
}

Keccak256Hasher& Keccak256Hasher::write_u64(uint64_t v) {
    auto bytes = to_le_bytes(v);
    return write(bytes);
}

Keccak256Hasher& Keccak256Hasher::write_i32(int32_t v) {
    return write_u32(static_cast<uint32_t>(v));
}

core::uint256 Keccak256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): context consumed");
    }

    std::array<uint8_t, 32> buf{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, buf.data(), &digest_len) != 1 ||
        digest_len != buf.size()) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;

    return core::uint256::from_bytes(std::span<const uint8_t, 32>(buf));
}

}  // namespace crypto
