#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Keccak-256 (SHA3-256) wrapper around the OpenSSL 3.0+ EVP API.
//
// Used for pool identifiers and capability tokens.  The "keccak256" name
// follows the AMM ecosystem's convention; the primitive is NIST SHA3-256.
// Integer writers encode little-endian so digests are platform-independent.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

struct evp_md_ctx_st;       // EVP_MD_CTX
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

/// Compute SHA3-256 of a byte span.
[[nodiscard]] core::uint256 keccak256(std::span<const uint8_t> data);

/// Constant-time equality of two 256-bit values (OpenSSL CRYPTO_memcmp).
[[nodiscard]] bool constant_time_equal(const core::uint256& a,
                                       const core::uint256& b) noexcept;

// ===================================================================
// Incremental hasher (streaming interface)
// ===================================================================

/// Move-only incremental SHA3-256 hasher backed by an EVP_MD_CTX.
/// Feed data with the write_* methods and obtain the digest with
/// finalize().  A finalised hasher rejects further writes.
class Keccak256Hasher {
public:
    Keccak256Hasher();
    ~Keccak256Hasher();

    Keccak256Hasher(const Keccak256Hasher&) = delete;
    Keccak256Hasher& operator=(const Keccak256Hasher&) = delete;

    Keccak256Hasher(Keccak256Hasher&& other) noexcept;
    Keccak256Hasher& operator=(Keccak256Hasher&& other) noexcept;

    Keccak256Hasher& write(std::span<const uint8_t> data);

    /// Length-prefixed string, used for domain separation tags.
    Keccak256Hasher& write_tag(std::string_view tag);

    Keccak256Hasher& write_u32(uint32_t v);
    Keccak256Hasher& write_u64(uint64_t v);
    Keccak256Hasher& write_i32(int32_t v);

    template <std::size_t N>
    Keccak256Hasher& write_blob(const core::Blob<N>& blob) {
        return write(std::span<const uint8_t>(blob.data(), N));
    }

    /// Produce the 32-byte digest.  Throws std::runtime_error on a second
    /// call.
    [[nodiscard]] core::uint256 finalize();

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

}  // namespace crypto
