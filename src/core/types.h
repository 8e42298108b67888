#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array (little-endian internal storage)
// ---------------------------------------------------------------------------
// Base template for uint256 (N=32) and uint160 (N=20).
// Bytes are stored in LITTLE-ENDIAN order internally (least-significant byte
// at index 0).  Hex display uses BIG-ENDIAN order (most-significant byte
// first).  Bit offsets used by get_bits()/set_bits() count from the least
// significant bit of byte 0.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;
    static constexpr unsigned BITS = static_cast<unsigned>(N * 8);

    // -- Construction -------------------------------------------------------

    /// Default: zero-initialized.
    constexpr Blob() noexcept : bytes_{} {}

    /// Construct from a raw little-endian byte span.
    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Construct from a raw big-endian byte span (reverses into LE storage).
    static Blob from_bytes_be(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse a hex string in big-endian display order (up to 2*N hex
    /// chars, shorter input is zero-extended).  Accepts an optional "0x"
    /// prefix.  Throws std::invalid_argument on malformed input.
    static Blob from_hex(std::string_view hex);

    /// Non-throwing variant of from_hex().
    static std::optional<Blob> parse_hex(std::string_view hex) noexcept;

    // -- Serialization ------------------------------------------------------

    /// Return the big-endian hex string (2*N lower-case hex chars, no prefix).
    [[nodiscard]] std::string to_hex() const;

    /// First @p chars characters of to_hex(), for log lines.
    [[nodiscard]] std::string to_short_hex(std::size_t chars = 12) const;

    // -- Raw access ---------------------------------------------------------

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    // -- Bit fields ---------------------------------------------------------

    /// Read @p width bits (1..64) starting at bit @p offset.
    /// Bits beyond the end of the blob read as zero.
    [[nodiscard]] uint64_t get_bits(unsigned offset,
                                    unsigned width) const noexcept;

    /// Overwrite @p width bits (1..64) at @p offset with the low bits of
    /// @p value.  Higher bits of @p value are ignored; bits beyond the end
    /// of the blob are dropped.
    void set_bits(unsigned offset, unsigned width, uint64_t value) noexcept;

    // -- Queries ------------------------------------------------------------

    [[nodiscard]] bool is_zero() const noexcept;

    // -- Comparison (numeric, as big unsigned integers) ----------------------

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept;

protected:
    std::array<uint8_t, N> bytes_;
};

// ---------------------------------------------------------------------------
// uint256 -- 256-bit value (32 bytes): pool ids, packed state, digests
// ---------------------------------------------------------------------------
class uint256 : public Blob<32> {
public:
    using Blob<32>::Blob;

    // Re-expose static factories returning uint256 (not Blob<32>).
    static uint256 from_hex(std::string_view hex);
    static std::optional<uint256> parse_hex(std::string_view hex) noexcept;
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept;
    static uint256 from_bytes_be(std::span<const uint8_t, 32> bytes) noexcept;
};

// ---------------------------------------------------------------------------
// uint160 -- 160-bit value (20 bytes): account / contract addresses
// ---------------------------------------------------------------------------
class uint160 : public Blob<20> {
public:
    using Blob<20>::Blob;

    static uint160 from_hex(std::string_view hex);
    static std::optional<uint160> parse_hex(std::string_view hex) noexcept;
    static uint160 from_bytes(std::span<const uint8_t, 20> bytes) noexcept;
    static uint160 from_bytes_be(std::span<const uint8_t, 20> bytes) noexcept;
};

}  // namespace core

// ---------------------------------------------------------------------------
// std::hash specializations
// ---------------------------------------------------------------------------
template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};

template <>
struct std::hash<core::uint160> {
    std::size_t operator()(const core::uint160& v) const noexcept;
};
