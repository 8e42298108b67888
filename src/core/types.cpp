// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <stdexcept>

namespace core {

// ===========================================================================
// Internal hex helpers
// ===========================================================================

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Returns -1 on invalid input.
constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Decode big-endian hex into little-endian storage.  Returns false on a
/// bad character or an over-long input.
template <std::size_t N>
bool decode_hex(std::string_view hex, std::array<uint8_t, N>& out) noexcept {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() > N * 2) return false;

    out.fill(0);
    // Walk from the least significant nibble (end of string) upward.
    for (std::size_t i = 0; i < hex.size(); ++i) {
        int v = hex_digit_value(hex[hex.size() - 1 - i]);
        if (v < 0) return false;
        out[i / 2] |= static_cast<uint8_t>((i % 2 == 0) ? v : (v << 4));
    }
    return true;
}

uint64_t fnv1a(const uint8_t* data, std::size_t len) noexcept {
    uint64_t h = 14695981039346656037ULL;  // FNV offset basis (64-bit)
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= 1099511628211ULL;             // FNV prime (64-bit)
    }
    return h;
}

}  // namespace

// ===========================================================================
// Blob<N> -- template method definitions
// ===========================================================================
// Explicit instantiations at the bottom of this file cover N=32 and N=20.

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_bytes_be(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::reverse_copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    Blob<N> result;
    if (!decode_hex<N>(hex, result.bytes_)) {
        throw std::invalid_argument(
            "Blob::from_hex: malformed or over-long hex (max " +
            std::to_string(N * 2) + " chars)");
    }
    return result;
}

template <std::size_t N>
std::optional<Blob<N>> Blob<N>::parse_hex(std::string_view hex) noexcept {
    Blob<N> result;
    if (!decode_hex<N>(hex, result.bytes_)) return std::nullopt;
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    std::string out;
    out.reserve(N * 2);
    for (std::size_t i = N; i > 0; --i) {
        uint8_t byte = bytes_[i - 1];
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

template <std::size_t N>
std::string Blob<N>::to_short_hex(std::size_t chars) const {
    return to_hex().substr(0, chars);
}

template <std::size_t N>
uint64_t Blob<N>::get_bits(unsigned offset, unsigned width) const noexcept {
    if (width == 0) return 0;
    if (width > 64) width = 64;

    uint64_t value = 0;
    for (unsigned i = 0; i < width; ++i) {
        unsigned bit = offset + i;
        if (bit >= BITS) break;
        if ((bytes_[bit / 8] >> (bit % 8)) & 1u) {
            value |= uint64_t{1} << i;
        }
    }
    return value;
}

template <std::size_t N>
void Blob<N>::set_bits(unsigned offset, unsigned width,
                       uint64_t value) noexcept {
    if (width > 64) width = 64;
    for (unsigned i = 0; i < width; ++i) {
        unsigned bit = offset + i;
        if (bit >= BITS) break;
        const auto mask = static_cast<uint8_t>(1u << (bit % 8));
        if ((value >> i) & 1u) {
            bytes_[bit / 8] |= mask;
        } else {
            bytes_[bit / 8] &= static_cast<uint8_t>(~mask);
        }
    }
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    // Little-endian storage: compare from the most significant byte down.
    for (std::size_t i = N; i > 0; --i) {
        if (bytes_[i - 1] != other.bytes_[i - 1]) {
            return bytes_[i - 1] < other.bytes_[i - 1]
                       ? std::strong_ordering::less
                       : std::strong_ordering::greater;
        }
    }
    return std::strong_ordering::equal;
}

template <std::size_t N>
bool Blob<N>::operator==(const Blob& other) const noexcept {
    return bytes_ == other.bytes_;
}

template class Blob<32>;
template class Blob<20>;

// ===========================================================================
// uint256 / uint160 -- factory methods
// ===========================================================================

uint256 uint256::from_hex(std::string_view hex) {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_hex(hex);
    return result;
}

std::optional<uint256> uint256::parse_hex(std::string_view hex) noexcept {
    auto blob = Blob<32>::parse_hex(hex);
    if (!blob) return std::nullopt;
    uint256 result;
    static_cast<Blob<32>&>(result) = *blob;
    return result;
}

uint256 uint256::from_bytes(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_bytes(bytes);
    return result;
}

uint256 uint256::from_bytes_be(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_bytes_be(bytes);
    return result;
}

uint160 uint160::from_hex(std::string_view hex) {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_hex(hex);
    return result;
}

std::optional<uint160> uint160::parse_hex(std::string_view hex) noexcept {
    auto blob = Blob<20>::parse_hex(hex);
    if (!blob) return std::nullopt;
    uint160 result;
    static_cast<Blob<20>&>(result) = *blob;
    return result;
}

uint160 uint160::from_bytes(std::span<const uint8_t, 20> bytes) noexcept {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_bytes(bytes);
    return result;
}

uint160 uint160::from_bytes_be(std::span<const uint8_t, 20> bytes) noexcept {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_bytes_be(bytes);
    return result;
}

}  // namespace core

// ===========================================================================
// std::hash specializations (FNV-1a, not cryptographic)
// ===========================================================================

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    return static_cast<std::size_t>(core::fnv1a(v.data(), v.size()));
}

std::size_t std::hash<core::uint160>::operator()(
    const core::uint160& v) const noexcept {
    return static_cast<std::size_t>(core::fnv1a(v.data(), v.size()));
}
