#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Saturating 128-bit integer helpers.
//
// Every accumulator and fee computation goes through these: results clamp
// at the representable bound instead of wrapping.  The 128-bit types are
// the GCC/Clang builtins (the same compilers the DYNFEE_TRY statement
// expression already requires).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <limits>
#include <string>

namespace core {

using uint128 = unsigned __int128;
using int128  = __int128;

inline constexpr uint128 UINT128_MAX_VALUE = ~uint128{0};

/// Largest value representable in @p bits bits (bits in 1..128).
[[nodiscard]] constexpr uint128 max_for_bits(unsigned bits) noexcept {
    return bits >= 128 ? UINT128_MAX_VALUE : (uint128{1} << bits) - 1;
}

[[nodiscard]] constexpr uint128 clamp_to_bits(uint128 v, unsigned bits) noexcept {
    const uint128 cap = max_for_bits(bits);
    return v > cap ? cap : v;
}

/// min(a + b, cap)
[[nodiscard]] constexpr uint128 sat_add(uint128 a, uint128 b,
                                        uint128 cap = UINT128_MAX_VALUE) noexcept {
    if (a >= cap || b >= cap - a) return cap;
    return a + b;
}

/// max(a - b, 0)
[[nodiscard]] constexpr uint128 sat_sub(uint128 a, uint128 b) noexcept {
    return a > b ? a - b : 0;
}

/// min(a * b, cap)
[[nodiscard]] constexpr uint128 sat_mul(uint128 a, uint128 b,
                                        uint128 cap = UINT128_MAX_VALUE) noexcept {
    if (a == 0 || b == 0) return 0;
    if (a > cap / b) return cap;
    const uint128 p = a * b;
    return p > cap ? cap : p;
}

/// floor(a * b / d).  Saturates at UINT128_MAX_VALUE when d == 0 or the
/// intermediate product does not fit in 128 bits.
[[nodiscard]] constexpr uint128 mul_div(uint128 a, uint128 b, uint128 d) noexcept {
    if (d == 0) return UINT128_MAX_VALUE;
    if (a == 0 || b == 0) return 0;
    if (a > UINT128_MAX_VALUE / b) return UINT128_MAX_VALUE;
    return (a * b) / d;
}

/// Clamp a signed 128-bit value into int64_t.
[[nodiscard]] constexpr int64_t sat_to_int64(int128 v) noexcept {
    constexpr int128 hi = std::numeric_limits<int64_t>::max();
    constexpr int128 lo = std::numeric_limits<int64_t>::min();
    if (v > hi) return std::numeric_limits<int64_t>::max();
    if (v < lo) return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(v);
}

/// Clamp an unsigned 128-bit value into uint64_t.
[[nodiscard]] constexpr uint64_t sat_to_uint64(uint128 v) noexcept {
    constexpr uint128 hi = std::numeric_limits<uint64_t>::max();
    return v > hi ? std::numeric_limits<uint64_t>::max()
                  : static_cast<uint64_t>(v);
}

/// Decimal rendering (iostreams have no 128-bit overload).
[[nodiscard]] inline std::string to_string(uint128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    return out;
}

} // namespace core
