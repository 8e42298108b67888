#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstdint>
#include <span>

namespace core {

// Fill |buf| with cryptographically secure random bytes (OpenSSL RAND_bytes).
// Throws std::runtime_error on failure.
void get_random_bytes(std::span<uint8_t> buf);

// Return a single cryptographically secure random 64-bit integer.
uint64_t get_random_uint64();

// ---------------------------------------------------------------------------
// InsecureRandom -- fast, non-cryptographic PRNG (xoshiro256**)
// ---------------------------------------------------------------------------
// Deterministic for a given non-zero seed; drives the price walks of the
// simulator.  Do NOT use for capability salts.
class InsecureRandom {
public:
    // If |seed| is 0 the generator is seeded from get_random_bytes().
    explicit InsecureRandom(uint64_t seed = 0);

    // Return the next pseudo-random 64-bit value.
    uint64_t next();

    // Return a uniform pseudo-random value in [0, max).
    // Throws std::invalid_argument if max == 0.
    uint64_t range(uint64_t max);

    // Return a uniform pseudo-random value in [lo, hi] (inclusive).
    // Throws std::invalid_argument if lo > hi.
    int64_t uniform(int64_t lo, int64_t hi);

private:
    void seed_from(uint64_t value);

    std::array<uint64_t, 4> state_{};
};

}  // namespace core
