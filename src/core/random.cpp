// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/random.h"

#include <bit>
#include <stdexcept>

#include <openssl/rand.h>

namespace core {

// ---------------------------------------------------------------------------
// Cryptographic helpers
// ---------------------------------------------------------------------------

void get_random_bytes(std::span<uint8_t> buf) {
    if (buf.empty()) {
        return;
    }
    // RAND_bytes returns 1 on success, 0 or -1 on failure.
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error(
            "core::get_random_bytes: RAND_bytes failed"
        );
    }
}

uint64_t get_random_uint64() {
    uint64_t value = 0;
    get_random_bytes(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(&value), sizeof(value)));
    return value;
}

// ---------------------------------------------------------------------------
// InsecureRandom -- xoshiro256** (Blackman & Vigna 2018)
// ---------------------------------------------------------------------------

// splitmix64 expands a single 64-bit seed into the 256-bit state.
static uint64_t splitmix64(uint64_t& state) {
    state += 0x9E3779B97F4A7C15ULL;
    uint64_t z = state;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

void InsecureRandom::seed_from(uint64_t value) {
    uint64_t sm = value;
    for (auto& word : state_) {
        word = splitmix64(sm);
    }
}

InsecureRandom::InsecureRandom(uint64_t seed) {
    // splitmix64 never yields an all-zero state, which would be degenerate.
    seed_from(seed != 0 ? seed : get_random_uint64() | 1);
}

uint64_t InsecureRandom::next() {
    const uint64_t result = std::rotl(state_[1] * 5, 7) * 9;
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];

    state_[2] ^= t;
    state_[3] = std::rotl(state_[3], 45);

    return result;
}

uint64_t InsecureRandom::range(uint64_t max) {
    if (max == 0) {
        throw std::invalid_argument("InsecureRandom::range: max must be > 0");
    }
    if (max == 1) {
        return 0;
    }

    // Rejection sampling: drop the tail that would bias value % max.
    const uint64_t threshold = (-max) % max;  // (2^64 - max) % max
    for (;;) {
        const uint64_t value = next();
        if (value >= threshold) {
            return value % max;
        }
    }
}

int64_t InsecureRandom::uniform(int64_t lo, int64_t hi) {
    if (lo > hi) {
        throw std::invalid_argument("InsecureRandom::uniform: lo > hi");
    }
    const uint64_t span = static_cast<uint64_t>(hi) - static_cast<uint64_t>(lo);
    if (span == UINT64_MAX) {
        return static_cast<int64_t>(next());
    }
    return static_cast<int64_t>(static_cast<uint64_t>(lo) + range(span + 1));
}

}  // namespace core
