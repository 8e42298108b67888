#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/sync.h"
#include "pool/pool_key.h"

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace pool {

// ---------------------------------------------------------------------------
// PoolStore<T> -- sharded per-pool map
// ---------------------------------------------------------------------------
// Each of the 16 shards pairs an unordered_map with a SharedMutex, so
// readers of different pools (and concurrent readers of the same pool) do
// not contend.  Writers replace a pool's value as a whole: modify() works on
// a private copy and commits it only when the mutation succeeds, so a
// failed update leaves the stored value untouched.
//
// Only one shard lock is held at a time and no callback runs under a lock
// of another store, so the store cannot take part in a lock cycle.
// ---------------------------------------------------------------------------
template <typename T>
class PoolStore {
public:
    static constexpr std::size_t SHARD_COUNT = 16;

    PoolStore() = default;
    PoolStore(const PoolStore&) = delete;
    PoolStore& operator=(const PoolStore&) = delete;

    /// Copy of the value for @p id, if present.
    [[nodiscard]] std::optional<T> get(const PoolId& id) const {
        const Shard& shard = shard_for(id);
        READ_LOCK(shard.mutex);
        auto it = shard.map.find(id);
        if (it == shard.map.end()) return std::nullopt;
        return it->second;
    }

    /// Invoke @p visit(const T&) under the shard's shared lock.
    /// Returns false (without calling @p visit) when @p id is absent.
    template <typename F>
    bool read(const PoolId& id, F&& visit) const {
        const Shard& shard = shard_for(id);
        READ_LOCK(shard.mutex);
        auto it = shard.map.find(id);
        if (it == shard.map.end()) return false;
        std::forward<F>(visit)(it->second);
        return true;
    }

    /// Insert @p value unless @p id already has one.  Returns true when
    /// the value was inserted.
    bool insert_if_absent(const PoolId& id, T value) {
        Shard& shard = shard_for(id);
        WRITE_LOCK(shard.mutex);
        return shard.map.try_emplace(id, std::move(value)).second;
    }

    /// Insert or replace the value for @p id.
    void put(const PoolId& id, T value) {
        Shard& shard = shard_for(id);
        WRITE_LOCK(shard.mutex);
        shard.map.insert_or_assign(id, std::move(value));
    }

    /// Copy-mutate-commit.  @p mutate has the signature
    /// `core::Result<R>(T&)`; the copy replaces the stored value only if
    /// the result is ok.  An absent @p id yields an error with code
    /// @p missing.
    template <typename F>
    auto modify(const PoolId& id, core::ErrorCode missing, F&& mutate)
        -> std::invoke_result_t<F, T&> {
        using R = std::invoke_result_t<F, T&>;
        Shard& shard = shard_for(id);
        WRITE_LOCK(shard.mutex);
        auto it = shard.map.find(id);
        if (it == shard.map.end()) {
            return R{core::make_error(missing,
                                      "unknown pool " + id.to_short_hex())};
        }
        T working = it->second;
        R result = std::forward<F>(mutate)(working);
        if (result.ok()) {
            it->second = std::move(working);
        }
        return result;
    }

    [[nodiscard]] bool contains(const PoolId& id) const {
        const Shard& shard = shard_for(id);
        READ_LOCK(shard.mutex);
        return shard.map.count(id) != 0;
    }

    /// Total number of pools across all shards (not a snapshot under
    /// concurrent inserts).
    [[nodiscard]] std::size_t size() const {
        std::size_t total = 0;
        for (const Shard& shard : shards_) {
            READ_LOCK(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

private:
    struct Shard {
        Shard() : mutex("pool_store.shard") {}
        mutable core::SharedMutex mutex;
        std::unordered_map<PoolId, T> map;
    };

    Shard& shard_for(const PoolId& id) {
        return shards_[std::hash<PoolId>{}(id) % SHARD_COUNT];
    }
    const Shard& shard_for(const PoolId& id) const {
        return shards_[std::hash<PoolId>{}(id) % SHARD_COUNT];
    }

    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace pool
