#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"
#include "fee/fee_notify.h"
#include "pool/pool_key.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace hook {

/// A transition of a pool's cap-event flag.
struct CapEdge {
    enum class Kind { START, END };

    Kind     kind;
    uint64_t timestamp;
    uint32_t base_fee_ppm;
    uint64_t surge_fee_ppm;
};

// ---------------------------------------------------------------------------
// FeeTracker -- monitor of one pool's fee notifications
// ---------------------------------------------------------------------------
// Subscribes on construction and unsubscribes on destruction, so it must
// not outlive the notifier.
// ---------------------------------------------------------------------------
class FeeTracker {
public:
    FeeTracker(fee::FeeNotifier& notifier, const pool::PoolId& pool);
    ~FeeTracker();

    FeeTracker(const FeeTracker&) = delete;
    FeeTracker& operator=(const FeeTracker&) = delete;

    [[nodiscard]] std::optional<fee::FeeEvent> latest() const;

    /// Events received for the tracked pool.
    [[nodiscard]] std::size_t event_count() const;

    [[nodiscard]] std::size_t cap_starts() const;
    [[nodiscard]] std::size_t cap_ends() const;
    [[nodiscard]] std::vector<CapEdge> edges() const;

private:
    void on_event(const fee::FeeEvent& event);

    fee::FeeNotifier&  notifier_;
    const pool::PoolId pool_;
    fee::CallbackId    callback_id_ = 0;

    mutable core::Mutex mutex_{"fee_tracker"};
    std::optional<fee::FeeEvent> latest_;
    std::size_t events_ = 0;
    std::vector<CapEdge> edges_;
};

} // namespace hook
