#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"
#include "pool/pool_key.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

namespace fee {

/// Externally observable fee tuple of one pool at one moment.
struct FeeEvent {
    pool::PoolId pool;
    uint32_t base_fee_ppm = 0;
    uint64_t surge_fee_ppm = 0;
    bool     in_cap = false;
    uint64_t timestamp = 0;
};

// ---------------------------------------------------------------------------
// FeeNotifier -- callbacks for fee controller events
// ---------------------------------------------------------------------------
// Monitors and indexers register here.  Callbacks are dispatched
// synchronously on the thread that committed the change, after every
// store lock has been released, so a callback may read the fee manager.
// Callbacks must be lightweight and non-blocking.
// ---------------------------------------------------------------------------

using StateChangeCallback = std::function<void(const FeeEvent& event)>;

using AlreadyInitializedCallback =
    std::function<void(const pool::PoolId& pool)>;

/// Unique identifier for a registered callback, used for unregistration.
using CallbackId = uint64_t;

class FeeNotifier {
public:
    FeeNotifier() = default;

    FeeNotifier(const FeeNotifier&) = delete;
    FeeNotifier& operator=(const FeeNotifier&) = delete;

    // -- Registration -------------------------------------------------------

    /// Invoked whenever (base fee, surge fee, in_cap) of a pool changes.
    CallbackId on_state_change(StateChangeCallback callback);

    /// Invoked when initialize() finds the pool already initialised.
    CallbackId on_already_initialized(AlreadyInitializedCallback callback);

    // -- Unregistration -----------------------------------------------------

    /// Returns false if no callback has @p id.  Blocks until dispatches
    /// running on other threads have finished, so the callback is never
    /// invoked after this returns.  Called from inside a callback, it does
    /// not wait for the calling thread's own dispatch.
    bool remove_callback(CallbackId id);

    void clear_all();

    // -- Notification dispatch ----------------------------------------------

    void notify_state_change(const FeeEvent& event);
    void notify_already_initialized(const pool::PoolId& pool);

    [[nodiscard]] std::size_t callback_count() const;

private:
    struct StateEntry {
        CallbackId id;
        StateChangeCallback callback;
    };

    struct InitEntry {
        CallbackId id;
        AlreadyInitializedCallback callback;
    };

    class DispatchScope;

    mutable core::Mutex mutex_{"fee_notifier"};
    std::condition_variable_any dispatch_done_;
    std::vector<std::thread::id> dispatching_;
    CallbackId next_id_ = 1;
    std::vector<StateEntry> state_callbacks_;
    std::vector<InitEntry> init_callbacks_;
};

} // namespace fee
