// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fee/fee_notify.h"
#include "core/logging.h"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>

namespace fee {

// Marks the calling thread as dispatching for the lifetime of the scope.
class FeeNotifier::DispatchScope {
public:
    explicit DispatchScope(FeeNotifier& notifier) : notifier_(notifier) {
        notifier_.dispatching_.push_back(std::this_thread::get_id());
    }

    ~DispatchScope() {
        LOCK(notifier_.mutex_);
        auto& threads = notifier_.dispatching_;
        threads.erase(std::find(threads.begin(), threads.end(),
                                std::this_thread::get_id()));
        notifier_.dispatch_done_.notify_all();
    }

    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

private:
    FeeNotifier& notifier_;
};

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

CallbackId FeeNotifier::on_state_change(StateChangeCallback callback) {
    LOCK(mutex_);
    const CallbackId id = next_id_++;
    state_callbacks_.push_back({id, std::move(callback)});
    LOG_DEBUG(core::LogCategory::FEE,
              "registered state-change callback id=" + std::to_string(id));
    return id;
}

CallbackId FeeNotifier::on_already_initialized(
    AlreadyInitializedCallback callback) {
    LOCK(mutex_);
    const CallbackId id = next_id_++;
    init_callbacks_.push_back({id, std::move(callback)});
    LOG_DEBUG(core::LogCategory::FEE,
              "registered already-initialized callback id=" +
              std::to_string(id));
    return id;
}

// ---------------------------------------------------------------------------
// Unregistration
// ---------------------------------------------------------------------------

bool FeeNotifier::remove_callback(CallbackId id) {
    LOCK(mutex_);

    std::size_t removed = 0;
    auto remove_from = [id, &removed](auto& vec) {
        auto it = std::remove_if(vec.begin(), vec.end(),
                                 [id](const auto& entry) {
                                     return entry.id == id;
                                 });
        removed += static_cast<std::size_t>(vec.end() - it);
        vec.erase(it, vec.end());
    };

    remove_from(state_callbacks_);
    remove_from(init_callbacks_);

    const auto self = std::this_thread::get_id();
    dispatch_done_.wait(mutex_, [&] {
        return std::all_of(dispatching_.begin(), dispatching_.end(),
                           [self](std::thread::id t) { return t == self; });
    });
    return removed != 0;
}

void FeeNotifier::clear_all() {
    LOCK(mutex_);
    state_callbacks_.clear();
    init_callbacks_.clear();
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
// The callback list is copied under the lock and invoked outside it, so a
// callback may register or remove callbacks without deadlocking.  The
// dispatching thread stays registered until the copy has been run.

void FeeNotifier::notify_state_change(const FeeEvent& event) {
    std::vector<StateEntry> callbacks;
    std::optional<DispatchScope> scope;
    {
        LOCK(mutex_);
        callbacks = state_callbacks_;
        scope.emplace(*this);
    }

    for (const auto& entry : callbacks) {
        try {
            entry.callback(event);
        } catch (const std::exception& e) {
            LOG_ERROR(core::LogCategory::FEE,
                      "state-change callback id=" + std::to_string(entry.id) +
                      " threw: " + e.what());
        }
    }
}

void FeeNotifier::notify_already_initialized(const pool::PoolId& pool) {
    std::vector<InitEntry> callbacks;
    std::optional<DispatchScope> scope;
    {
        LOCK(mutex_);
        callbacks = init_callbacks_;
        scope.emplace(*this);
    }

    for (const auto& entry : callbacks) {
        try {
            entry.callback(pool);
        } catch (const std::exception& e) {
            LOG_ERROR(core::LogCategory::FEE,
                      "already-initialized callback id=" +
                      std::to_string(entry.id) + " threw: " + e.what());
        }
    }
}

std::size_t FeeNotifier::callback_count() const {
    LOCK(mutex_);
    return state_callbacks_.size() + init_callbacks_.size();
}

} // namespace fee
