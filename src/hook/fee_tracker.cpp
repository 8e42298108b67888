// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hook/fee_tracker.h"
#include "core/logging.h"

#include <algorithm>
#include <string>

namespace hook {

FeeTracker::FeeTracker(fee::FeeNotifier& notifier, const pool::PoolId& pool)
    : notifier_(notifier), pool_(pool) {
    callback_id_ = notifier_.on_state_change(
        [this](const fee::FeeEvent& event) { on_event(event); });
}

FeeTracker::~FeeTracker() {
    notifier_.remove_callback(callback_id_);
}

void FeeTracker::on_event(const fee::FeeEvent& event) {
    if (event.pool != pool_) return;

    LOCK(mutex_);
    const bool was_in_cap = latest_ && latest_->in_cap;
    if (event.in_cap != was_in_cap) {
        const CapEdge::Kind kind =
            event.in_cap ? CapEdge::Kind::START : CapEdge::Kind::END;
        edges_.push_back(CapEdge{kind, event.timestamp, event.base_fee_ppm,
                                 event.surge_fee_ppm});
        LOG_DEBUG(core::LogCategory::HOOK,
                  "pool " + pool_.to_short_hex() + ": cap " +
                  (event.in_cap ? "START" : "END") + " at " +
                  std::to_string(event.timestamp));
    }
    latest_ = event;
    ++events_;
}

std::optional<fee::FeeEvent> FeeTracker::latest() const {
    LOCK(mutex_);
    return latest_;
}

std::size_t FeeTracker::event_count() const {
    LOCK(mutex_);
    return events_;
}

std::size_t FeeTracker::cap_starts() const {
    LOCK(mutex_);
    return static_cast<std::size_t>(
        std::count_if(edges_.begin(), edges_.end(), [](const CapEdge& e) {
            return e.kind == CapEdge::Kind::START;
        }));
}

std::size_t FeeTracker::cap_ends() const {
    LOCK(mutex_);
    return static_cast<std::size_t>(
        std::count_if(edges_.begin(), edges_.end(), [](const CapEdge& e) {
            return e.kind == CapEdge::Kind::END;
        }));
}

std::vector<CapEdge> FeeTracker::edges() const {
    LOCK(mutex_);
    return edges_;
}

} // namespace hook
