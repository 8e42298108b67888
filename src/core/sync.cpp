// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"
#include "core/logging.h"

#include <atomic>
#include <vector>

namespace core {

namespace {

std::atomic<uint64_t> g_next_order_id{1};

#ifndef NDEBUG
/// Locks currently held by this thread, earliest first.
thread_local std::vector<const LockOrderTag*> t_held_locks;
#endif

}  // namespace

LockOrderTag::LockOrderTag(std::string_view name)
    : name_(name),
      order_(g_next_order_id.fetch_add(1, std::memory_order_relaxed))
{
}

void LockOrderTag::note_acquired() const
{
#ifndef NDEBUG
    for (const LockOrderTag* held : t_held_locks) {
        if (held->order() >= order_) {
            LOG_WARN(LogCategory::LOCK,
                     "potential deadlock: holding '" + held->name() +
                     "' (order " + std::to_string(held->order()) +
                     ") while acquiring '" + name_ + "' (order " +
                     std::to_string(order_) + ")");
            break;
        }
    }
    t_held_locks.push_back(this);
#endif
}

void LockOrderTag::note_released() const
{
#ifndef NDEBUG
    // Release order is not always LIFO; erase the most recent match.
    for (auto it = t_held_locks.rbegin(); it != t_held_locks.rend(); ++it) {
        if (*it == this) {
            t_held_locks.erase(std::next(it).base());
            return;
        }
    }
#endif
}

std::size_t held_lock_count()
{
#ifndef NDEBUG
    return t_held_locks.size();
#else
    return 0;
#endif
}

}  // namespace core
