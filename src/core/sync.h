#pragma once

// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LockOrderTag -- identity shared by Mutex and SharedMutex
// ---------------------------------------------------------------------------

/// Name plus a process-unique order ID.  In debug builds every exclusive
/// acquisition is checked against the locks the thread already holds: a
/// thread must acquire locks in increasing order ID.
class LockOrderTag {
public:
    explicit LockOrderTag(std::string_view name);

    LockOrderTag(const LockOrderTag&) = delete;
    LockOrderTag& operator=(const LockOrderTag&) = delete;

    const std::string& name() const noexcept { return name_; }
    uint64_t order() const noexcept { return order_; }

protected:
    ~LockOrderTag() = default;

    void note_acquired() const;
    void note_released() const;

private:
    std::string name_;
    uint64_t order_;
};

/// Number of tracked locks the calling thread holds (always 0 in release
/// builds).
std::size_t held_lock_count();

// ---------------------------------------------------------------------------
// Mutex
// ---------------------------------------------------------------------------

/// Wrapper around std::mutex that participates in lock-order checking.
class Mutex : public LockOrderTag {
public:
    explicit Mutex(std::string_view name = "") : LockOrderTag(name) {}

    void lock()
    {
        note_acquired();
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
        note_released();
    }

    bool try_lock()
    {
        bool acquired = mutex_.try_lock();
        if (acquired) note_acquired();
        return acquired;
    }

private:
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// SharedMutex
// ---------------------------------------------------------------------------

/// Wrapper around std::shared_mutex.  Exclusive paths are order-checked;
/// shared (reader) paths are not, since readers do not block each other.
class SharedMutex : public LockOrderTag {
public:
    explicit SharedMutex(std::string_view name = "") : LockOrderTag(name) {}

    void lock()
    {
        note_acquired();
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
        note_released();
    }

    void lock_shared() { mutex_.lock_shared(); }
    void unlock_shared() { mutex_.unlock_shared(); }

private:
    std::shared_mutex mutex_;
};

// ---------------------------------------------------------------------------
// RAII guards
// ---------------------------------------------------------------------------

/// Scoped exclusive lock on a core::Mutex.
class UniqueLock {
public:
    explicit UniqueLock(Mutex& mtx) : mutex_(mtx) { mutex_.lock(); }
    ~UniqueLock() { mutex_.unlock(); }

    UniqueLock(const UniqueLock&) = delete;
    UniqueLock& operator=(const UniqueLock&) = delete;

private:
    Mutex& mutex_;
};

/// Scoped exclusive (writer) lock on a core::SharedMutex.
class ExclusiveLock {
public:
    explicit ExclusiveLock(SharedMutex& mtx) : mutex_(mtx) { mutex_.lock(); }
    ~ExclusiveLock() { mutex_.unlock(); }

    ExclusiveLock(const ExclusiveLock&) = delete;
    ExclusiveLock& operator=(const ExclusiveLock&) = delete;

private:
    SharedMutex& mutex_;
};

/// Scoped shared (reader) lock on a core::SharedMutex.
class SharedLock {
public:
    explicit SharedLock(SharedMutex& mtx) : mutex_(mtx)
    {
        mutex_.lock_shared();
    }
    ~SharedLock() { mutex_.unlock_shared(); }

    SharedLock(const SharedLock&) = delete;
    SharedLock& operator=(const SharedLock&) = delete;

private:
    SharedMutex& mutex_;
};

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

#define CORE_SYNC_CAT_(a, b)  a##b
#define CORE_SYNC_CAT(a, b)   CORE_SYNC_CAT_(a, b)

/// Exclusive lock on @p cs for the enclosing block.
#define LOCK(cs) \
    core::UniqueLock CORE_SYNC_CAT(lock_, __LINE__)(cs)

/// Shared lock on @p cs for the enclosing block.
#define READ_LOCK(cs) \
    core::SharedLock CORE_SYNC_CAT(rlock_, __LINE__)(cs)

/// Exclusive lock on the SharedMutex @p cs for the enclosing block.
#define WRITE_LOCK(cs) \
    core::ExclusiveLock CORE_SYNC_CAT(wlock_, __LINE__)(cs)

}  // namespace core
