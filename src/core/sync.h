#pragma once

// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Lock-order tracking (debug builds only)
// ---------------------------------------------------------------------------

/// Identity of a lock for the lock-order checker: a human-readable name and
/// a process-unique order id assigned at construction.
struct LockOrder {
    std::string name;
    uint64_t    order = 0;

    explicit LockOrder(std::string_view n);
};

#ifndef NDEBUG

/// Record that the current thread is about to acquire @p lk exclusively and
/// warn (LogCategory::LOCK) if it already holds a lock with a higher or
/// equal order id.
void debug_lock_push(const LockOrder* lk);

/// Remove @p lk from the current thread's held-lock stack.
void debug_lock_pop(const LockOrder* lk);

/// Number of lock-order violations reported so far.
uint64_t lock_order_violations();

#endif  // !NDEBUG

// ---------------------------------------------------------------------------
// Mutex
// ---------------------------------------------------------------------------

/// std::mutex with a name, checked for acquisition order in debug builds.
class Mutex {
public:
    explicit Mutex(std::string_view name = "") : info_(name) {}

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock()
    {
#ifndef NDEBUG
        debug_lock_push(&info_);
#endif
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
#ifndef NDEBUG
        debug_lock_pop(&info_);
#endif
    }

    bool try_lock()
    {
        bool acquired = mutex_.try_lock();
#ifndef NDEBUG
        if (acquired) debug_lock_push(&info_);
#endif
        return acquired;
    }

    const std::string& name() const noexcept { return info_.name; }

private:
    std::mutex mutex_;
    LockOrder  info_;
};

// ---------------------------------------------------------------------------
// SharedMutex
// ---------------------------------------------------------------------------

/// std::shared_mutex with a name. Only the exclusive side takes part in
/// lock-order checking; readers do not block each other.
/// Satisfies Lockable, so std::unique_lock<SharedMutex> works for writers.
class SharedMutex {
public:
    explicit SharedMutex(std::string_view name = "") : info_(name) {}

    SharedMutex(const SharedMutex&) = delete;
    SharedMutex& operator=(const SharedMutex&) = delete;

    void lock()
    {
#ifndef NDEBUG
        debug_lock_push(&info_);
#endif
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
#ifndef NDEBUG
        debug_lock_pop(&info_);
#endif
    }

    bool try_lock()
    {
        bool acquired = mutex_.try_lock();
#ifndef NDEBUG
        if (acquired) debug_lock_push(&info_);
#endif
        return acquired;
    }

    void lock_shared() { mutex_.lock_shared(); }
    void unlock_shared() { mutex_.unlock_shared(); }
    bool try_lock_shared() { return mutex_.try_lock_shared(); }

    const std::string& name() const noexcept { return info_.name; }

private:
    std::shared_mutex mutex_;
    LockOrder         info_;
};

// ---------------------------------------------------------------------------
// UniqueLock / SharedLock
// ---------------------------------------------------------------------------

/// Scoped exclusive lock on a core::Mutex.
class UniqueLock {
public:
    explicit UniqueLock(Mutex& mtx) : mutex_(&mtx) { mutex_->lock(); }
    ~UniqueLock() { mutex_->unlock(); }

    UniqueLock(const UniqueLock&) = delete;
    UniqueLock& operator=(const UniqueLock&) = delete;

private:
    Mutex* mutex_;
};

/// Scoped reader lock on a core::SharedMutex.
class SharedLock {
public:
    explicit SharedLock(SharedMutex& mtx) : mutex_(&mtx) { mutex_->lock_shared(); }
    ~SharedLock() { mutex_->unlock_shared(); }

    SharedLock(const SharedLock&) = delete;
    SharedLock& operator=(const SharedLock&) = delete;

private:
    SharedMutex* mutex_;
};

#define CORE_SYNC_CAT_(a, b)  a##b
#define CORE_SYNC_CAT(a, b)   CORE_SYNC_CAT_(a, b)

/// Exclusive lock on @p cs for the rest of the enclosing block.
#define LOCK(cs) \
    core::UniqueLock CORE_SYNC_CAT(lock_, __LINE__)(cs)

}  // namespace core
