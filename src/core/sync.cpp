// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"

#include <atomic>

#ifndef NDEBUG
#include <iterator>
#include <vector>

#include "core/logging.h"
#endif

namespace core {

namespace {

std::atomic<uint64_t> g_next_order_id{1};

}  // namespace

LockOrder::LockOrder(std::string_view n)
    : name(n)
    , order(g_next_order_id.fetch_add(1, std::memory_order_relaxed))
{
}

#ifndef NDEBUG

namespace {

// Locks held by this thread, earliest acquired first.
thread_local std::vector<const LockOrder*> held_locks;

std::atomic<uint64_t> g_violations{0};

}  // namespace

void debug_lock_push(const LockOrder* lk)
{
    for (const LockOrder* held : held_locks) {
        if (held->order >= lk->order) {
            g_violations.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN(LogCategory::LOCK,
                     "potential deadlock: holding '" + held->name +
                     "' (order " + std::to_string(held->order) +
                     ") while acquiring '" + lk->name +
                     "' (order " + std::to_string(lk->order) + ")");
            break;
        }
    }
    held_locks.push_back(lk);
}

void debug_lock_pop(const LockOrder* lk)
{
    // Release order is not always LIFO.
    for (auto it = held_locks.rbegin(); it != held_locks.rend(); ++it) {
        if (*it == lk) {
            held_locks.erase(std::next(it).base());
            return;
        }
    }
}

uint64_t lock_order_violations()
{
    return g_violations.load(std::memory_order_relaxed);
}

#endif  // !NDEBUG

}  // namespace core
