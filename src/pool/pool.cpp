// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool.h"
#include "core/logging.h"
#include "core/time.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace pool {

// ===========================================================================
// PoolError / AddedTransaction
// ===========================================================================

PoolError PoolError::already_imported(PoolTransactionPtr tx,
                                      std::source_location loc) {
    std::string msg = "Transaction already imported";
    if (tx) msg += ": " + tx->hash().to_hex();
    return PoolError(
        core::make_error(core::ErrorCode::POOL_ALREADY_IMPORTED, std::move(msg), loc),
        std::move(tx));
}

PoolError PoolError::cyclic_transaction(const core::uint256& hash,
                                        std::source_location loc) {
    return PoolError(core::make_error(
        core::ErrorCode::POOL_CYCLIC_TRANSACTION,
        "Cyclic transaction detected: " + hash.to_hex(), loc));
}

const core::uint256& AddedTransaction::hash() const {
    if (const auto* r = std::get_if<AddedReady>(&value_)) return r->hash;
    return std::get<AddedPending>(value_).hash;
}

std::string AddedTransaction::to_string() const {
    std::ostringstream oss;
    if (const auto* r = ready()) {
        oss << "Ready(" << r->hash.to_hex()
            << ", promoted=" << r->promoted.size()
            << ", discarded=" << r->discarded.size()
            << ", removed=" << r->removed.size() << ")";
    } else {
        oss << "Pending(" << hash().to_hex() << ")";
    }
    return oss.str();
}

// ===========================================================================
// PoolInner
// ===========================================================================

void PoolInner::clear() {
    ready_.clear();
    pending_.clear();
}

PoolTransactionPtr PoolInner::get_pool_transaction(const core::uint256& hash) const {
    if (const auto* r = ready_.get(hash)) return r->ref.transaction;
    if (const auto* p = pending_.get(hash)) return p->transaction();
    return nullptr;
}

bool PoolInner::contains(const core::uint256& hash) const {
    return ready_.contains(hash) || pending_.contains(hash);
}

TxpoolStatus PoolInner::status() const {
    return TxpoolStatus{ready_.len(), pending_.len()};
}

core::Result<AddedTransaction, PoolError> PoolInner::add_transaction(
    PoolTransactionPtr tx) {
    if (contains(tx->hash())) {
        LOG_WARN(core::LogCategory::MEMPOOL,
            "pool: transaction already imported " + tx->hash().to_hex());
        return PoolError::already_imported(std::move(tx));
    }

    PendingPoolTransaction pending(tx, ready_.provided_markers());
    if (pending.is_ready()) {
        return add_ready_transaction(std::move(pending));
    }

    const core::uint256 hash = tx->hash();
    auto added = pending_.add_transaction(std::move(pending));
    if (!added.ok()) {
        return PoolError(std::move(added).error(), std::move(tx));
    }
    LOG_DEBUG(core::LogCategory::MEMPOOL,
        "pool: queued pending transaction " + hash.to_hex()
        + " (" + std::to_string(pending_.len()) + " pending)");
    return AddedTransaction(AddedPending{hash});
}

// ---------------------------------------------------------------------------
// add_ready_transaction -- insert and cascade through unlocked dependents
// ---------------------------------------------------------------------------
// Every ready insert is followed by marking its provided markers in the
// pending index; transactions left with nothing missing are queued and
// inserted in turn. If the cascade displaces the submitted transaction, or
// an unlocked transaction would have to displace it while depending on it,
// the whole call is undone: this call's inserts are cleared, displaced entries
// are restored under their old ids, and the pending marks are reversed.
// ---------------------------------------------------------------------------
core::Result<AddedTransaction, PoolError> PoolInner::add_ready_transaction(
    PendingPoolTransaction tx) {
    const core::uint256 seed = tx.hash();

    AddedReady outcome;
    outcome.hash = seed;

    std::vector<core::uint256>          inserted;
    std::vector<PoolTransactionRef>     displaced;
    std::vector<PendingPoolTransaction> unlocked;
    MarkJournal                         journal;

    // True if inserting @p p would displace the submitted transaction.
    auto displaces_seed = [&](const PendingPoolTransaction& p) {
        const auto& provided = ready_.provided_markers();
        const auto& markers = p.transaction()->provided();
        return std::any_of(markers.begin(), markers.end(), [&](const TxMarker& m) {
            auto it = provided.find(m);
            return it != provided.end() && it->second == seed;
        });
    };

    std::deque<PendingPoolTransaction> queue;
    queue.push_back(std::move(tx));
    bool first = true;
    bool cyclic = false;

    while (!queue.empty()) {
        PendingPoolTransaction current = std::move(queue.front());
        queue.pop_front();
        const core::uint256 hash = current.hash();

        auto added = ready_.add_transaction(current);
        if (!added.ok()) {
            if (first) {
                return PoolError(std::move(added).error(), current.transaction());
            }
            if (added.error().code() == core::ErrorCode::POOL_CYCLIC_TRANSACTION &&
                displaces_seed(current)) {
                cyclic = true;
                break;
            }
            LOG_WARN(core::LogCategory::MEMPOOL,
                "pool: failed to promote " + hash.to_hex() + ": "
                + added.error().message());
            outcome.discarded.push_back(hash);
            continue;
        }

        inserted.push_back(hash);
        for (auto& ref : added.value()) {
            outcome.removed.push_back(ref.transaction);
            displaced.push_back(std::move(ref));
        }
        if (!first) {
            LOG_TRACE(core::LogCategory::MEMPOOL,
                "pool: promoted " + hash.to_hex() + " to ready");
            outcome.promoted.push_back(hash);
        }
        first = false;

        auto next = pending_.mark_and_unlock(
            current.transaction()->provided(), &journal);
        for (auto& n : next) {
            unlocked.push_back(n);
            queue.push_back(std::move(n));
        }
    }

    cyclic = cyclic || std::any_of(
        outcome.removed.begin(), outcome.removed.end(),
        [&](const PoolTransactionPtr& r) { return r->hash() == seed; });
    if (!cyclic) {
        LOG_DEBUG(core::LogCategory::MEMPOOL,
            "pool: added ready transaction " + seed.to_hex()
            + " (promoted " + std::to_string(outcome.promoted.size())
            + ", removed " + std::to_string(outcome.removed.size()) + ")");
        return AddedTransaction(std::move(outcome));
    }

    // Roll back.
    const std::unordered_set<core::uint256> ours(inserted.begin(), inserted.end());
    auto cleared = ready_.clear_transactions(inserted);

    std::vector<PoolTransactionRef> restore;
    std::unordered_set<core::uint256> seen;
    auto collect = [&](std::vector<PoolTransactionRef>& refs) {
        for (auto& ref : refs) {
            const auto& h = ref.transaction->hash();
            if (ours.contains(h) || !seen.insert(h).second) continue;
            restore.push_back(std::move(ref));
        }
    };
    collect(displaced);
    collect(cleared);

    LOG_WARN(core::LogCategory::MEMPOOL,
        "pool: cyclic transaction " + seed.to_hex() + ", rolling back "
        + std::to_string(inserted.size()) + " insert(s), restoring "
        + std::to_string(restore.size()) + " ready and "
        + std::to_string(unlocked.size()) + " pending");

    auto restored = ready_.restore_transactions(std::move(restore));
    if (!restored.ok()) {
        LOG_ERROR(core::LogCategory::MEMPOOL,
            "pool: ready rollback failed: " + restored.error().format());
        return PoolError(std::move(restored).error());
    }
    auto unmarked = pending_.restore(journal, std::move(unlocked));
    if (!unmarked.ok()) {
        LOG_ERROR(core::LogCategory::MEMPOOL,
            "pool: pending rollback failed: " + unmarked.error().format());
        return PoolError(std::move(unmarked).error());
    }
    return PoolError::cyclic_transaction(seed);
}

PruneResult PoolInner::prune_markers(uint64_t block_number,
                                     const std::vector<TxMarker>& markers) {
    PruneResult result;
    std::vector<PendingPoolTransaction> imports;

    for (const auto& marker : markers) {
        auto ready_now = pending_.mark_and_unlock({marker});
        for (auto& p : ready_now) imports.push_back(std::move(p));
        for (auto& ref : ready_.prune_tags(marker)) {
            result.pruned.push_back(std::move(ref.transaction));
        }
    }

    for (auto& import : imports) {
        const core::uint256 hash = import.hash();
        auto added = add_ready_transaction(std::move(import));
        if (added.ok()) {
            result.promoted.push_back(std::move(added).value());
        } else {
            LOG_WARN(core::LogCategory::MEMPOOL,
                "pool: failed to promote " + hash.to_hex() + " after block "
                + std::to_string(block_number) + ": " + added.error().message());
            result.failed.push_back(hash);
        }
    }

    LOG_DEBUG(core::LogCategory::MEMPOOL,
        "pool: block " + std::to_string(block_number) + " pruned "
        + std::to_string(result.pruned.size()) + ", promoted "
        + std::to_string(result.promoted.size()) + ", failed "
        + std::to_string(result.failed.size()));
    return result;
}

std::vector<PoolTransactionPtr> PoolInner::remove_invalid(
    const std::vector<core::uint256>& hashes) {
    if (hashes.empty()) return {};

    std::vector<PoolTransactionPtr> removed;
    for (auto& ref : ready_.remove_with_markers(hashes, nullptr)) {
        removed.push_back(std::move(ref.transaction));
    }
    for (auto& tx : pending_.remove(hashes)) {
        removed.push_back(std::move(tx));
    }
    LOG_DEBUG(core::LogCategory::MEMPOOL,
        "pool: removed " + std::to_string(removed.size())
        + " transaction(s) for " + std::to_string(hashes.size()) + " hash(es)");
    return removed;
}

std::vector<PoolTransactionPtr> PoolInner::remove_transactions_by_address(
    const core::uint160& sender) {
    auto hashes = ready_.transactions_by_sender(sender);
    auto queued = pending_.transactions_by_sender(sender);
    hashes.insert(hashes.end(), queued.begin(), queued.end());
    if (hashes.empty()) return {};

    LOG_DEBUG(core::LogCategory::MEMPOOL,
        "pool: evicting " + std::to_string(hashes.size())
        + " transaction(s) from " + sender.to_hex());
    return remove_invalid(hashes);
}

// ===========================================================================
// Pool
// ===========================================================================

// A zero capacity would make the listener channels unbounded.
Pool::Pool(size_t listener_capacity)
    : listener_capacity_(std::max<size_t>(listener_capacity, 1)) {}

core::Result<AddedTransaction, PoolError> Pool::add_transaction(PoolTransactionPtr tx) {
    auto result = [&] {
        std::unique_lock<core::SharedMutex> lock(inner_mutex_);
        return inner_.add_transaction(std::move(tx));
    }();
    if (result.ok()) notify_added(result.value());
    return result;
}

TransactionsIterator Pool::ready_transactions() const {
    core::SharedLock lock(inner_mutex_);
    return inner_.ready_transactions();
}

std::vector<PoolTransactionPtr> Pool::pending_transactions() const {
    core::SharedLock lock(inner_mutex_);
    return inner_.pending_transactions();
}

PoolContents Pool::contents() const {
    core::SharedLock lock(inner_mutex_);
    return PoolContents{inner_.ready_transactions().collect(),
                        inner_.pending_transactions()};
}

std::optional<primitives::PendingTransaction> Pool::get_transaction(
    const core::uint256& hash) const {
    core::SharedLock lock(inner_mutex_);
    if (auto tx = inner_.get_pool_transaction(hash)) {
        return tx->pending_transaction();
    }
    return std::nullopt;
}

bool Pool::contains(const core::uint256& hash) const {
    core::SharedLock lock(inner_mutex_);
    return inner_.contains(hash);
}

TxpoolStatus Pool::txpool_status() const {
    core::SharedLock lock(inner_mutex_);
    return inner_.status();
}

PruneResult Pool::on_mined_block(const MinedBlockOutcome& outcome) {
    std::vector<core::uint256> invalid;
    invalid.reserve(outcome.invalid.size());
    for (const auto& tx : outcome.invalid) invalid.push_back(tx->hash());

    std::vector<TxMarker> markers;
    MarkerSet seen;
    for (const auto& tx : outcome.included) {
        for (const auto& m : tx->provided()) {
            if (seen.insert(m).second) markers.push_back(m);
        }
    }

    LOG_DEBUG(core::LogCategory::MEMPOOL,
        "pool: block " + std::to_string(outcome.block_number) + " mined with "
        + std::to_string(outcome.included.size()) + " included, "
        + std::to_string(outcome.invalid.size()) + " invalid");

    core::StopWatch timer;
    auto result = [&] {
        std::unique_lock<core::SharedMutex> lock(inner_mutex_);
        inner_.remove_invalid(invalid);
        return inner_.prune_markers(outcome.block_number, markers);
    }();
    LOG_DEBUG(core::LogCategory::BENCH,
        "pool: block " + std::to_string(outcome.block_number) + " processed in "
        + std::to_string(timer.elapsed_us()) + " us");
    for (const auto& added : result.promoted) notify_added(added);
    return result;
}

PruneResult Pool::prune_markers(uint64_t block_number,
                                const std::vector<TxMarker>& markers) {
    auto result = [&] {
        std::unique_lock<core::SharedMutex> lock(inner_mutex_);
        return inner_.prune_markers(block_number, markers);
    }();
    for (const auto& added : result.promoted) notify_added(added);
    return result;
}

core::Receiver<core::uint256> Pool::add_ready_listener() {
    auto [tx, rx] = core::make_channel<core::uint256>(listener_capacity_);
    LOCK(listeners_mutex_);
    listeners_.push_back(std::move(tx));
    return std::move(rx);
}

std::vector<PoolTransactionPtr> Pool::remove_invalid(
    const std::vector<core::uint256>& hashes) {
    std::unique_lock<core::SharedMutex> lock(inner_mutex_);
    return inner_.remove_invalid(hashes);
}

std::vector<PoolTransactionPtr> Pool::remove_transactions_by_address(
    const core::uint160& sender) {
    std::unique_lock<core::SharedMutex> lock(inner_mutex_);
    return inner_.remove_transactions_by_address(sender);
}

PoolTransactionPtr Pool::drop_transaction(const core::uint256& hash) {
    std::unique_lock<core::SharedMutex> lock(inner_mutex_);
    auto removed = inner_.remove_invalid({hash});
    for (auto& tx : removed) {
        if (tx->hash() == hash) return tx;
    }
    return nullptr;
}

void Pool::clear() {
    std::unique_lock<core::SharedMutex> lock(inner_mutex_);
    inner_.clear();
    LOG_DEBUG(core::LogCategory::MEMPOOL, "pool: cleared");
}

size_t Pool::listener_count() const {
    LOCK(listeners_mutex_);
    return listeners_.size();
}

void Pool::notify_added(const AddedTransaction& added) {
    const AddedReady* ready = added.ready();
    if (!ready) return;
    notify_listener(ready->hash);
    for (const auto& hash : ready->promoted) notify_listener(hash);
}

// Every listener gets one non-blocking attempt. Walk from the back and
// swap-remove, re-appending the ones to keep.
void Pool::notify_listener(const core::uint256& hash) {
    LOCK(listeners_mutex_);
    for (size_t i = listeners_.size(); i-- > 0;) {
        core::Sender<core::uint256> listener = std::move(listeners_[i]);
        if (i + 1 != listeners_.size()) {
            listeners_[i] = std::move(listeners_.back());
        }
        listeners_.pop_back();

        switch (listener.try_send(hash)) {
        case core::SendStatus::SENT:
            listeners_.push_back(std::move(listener));
            break;
        case core::SendStatus::FULL:
            LOG_WARN(core::LogCategory::MEMPOOL,
                "pool: listener buffer full, dropping notification for "
                + hash.to_hex());
            listeners_.push_back(std::move(listener));
            break;
        case core::SendStatus::CLOSED:
            LOG_TRACE(core::LogCategory::MEMPOOL,
                "pool: removing closed listener");
            break;
        }
    }
}

}  // namespace pool
