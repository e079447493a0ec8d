#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Transaction pool: admission, promotion cascade, pruning on mined blocks,
// and ready-transaction notifications.
//
// PoolInner holds the two indices and the algorithms; Pool wraps it in a
// reader-writer lock and owns the listener registry. Share a Pool through
// std::shared_ptr<Pool>.
// ---------------------------------------------------------------------------

#include "core/channel.h"
#include "core/error.h"
#include "core/sync.h"
#include "core/types.h"
#include "pool/marker.h"
#include "pool/pending.h"
#include "pool/ready.h"
#include "pool/transaction.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <variant>
#include <vector>

namespace pool {

/// Default capacity of each listener channel.
inline constexpr size_t DEFAULT_LISTENER_CAPACITY = 2048;

// ---------------------------------------------------------------------------
// PoolError -- why a submission was rejected
// ---------------------------------------------------------------------------
class PoolError {
public:
    /// Hash already in the ready or pending set. Carries the rejected
    /// transaction.
    static PoolError already_imported(
        PoolTransactionPtr tx,
        std::source_location loc = std::source_location::current());

    /// Admission would have displaced the submitted transaction itself.
    static PoolError cyclic_transaction(
        const core::uint256& hash,
        std::source_location loc = std::source_location::current());

    /// Wraps an index error (POOL_INVALID_STATE).
    explicit PoolError(core::Error error, PoolTransactionPtr tx = nullptr)
        : error_(std::move(error)), transaction_(std::move(tx)) {}

    [[nodiscard]] core::ErrorCode code() const noexcept { return error_.code(); }
    [[nodiscard]] const core::Error& error() const noexcept { return error_; }
    [[nodiscard]] const std::string& message() const noexcept { return error_.message(); }
    [[nodiscard]] const PoolTransactionPtr& transaction() const noexcept {
        return transaction_;
    }
    [[nodiscard]] std::string format() const { return error_.format(); }

private:
    core::Error        error_;
    PoolTransactionPtr transaction_;
};

// ---------------------------------------------------------------------------
// Outcomes
// ---------------------------------------------------------------------------

/// The submitted transaction went into the ready set.
struct AddedReady {
    core::uint256                   hash;
    /// Pending transactions moved to ready by the cascade, in order.
    std::vector<core::uint256>      promoted;
    /// Unlocked transactions the ready set refused.
    std::vector<core::uint256>      discarded;
    /// Ready transactions displaced during the call.
    std::vector<PoolTransactionPtr> removed;
};

/// The submitted transaction is waiting on missing markers.
struct AddedPending {
    core::uint256 hash;
};

class AddedTransaction {
public:
    AddedTransaction(AddedReady ready) : value_(std::move(ready)) {}        // NOLINT implicit
    AddedTransaction(AddedPending pending) : value_(std::move(pending)) {}  // NOLINT implicit

    [[nodiscard]] bool is_ready() const {
        return std::holds_alternative<AddedReady>(value_);
    }
    [[nodiscard]] bool is_pending() const { return !is_ready(); }

    /// The submitted transaction's hash.
    [[nodiscard]] const core::uint256& hash() const;

    /// nullptr unless is_ready().
    [[nodiscard]] const AddedReady* ready() const {
        return std::get_if<AddedReady>(&value_);
    }

    [[nodiscard]] std::string to_string() const;

private:
    std::variant<AddedReady, AddedPending> value_;
};

struct PruneResult {
    /// Pending transactions that became ready, one outcome per import.
    std::vector<AddedTransaction>   promoted;
    /// Imports that could not be added to the ready set (dropped).
    std::vector<core::uint256>      failed;
    /// Ready transactions removed because they were mined.
    std::vector<PoolTransactionPtr> pruned;
};

struct MinedBlockOutcome {
    uint64_t                        block_number = 0;
    std::vector<PoolTransactionPtr> included;
    std::vector<PoolTransactionPtr> invalid;
};

struct TxpoolStatus {
    /// Ready transactions.
    uint64_t pending = 0;
    /// Blocked transactions.
    uint64_t queued = 0;

    bool operator==(const TxpoolStatus&) const = default;
};

struct PoolContents {
    std::vector<PoolTransactionPtr> ready;
    std::vector<PoolTransactionPtr> pending;
};

// ---------------------------------------------------------------------------
// PoolInner -- the unsynchronised pool state and algorithms
// ---------------------------------------------------------------------------
class PoolInner {
public:
    [[nodiscard]] TransactionsIterator ready_transactions() const {
        return ready_.get_transactions();
    }
    [[nodiscard]] std::vector<PoolTransactionPtr> pending_transactions() const {
        return pending_.transactions();
    }

    void clear();

    [[nodiscard]] PoolTransactionPtr get_pool_transaction(const core::uint256& hash) const;
    [[nodiscard]] bool contains(const core::uint256& hash) const;
    [[nodiscard]] TxpoolStatus status() const;

    /// Admits @p tx as pending or ready. A ready admission runs the
    /// promotion cascade; on a cycle every change is rolled back.
    core::Result<AddedTransaction, PoolError> add_transaction(PoolTransactionPtr tx);

    /// Marks @p markers as provided by chain state: prunes their ready
    /// providers and promotes pending transactions waiting only on them.
    PruneResult prune_markers(uint64_t block_number,
                              const std::vector<TxMarker>& markers);

    /// Removes @p hashes and their ready dependents from both indices.
    std::vector<PoolTransactionPtr> remove_invalid(
        const std::vector<core::uint256>& hashes);

    std::vector<PoolTransactionPtr> remove_transactions_by_address(
        const core::uint160& sender);

    [[nodiscard]] const ReadyTransactions& ready() const { return ready_; }
    [[nodiscard]] const PendingTransactions& pending() const { return pending_; }

private:
    core::Result<AddedTransaction, PoolError> add_ready_transaction(
        PendingPoolTransaction tx);

    ReadyTransactions   ready_;
    PendingTransactions pending_;
};

// ---------------------------------------------------------------------------
// Pool -- thread-safe facade
// ---------------------------------------------------------------------------
// Reads take a shared lock, mutations an exclusive one; a whole cascade runs
// inside one critical section. Listeners are notified after the pool lock
// is released, under their own mutex, with non-blocking sends: a full
// channel drops the notification, a closed one is unregistered.
// ---------------------------------------------------------------------------
class Pool {
public:
    /// @p listener_capacity bounds each listener channel; 0 is raised to 1.
    explicit Pool(size_t listener_capacity = DEFAULT_LISTENER_CAPACITY);

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    core::Result<AddedTransaction, PoolError> add_transaction(PoolTransactionPtr tx);

    /// Best-first snapshot of the ready set; call again to restart.
    [[nodiscard]] TransactionsIterator ready_transactions() const;
    [[nodiscard]] std::vector<PoolTransactionPtr> pending_transactions() const;
    /// Both sets, taken under one lock.
    [[nodiscard]] PoolContents contents() const;

    [[nodiscard]] std::optional<primitives::PendingTransaction> get_transaction(
        const core::uint256& hash) const;
    [[nodiscard]] bool contains(const core::uint256& hash) const;
    [[nodiscard]] TxpoolStatus txpool_status() const;

    /// Removes the block's invalid transactions, then prunes the markers
    /// provided by its included transactions.
    PruneResult on_mined_block(const MinedBlockOutcome& outcome);

    PruneResult prune_markers(uint64_t block_number,
                              const std::vector<TxMarker>& markers);

    /// Registers a bounded channel that receives the hash of every
    /// transaction that becomes ready from now on.
    [[nodiscard]] core::Receiver<core::uint256> add_ready_listener();

    std::vector<PoolTransactionPtr> remove_invalid(
        const std::vector<core::uint256>& hashes);
    std::vector<PoolTransactionPtr> remove_transactions_by_address(
        const core::uint160& sender);

    /// Removes one transaction (and its ready dependents); nullptr if the
    /// hash is unknown.
    PoolTransactionPtr drop_transaction(const core::uint256& hash);

    void clear();

    [[nodiscard]] size_t listener_count() const;
    [[nodiscard]] size_t listener_capacity() const { return listener_capacity_; }

private:
    void notify_listener(const core::uint256& hash);
    void notify_added(const AddedTransaction& added);

    mutable core::SharedMutex inner_mutex_{"pool"};
    PoolInner                 inner_;

    mutable core::Mutex                 listeners_mutex_{"pool_listeners"};
    std::vector<core::Sender<core::uint256>> listeners_;
    const size_t                        listener_capacity_;
};

}  // namespace pool
