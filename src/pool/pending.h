#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "pool/marker.h"
#include "pool/transaction.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace pool {

/// One missing marker checked off on one pending transaction.
struct MarkRecord {
    core::uint256 hash;
    TxMarker      marker;
};

/// Every mark made during one admission cascade, in order, so the cascade
/// can be undone exactly.
using MarkJournal = std::vector<MarkRecord>;

// ---------------------------------------------------------------------------
// PendingTransactions -- transactions blocked on missing markers
// ---------------------------------------------------------------------------
// Indexed by hash and by missing marker. Every contained transaction has at
// least one missing marker; a transaction whose last marker is checked off
// leaves this index and is handed back to the caller.
// Not thread-safe; guarded by the pool lock.
// ---------------------------------------------------------------------------
class PendingTransactions {
public:
    [[nodiscard]] size_t len() const { return waiting_queue_.size(); }
    [[nodiscard]] bool is_empty() const { return waiting_queue_.empty(); }

    void clear();

    /// Snapshot ordered by admission time, then hash.
    [[nodiscard]] std::vector<PoolTransactionPtr> transactions() const;

    /// POOL_INVALID_STATE if @p tx is already ready or already contained.
    core::Result<void> add_transaction(PendingPoolTransaction tx);

    [[nodiscard]] bool contains(const core::uint256& hash) const {
        return waiting_queue_.contains(hash);
    }

    /// nullptr if absent. Invalidated by any mutation.
    [[nodiscard]] const PendingPoolTransaction* get(const core::uint256& hash) const;

    /// Checks @p markers off every transaction waiting on them and removes
    /// the ones left with nothing missing, returning them in the order they
    /// became ready. Each mark is appended to @p journal when given.
    std::vector<PendingPoolTransaction> mark_and_unlock(
        const std::vector<TxMarker>& markers, MarkJournal* journal = nullptr);

    /// Removes the given hashes; unknown hashes are ignored.
    std::vector<PoolTransactionPtr> remove(const std::vector<core::uint256>& hashes);

    /// Undoes mark_and_unlock calls: re-inserts @p unlocked and puts every
    /// journaled marker back on its transaction's missing list.
    core::Result<void> restore(const MarkJournal& journal,
                               std::vector<PendingPoolTransaction> unlocked);

    [[nodiscard]] std::vector<core::uint256> transactions_by_sender(
        const core::uint160& sender) const;

private:
    void index_missing(const core::uint256& hash, const TxMarker& marker);
    void unindex_missing(const core::uint256& hash, const TxMarker& marker);

    /// missing marker -> waiting hashes, in the order they started waiting
    MarkerMap<std::vector<core::uint256>> required_markers_;
    std::unordered_map<core::uint256, PendingPoolTransaction> waiting_queue_;
};

}  // namespace pool
