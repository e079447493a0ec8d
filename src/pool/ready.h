#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "pool/marker.h"
#include "pool/transaction.h"

#include <cstddef>
#include <cstdint>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pool {

/// A ready transaction together with its insertion id.
struct PoolTransactionRef {
    PoolTransactionPtr transaction;
    uint64_t           id = 0;
};

/// Higher priority first, then lower insertion id (earlier arrival).
struct BestFirst {
    bool operator()(const PoolTransactionRef& a, const PoolTransactionRef& b) const {
        if (a.transaction->priority() != b.transaction->priority()) {
            return a.transaction->priority() > b.transaction->priority();
        }
        return a.id < b.id;
    }
};

using IndependentSet = std::set<PoolTransactionRef, BestFirst>;

struct ReadyTransaction {
    PoolTransactionRef         ref;
    /// Ready transactions that require a marker this one provides, once per
    /// such requirement.
    std::vector<core::uint256> unlocks;
    /// Number of requirements with no ready provider (met by chain state).
    size_t                     requires_offset = 0;

    [[nodiscard]] bool is_independent() const {
        return requires_offset == ref.transaction->required().size();
    }
};

// ---------------------------------------------------------------------------
// TransactionsIterator -- best-first walk over a ready-set snapshot
// ---------------------------------------------------------------------------
// A transaction is yielded only after every ready transaction it depends on;
// among yieldable ones the BestFirst order decides. The snapshot is taken at
// construction, so later pool mutations are not observed.
// ---------------------------------------------------------------------------
class TransactionsIterator {
public:
    TransactionsIterator() = default;

    /// Next best transaction, or nullptr when exhausted.
    PoolTransactionPtr next();

    /// Drains the remaining transactions.
    std::vector<PoolTransactionPtr> collect();

private:
    friend class ReadyTransactions;

    void independent_or_awaiting(size_t satisfied, const PoolTransactionRef& ref);

    std::unordered_map<core::uint256, ReadyTransaction> all_;
    std::unordered_map<core::uint256, std::pair<size_t, PoolTransactionRef>> awaiting_;
    IndependentSet independent_;
};

// ---------------------------------------------------------------------------
// ReadyTransactions -- transactions whose requirements are all met
// ---------------------------------------------------------------------------
// Every provided marker maps to exactly one ready transaction. Requirements
// met by another ready transaction are linked through that transaction's
// unlocks list; the rest count toward requires_offset. Transactions with no
// ready provider form the independent set.
// Not thread-safe; guarded by the pool lock.
// ---------------------------------------------------------------------------
class ReadyTransactions {
public:
    [[nodiscard]] TransactionsIterator get_transactions() const;

    void clear();

    [[nodiscard]] bool contains(const core::uint256& hash) const {
        return ready_tx_.contains(hash);
    }

    /// nullptr if absent. Invalidated by any mutation.
    [[nodiscard]] const ReadyTransaction* get(const core::uint256& hash) const;

    [[nodiscard]] size_t len() const { return ready_tx_.size(); }
    [[nodiscard]] bool is_empty() const { return ready_tx_.empty(); }

    [[nodiscard]] const ProvidedMarkers& provided_markers() const {
        return provided_markers_;
    }

    /// All ready transactions in insertion-id order.
    [[nodiscard]] std::vector<PoolTransactionPtr> transactions() const;

    [[nodiscard]] std::vector<core::uint256> transactions_by_sender(
        const core::uint160& sender) const;

    /// Inserts a ready transaction under a fresh id. Ready transactions
    /// providing any of its markers are displaced first and returned; the
    /// new entry takes over their surviving dependents.
    /// POOL_INVALID_STATE (nothing changed) if @p tx is not ready or is
    /// already contained; POOL_CYCLIC_TRANSACTION (nothing changed) if one
    /// of its requirements is provided by a transaction it would displace
    /// or by one of that transaction's dependents.
    core::Result<std::vector<PoolTransactionRef>> add_transaction(
        const PendingPoolTransaction& tx);

    /// Re-inserts previously removed entries under their original ids and
    /// relinks them. Their hashes and provided markers must be free.
    core::Result<void> restore_transactions(std::vector<PoolTransactionRef> refs);

    /// Removes the given transactions and everything depending on them.
    std::vector<PoolTransactionRef> clear_transactions(
        const std::vector<core::uint256>& hashes);

    /// Removes the transaction providing @p marker (it was mined), then any
    /// ready transaction left with no dependents along its requirement
    /// chain. Dependents of pruned transactions count the requirement as
    /// met from then on.
    std::vector<PoolTransactionRef> prune_tags(const TxMarker& marker);

    /// Removes @p hashes. A removed transaction's dependents are removed too
    /// when at least one of its provided markers is outside @p filter
    /// (nullptr: no filter, always cascade).
    std::vector<PoolTransactionRef> remove_with_markers(
        std::vector<core::uint256> hashes, const MarkerSet* filter);

private:
    /// Ready provider of @p marker, or nullptr.
    ReadyTransaction* provider_of(const TxMarker& marker);

    /// Links @p entry to the providers of its requirements and sets its
    /// requires_offset; adds it to the independent set if nothing provides.
    void link_requirements(const core::uint256& hash, ReadyTransaction& entry);

    /// True if a requirement of @p tx is provided by one of @p roots or by
    /// anything reachable from them through unlocks.
    bool requires_from(const PoolTransaction& tx,
                       std::vector<core::uint256> roots) const;

    /// Removes @p hash from the unlocks of every provider of @p tx.
    void unlink_requirements(const core::uint256& hash, const PoolTransaction& tx);

    uint64_t                                            next_id_ = 0;
    ProvidedMarkers                                     provided_markers_;
    std::unordered_map<core::uint256, ReadyTransaction> ready_tx_;
    IndependentSet                                      independent_;
};

}  // namespace pool
