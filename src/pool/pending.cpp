// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pending.h"

#include <algorithm>

namespace pool {

void PendingTransactions::clear() {
    required_markers_.clear();
    waiting_queue_.clear();
}

std::vector<PoolTransactionPtr> PendingTransactions::transactions() const {
    std::vector<const PendingPoolTransaction*> entries;
    entries.reserve(waiting_queue_.size());
    for (const auto& [hash, tx] : waiting_queue_) {
        entries.push_back(&tx);
    }
    std::sort(entries.begin(), entries.end(),
              [](const PendingPoolTransaction* a, const PendingPoolTransaction* b) {
                  if (a->added_at() != b->added_at()) {
                      return a->added_at() < b->added_at();
                  }
                  return a->hash() < b->hash();
              });

    std::vector<PoolTransactionPtr> out;
    out.reserve(entries.size());
    for (const auto* e : entries) {
        out.push_back(e->transaction());
    }
    return out;
}

core::Result<void> PendingTransactions::add_transaction(PendingPoolTransaction tx) {
    if (tx.is_ready()) {
        return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                "transaction must not be ready: " +
                                tx.hash().to_hex());
    }
    if (contains(tx.hash())) {
        return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                "transaction is already pending: " +
                                tx.hash().to_hex());
    }

    const core::uint256 hash = tx.hash();
    for (const auto& marker : tx.missing_markers()) {
        index_missing(hash, marker);
    }
    waiting_queue_.emplace(hash, std::move(tx));
    return core::make_ok();
}

const PendingPoolTransaction* PendingTransactions::get(const core::uint256& hash) const {
    auto it = waiting_queue_.find(hash);
    return it == waiting_queue_.end() ? nullptr : &it->second;
}

std::vector<PendingPoolTransaction> PendingTransactions::mark_and_unlock(
    const std::vector<TxMarker>& markers, MarkJournal* journal) {
    std::vector<PendingPoolTransaction> unlocked;

    for (const auto& marker : markers) {
        auto node = required_markers_.extract(marker);
        if (node.empty()) continue;

        for (const auto& hash : node.mapped()) {
            auto it = waiting_queue_.find(hash);
            if (it == waiting_queue_.end()) continue;

            if (it->second.mark(marker) && journal) {
                journal->push_back(MarkRecord{hash, marker});
            }
            if (it->second.is_ready()) {
                unlocked.push_back(std::move(it->second));
                waiting_queue_.erase(it);
            }
        }
    }
    return unlocked;
}

std::vector<PoolTransactionPtr> PendingTransactions::remove(
    const std::vector<core::uint256>& hashes) {
    std::vector<PoolTransactionPtr> removed;
    for (const auto& hash : hashes) {
        auto it = waiting_queue_.find(hash);
        if (it == waiting_queue_.end()) continue;

        for (const auto& marker : it->second.missing_markers()) {
            unindex_missing(hash, marker);
        }
        removed.push_back(it->second.transaction());
        waiting_queue_.erase(it);
    }
    return removed;
}

core::Result<void> PendingTransactions::restore(
    const MarkJournal& journal, std::vector<PendingPoolTransaction> unlocked) {
    for (auto& tx : unlocked) {
        const core::uint256 hash = tx.hash();
        if (!waiting_queue_.emplace(hash, std::move(tx)).second) {
            return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                    "restored transaction is already pending: " +
                                    hash.to_hex());
        }
    }

    for (const auto& record : journal) {
        auto it = waiting_queue_.find(record.hash);
        if (it == waiting_queue_.end()) {
            return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                    "journaled transaction is not pending: " +
                                    record.hash.to_hex());
        }
        it->second.unmark(record.marker);
        index_missing(record.hash, record.marker);
    }

    for (const auto& [hash, tx] : waiting_queue_) {
        if (tx.is_ready()) {
            return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                    "restored transaction has no missing markers: " +
                                    hash.to_hex());
        }
    }
    return core::make_ok();
}

std::vector<core::uint256> PendingTransactions::transactions_by_sender(
    const core::uint160& sender) const {
    std::vector<core::uint256> out;
    for (const auto& [hash, tx] : waiting_queue_) {
        if (tx.transaction()->sender() == sender) {
            out.push_back(hash);
        }
    }
    return out;
}

void PendingTransactions::index_missing(const core::uint256& hash,
                                        const TxMarker& marker) {
    auto& waiting = required_markers_[marker];
    if (std::find(waiting.begin(), waiting.end(), hash) == waiting.end()) {
        waiting.push_back(hash);
    }
}

void PendingTransactions::unindex_missing(const core::uint256& hash,
                                          const TxMarker& marker) {
    auto it = required_markers_.find(marker);
    if (it == required_markers_.end()) return;
    auto& waiting = it->second;
    waiting.erase(std::remove(waiting.begin(), waiting.end(), hash), waiting.end());
    if (waiting.empty()) {
        required_markers_.erase(it);
    }
}

}  // namespace pool
