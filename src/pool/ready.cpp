// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/ready.h"

#include <algorithm>

namespace pool {

namespace {

void erase_hash(std::vector<core::uint256>& v, const core::uint256& hash) {
    v.erase(std::remove(v.begin(), v.end(), hash), v.end());
}

void push_unique(std::vector<core::uint256>& v, const core::uint256& hash) {
    if (std::find(v.begin(), v.end(), hash) == v.end()) {
        v.push_back(hash);
    }
}

}  // namespace

// ===========================================================================
// TransactionsIterator
// ===========================================================================

void TransactionsIterator::independent_or_awaiting(size_t satisfied,
                                                   const PoolTransactionRef& ref) {
    if (satisfied >= ref.transaction->required().size()) {
        independent_.insert(ref);
    } else {
        awaiting_.insert_or_assign(ref.transaction->hash(),
                                   std::make_pair(satisfied, ref));
    }
}

PoolTransactionPtr TransactionsIterator::next() {
    while (!independent_.empty()) {
        PoolTransactionRef best = *independent_.begin();
        independent_.erase(independent_.begin());

        auto it = all_.find(best.transaction->hash());
        if (it == all_.end()) continue;

        for (const auto& hash : it->second.unlocks) {
            if (auto aw = awaiting_.find(hash); aw != awaiting_.end()) {
                auto [satisfied, ref] = aw->second;
                awaiting_.erase(aw);
                independent_or_awaiting(satisfied + 1, ref);
            } else if (auto dep = all_.find(hash); dep != all_.end()) {
                independent_or_awaiting(dep->second.requires_offset + 1,
                                        dep->second.ref);
            }
        }
        return best.transaction;
    }
    return nullptr;
}

std::vector<PoolTransactionPtr> TransactionsIterator::collect() {
    std::vector<PoolTransactionPtr> out;
    while (auto tx = next()) {
        out.push_back(std::move(tx));
    }
    return out;
}

// ===========================================================================
// ReadyTransactions -- queries
// ===========================================================================

TransactionsIterator ReadyTransactions::get_transactions() const {
    TransactionsIterator iter;
    iter.all_ = ready_tx_;
    iter.independent_ = independent_;
    return iter;
}

void ReadyTransactions::clear() {
    provided_markers_.clear();
    ready_tx_.clear();
    independent_.clear();
}

const ReadyTransaction* ReadyTransactions::get(const core::uint256& hash) const {
    auto it = ready_tx_.find(hash);
    return it == ready_tx_.end() ? nullptr : &it->second;
}

std::vector<PoolTransactionPtr> ReadyTransactions::transactions() const {
    std::vector<const PoolTransactionRef*> refs;
    refs.reserve(ready_tx_.size());
    for (const auto& [hash, entry] : ready_tx_) {
        refs.push_back(&entry.ref);
    }
    std::sort(refs.begin(), refs.end(),
              [](const PoolTransactionRef* a, const PoolTransactionRef* b) {
                  return a->id < b->id;
              });

    std::vector<PoolTransactionPtr> out;
    out.reserve(refs.size());
    for (const auto* ref : refs) {
        out.push_back(ref->transaction);
    }
    return out;
}

std::vector<core::uint256> ReadyTransactions::transactions_by_sender(
    const core::uint160& sender) const {
    std::vector<core::uint256> out;
    for (const auto& [hash, entry] : ready_tx_) {
        if (entry.ref.transaction->sender() == sender) {
            out.push_back(hash);
        }
    }
    return out;
}

// ===========================================================================
// ReadyTransactions -- linking helpers
// ===========================================================================

ReadyTransaction* ReadyTransactions::provider_of(const TxMarker& marker) {
    auto pm = provided_markers_.find(marker);
    if (pm == provided_markers_.end()) return nullptr;
    auto it = ready_tx_.find(pm->second);
    return it == ready_tx_.end() ? nullptr : &it->second;
}

void ReadyTransactions::link_requirements(const core::uint256& hash,
                                          ReadyTransaction& entry) {
    bool independent = true;
    entry.requires_offset = 0;
    for (const auto& marker : entry.ref.transaction->required()) {
        ReadyTransaction* provider = provider_of(marker);
        if (provider && provider != &entry) {
            // One entry per requirement; prune_tags counts them.
            provider->unlocks.push_back(hash);
            independent = false;
        } else {
            ++entry.requires_offset;
        }
    }
    if (independent) {
        independent_.insert(entry.ref);
    }
}

bool ReadyTransactions::requires_from(const PoolTransaction& tx,
                                      std::vector<core::uint256> roots) const {
    std::unordered_set<core::uint256> reached;
    while (!roots.empty()) {
        const core::uint256 hash = roots.back();
        roots.pop_back();
        if (!reached.insert(hash).second) continue;
        if (const ReadyTransaction* r = get(hash)) {
            roots.insert(roots.end(), r->unlocks.begin(), r->unlocks.end());
        }
    }
    for (const auto& marker : tx.required()) {
        auto pm = provided_markers_.find(marker);
        if (pm != provided_markers_.end() && reached.contains(pm->second)) {
            return true;
        }
    }
    return false;
}

void ReadyTransactions::unlink_requirements(const core::uint256& hash,
                                            const PoolTransaction& tx) {
    for (const auto& marker : tx.required()) {
        if (ReadyTransaction* provider = provider_of(marker)) {
            erase_hash(provider->unlocks, hash);
        }
    }
}

// ===========================================================================
// ReadyTransactions -- mutation
// ===========================================================================

core::Result<std::vector<PoolTransactionRef>> ReadyTransactions::add_transaction(
    const PendingPoolTransaction& tx) {
    if (!tx.is_ready()) {
        return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                "transaction must be ready: " + tx.hash().to_hex());
    }
    if (contains(tx.hash())) {
        return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                "transaction is already ready: " + tx.hash().to_hex());
    }

    const PoolTransactionPtr& ptx = tx.transaction();
    const core::uint256 hash = ptx->hash();

    // Displace the current providers of our markers.
    std::vector<core::uint256> replaced;
    for (const auto& marker : ptx->provided()) {
        if (auto pm = provided_markers_.find(marker); pm != provided_markers_.end()) {
            push_unique(replaced, pm->second);
        }
    }

    // The replaced entries and their dependents are about to be displaced or
    // inherited; depending on any of them would leave a requirement unmet.
    if (!replaced.empty() && requires_from(*ptx, replaced)) {
        return core::make_error(core::ErrorCode::POOL_CYCLIC_TRANSACTION,
                                "transaction " + hash.to_hex() +
                                " would displace its own provider");
    }

    std::vector<core::uint256> inherited;
    std::vector<PoolTransactionRef> displaced;
    if (!replaced.empty()) {
        for (const auto& h : replaced) {
            if (const ReadyTransaction* r = get(h)) {
                inherited.insert(inherited.end(), r->unlocks.begin(), r->unlocks.end());
            }
        }
        MarkerSet filter(ptx->provided().begin(), ptx->provided().end());
        displaced = remove_with_markers(replaced, &filter);
    }

    ReadyTransaction entry;
    entry.ref = PoolTransactionRef{ptx, next_id_++};

    auto [it, inserted] = ready_tx_.emplace(hash, std::move(entry));
    link_requirements(hash, it->second);

    for (const auto& marker : ptx->provided()) {
        provided_markers_[marker] = hash;
    }
    for (const auto& dep : inherited) {
        if (dep != hash && ready_tx_.contains(dep)) {
            it->second.unlocks.push_back(dep);
        }
    }
    return displaced;
}

core::Result<void> ReadyTransactions::restore_transactions(
    std::vector<PoolTransactionRef> refs) {
    std::sort(refs.begin(), refs.end(),
              [](const PoolTransactionRef& a, const PoolTransactionRef& b) {
                  return a.id < b.id;
              });

    for (const auto& ref : refs) {
        const core::uint256& hash = ref.transaction->hash();
        if (contains(hash)) {
            return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                    "cannot restore, already ready: " + hash.to_hex());
        }
        for (const auto& marker : ref.transaction->provided()) {
            if (provider_of(marker)) {
                return core::make_error(core::ErrorCode::POOL_INVALID_STATE,
                                        "cannot restore " + hash.to_hex() +
                                        ", marker taken: " + marker_to_hex(marker));
            }
        }
    }

    // Insert everything first so links between restored entries resolve.
    for (const auto& ref : refs) {
        const core::uint256& hash = ref.transaction->hash();
        ready_tx_.emplace(hash, ReadyTransaction{ref, {}, 0});
        for (const auto& marker : ref.transaction->provided()) {
            provided_markers_[marker] = hash;
        }
    }
    for (const auto& ref : refs) {
        const core::uint256& hash = ref.transaction->hash();
        link_requirements(hash, ready_tx_.at(hash));
    }
    return core::make_ok();
}

std::vector<PoolTransactionRef> ReadyTransactions::clear_transactions(
    const std::vector<core::uint256>& hashes) {
    return remove_with_markers(hashes, nullptr);
}

std::vector<PoolTransactionRef> ReadyTransactions::remove_with_markers(
    std::vector<core::uint256> hashes, const MarkerSet* filter) {
    std::vector<PoolTransactionRef> removed;

    while (!hashes.empty()) {
        const core::uint256 hash = hashes.back();
        hashes.pop_back();

        auto node = ready_tx_.extract(hash);
        if (node.empty()) continue;
        ReadyTransaction& entry = node.mapped();
        const PoolTransaction& tx = *entry.ref.transaction;

        bool removed_some_marks = false;
        for (const auto& marker : tx.provided()) {
            if (filter && filter->contains(marker)) continue;
            removed_some_marks = true;
            auto pm = provided_markers_.find(marker);
            if (pm != provided_markers_.end() && pm->second == hash) {
                provided_markers_.erase(pm);
            }
        }

        unlink_requirements(hash, tx);
        independent_.erase(entry.ref);

        if (removed_some_marks) {
            hashes.insert(hashes.end(), entry.unlocks.begin(), entry.unlocks.end());
        }
        removed.push_back(std::move(entry.ref));
    }
    return removed;
}

std::vector<PoolTransactionRef> ReadyTransactions::prune_tags(const TxMarker& marker) {
    std::vector<PoolTransactionRef> removed;
    std::vector<TxMarker> to_remove{marker};

    while (!to_remove.empty()) {
        const TxMarker current = std::move(to_remove.back());
        to_remove.pop_back();

        auto pm = provided_markers_.find(current);
        if (pm == provided_markers_.end()) continue;
        const core::uint256 hash = pm->second;
        provided_markers_.erase(pm);

        auto node = ready_tx_.extract(hash);
        if (node.empty()) continue;
        ReadyTransaction& entry = node.mapped();
        const PoolTransaction& tx = *entry.ref.transaction;
        independent_.erase(entry.ref);

        // Providers left without dependents were mined before this one.
        for (const auto& req : tx.required()) {
            ReadyTransaction* prev = provider_of(req);
            if (!prev) continue;
            erase_hash(prev->unlocks, hash);
            if (prev->unlocks.empty()) {
                const auto& prev_provided = prev->ref.transaction->provided();
                to_remove.insert(to_remove.end(), prev_provided.begin(), prev_provided.end());
            }
        }

        for (const auto& dep_hash : entry.unlocks) {
            auto dep = ready_tx_.find(dep_hash);
            if (dep == ready_tx_.end()) continue;
            ++dep->second.requires_offset;
            if (dep->second.is_independent()) {
                independent_.insert(dep->second.ref);
            }
        }

        for (const auto& m : tx.provided()) {
            auto other = provided_markers_.find(m);
            if (other != provided_markers_.end() && other->second == hash) {
                provided_markers_.erase(other);
            }
        }
        removed.push_back(std::move(entry.ref));
    }
    return removed;
}

}  // namespace pool
