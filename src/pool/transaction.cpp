// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/transaction.h"

#include "core/time.h"

#include <algorithm>
#include <cctype>

namespace pool {

namespace {

std::vector<TxMarker> dedup(std::vector<TxMarker> markers) {
    std::vector<TxMarker> out;
    out.reserve(markers.size());
    MarkerSet seen;
    for (auto& m : markers) {
        if (seen.insert(m).second) {
            out.push_back(std::move(m));
        }
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// TransactionOrder
// ---------------------------------------------------------------------------

core::Result<TransactionOrder> parse_transaction_order(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "fifo") return TransactionOrder::FIFO;
    if (lower == "fees") return TransactionOrder::FEES;
    return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                            "Unknown TransactionOrder: `" + std::string(name) + "`");
}

std::string_view transaction_order_name(TransactionOrder order) {
    switch (order) {
        case TransactionOrder::FIFO: return "fifo";
        case TransactionOrder::FEES: return "fees";
    }
    return "unknown";
}

TransactionPriority priority_for(TransactionOrder order,
                                 const primitives::PendingTransaction& tx) {
    switch (order) {
        case TransactionOrder::FIFO: return 0;
        case TransactionOrder::FEES: return tx.gas_price();
    }
    return 0;
}

// ---------------------------------------------------------------------------
// PoolTransaction
// ---------------------------------------------------------------------------

PoolTransaction::PoolTransaction(primitives::PendingTransaction pending_transaction,
                                 std::vector<TxMarker> required,
                                 std::vector<TxMarker> provided,
                                 TransactionPriority priority)
    : pending_transaction_(std::move(pending_transaction))
    , required_(dedup(std::move(required)))
    , provided_(dedup(std::move(provided)))
    , priority_(priority)
{
}

std::string PoolTransaction::to_string() const {
    return "PoolTransaction(hash=" + hash().to_hex() +
           ", priority=" + std::to_string(priority_) +
           ", requires=" + markers_to_string(required_) +
           ", provides=" + markers_to_string(provided_) + ")";
}

PoolTransactionPtr make_pool_transaction(primitives::PendingTransaction tx,
                                         uint64_t on_chain_nonce,
                                         TransactionOrder order) {
    auto required = required_markers(tx.nonce(), on_chain_nonce, tx.sender());
    std::vector<TxMarker> provided{to_marker(tx.nonce(), tx.sender())};
    TransactionPriority priority = priority_for(order, tx);
    return std::make_shared<const PoolTransaction>(
        std::move(tx), std::move(required), std::move(provided), priority);
}

// ---------------------------------------------------------------------------
// PendingPoolTransaction
// ---------------------------------------------------------------------------

PendingPoolTransaction::PendingPoolTransaction(PoolTransactionPtr transaction,
                                               const ProvidedMarkers& provided)
    : transaction_(std::move(transaction))
    , added_at_(core::MockableClock::now_millis())
{
    for (const auto& marker : transaction_->required()) {
        if (!provided.contains(marker)) {
            missing_markers_.push_back(marker);
        }
    }
}

bool PendingPoolTransaction::mark(const TxMarker& marker) {
    auto it = std::find(missing_markers_.begin(), missing_markers_.end(), marker);
    if (it == missing_markers_.end()) return false;
    missing_markers_.erase(it);
    return true;
}

void PendingPoolTransaction::unmark(const TxMarker& marker) {
    if (std::find(missing_markers_.begin(), missing_markers_.end(), marker) ==
        missing_markers_.end()) {
        missing_markers_.push_back(marker);
    }
}

std::string PendingPoolTransaction::to_string() const {
    return "PendingPoolTransaction(added_at=" + std::to_string(added_at_) +
           ", tx=" + transaction_->to_string() +
           ", missing=" + markers_to_string(missing_markers_) + ")";
}

}  // namespace pool
