#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "pool/marker.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pool {

/// Larger is better.
using TransactionPriority = uint64_t;

// ---------------------------------------------------------------------------
// TransactionOrder -- how ready transactions are prioritised
// ---------------------------------------------------------------------------
enum class TransactionOrder {
    FIFO,  // every transaction has priority 0, arrival order decides
    FEES,  // priority is the gas price
};

/// "fifo" / "fees", case-insensitive; anything else is PARSE_BAD_FORMAT.
[[nodiscard]] core::Result<TransactionOrder> parse_transaction_order(
    std::string_view name);

[[nodiscard]] std::string_view transaction_order_name(TransactionOrder order);

[[nodiscard]] TransactionPriority priority_for(
    TransactionOrder order, const primitives::PendingTransaction& tx);

// ---------------------------------------------------------------------------
// PoolTransaction -- a transaction plus its dependency markers
// ---------------------------------------------------------------------------
// Immutable once built and always shared through PoolTransactionPtr, so the
// ready and pending indices, iterators and callers can hold the same object.
// Duplicate markers in either list are collapsed, first occurrence kept.
// ---------------------------------------------------------------------------
class PoolTransaction {
public:
    PoolTransaction(primitives::PendingTransaction pending_transaction,
                    std::vector<TxMarker> required,
                    std::vector<TxMarker> provided,
                    TransactionPriority priority);

    [[nodiscard]] const primitives::PendingTransaction& pending_transaction() const {
        return pending_transaction_;
    }
    [[nodiscard]] const core::uint256& hash() const {
        return pending_transaction_.hash();
    }
    [[nodiscard]] const core::uint160& sender() const {
        return pending_transaction_.sender();
    }
    [[nodiscard]] uint64_t gas_price() const {
        return pending_transaction_.gas_price();
    }

    /// Markers that must be provided before this transaction is ready.
    [[nodiscard]] const std::vector<TxMarker>& required() const { return required_; }
    /// Markers this transaction makes available once ready or mined.
    [[nodiscard]] const std::vector<TxMarker>& provided() const { return provided_; }
    [[nodiscard]] TransactionPriority priority() const { return priority_; }

    [[nodiscard]] std::string to_string() const;

private:
    primitives::PendingTransaction pending_transaction_;
    std::vector<TxMarker>          required_;
    std::vector<TxMarker>          provided_;
    TransactionPriority            priority_ = 0;
};

using PoolTransactionPtr = std::shared_ptr<const PoolTransaction>;

/// Builds the pool view of an account-model transaction: it provides its own
/// (nonce, sender) marker and requires the previous nonce's marker unless it
/// is the next nonce in chain state.
[[nodiscard]] PoolTransactionPtr make_pool_transaction(
    primitives::PendingTransaction tx, uint64_t on_chain_nonce,
    TransactionOrder order);

/// Marker -> hash of the ready transaction providing it.
using ProvidedMarkers = MarkerMap<core::uint256>;

// ---------------------------------------------------------------------------
// PendingPoolTransaction -- admission record for a not-yet-ready transaction
// ---------------------------------------------------------------------------
class PendingPoolTransaction {
public:
    /// Missing markers are the required markers absent from @p provided,
    /// computed once here.
    PendingPoolTransaction(PoolTransactionPtr transaction,
                           const ProvidedMarkers& provided);

    [[nodiscard]] const PoolTransactionPtr& transaction() const { return transaction_; }
    [[nodiscard]] const core::uint256& hash() const { return transaction_->hash(); }
    [[nodiscard]] const std::vector<TxMarker>& missing_markers() const {
        return missing_markers_;
    }
    /// Milliseconds since epoch (core::MockableClock).
    [[nodiscard]] int64_t added_at() const { return added_at_; }

    [[nodiscard]] bool is_ready() const { return missing_markers_.empty(); }

    /// Checks off @p marker. Returns false if it was not missing.
    bool mark(const TxMarker& marker);

    /// Puts @p marker back on the missing list (rollback only).
    void unmark(const TxMarker& marker);

    [[nodiscard]] std::string to_string() const;

private:
    PoolTransactionPtr    transaction_;
    std::vector<TxMarker> missing_markers_;
    int64_t               added_at_ = 0;
};

}  // namespace pool
