// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/inspect.h"

#include <sstream>

namespace pool {

namespace {

template <typename T, typename Fn>
void group(BySender<T>& out, const std::vector<PoolTransactionPtr>& txs, Fn&& fn) {
    for (const auto& tx : txs) {
        const auto& pending = tx->pending_transaction();
        out[pending.sender()].insert_or_assign(pending.nonce(), fn(pending));
    }
}

}  // namespace

TxSummary TxSummary::from(const primitives::PendingTransaction& tx) {
    return TxSummary{tx.to(), tx.value(), tx.gas_limit(), tx.gas_price()};
}

std::string TxSummary::to_string() const {
    std::ostringstream oss;
    if (to) {
        oss << "0x" << to->to_hex();
    } else {
        oss << "contract creation";
    }
    oss << ": " << value << " wei + " << gas_limit << " gas x "
        << gas_price << " wei";
    return oss.str();
}

TxpoolInspect txpool_inspect(const Pool& pool) {
    const PoolContents contents = pool.contents();
    auto summarize = [](const primitives::PendingTransaction& tx) {
        return TxSummary::from(tx);
    };

    TxpoolInspect inspect;
    group(inspect.pending, contents.ready, summarize);
    group(inspect.queued, contents.pending, summarize);
    return inspect;
}

TxpoolContent txpool_content(const Pool& pool) {
    const PoolContents contents = pool.contents();
    auto copy = [](const primitives::PendingTransaction& tx) { return tx; };

    TxpoolContent content;
    group(content.pending, contents.ready, copy);
    group(content.queued, contents.pending, copy);
    return content;
}

}  // namespace pool
