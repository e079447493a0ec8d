#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"
#include "pool/pool.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pool {

/// Short form of a transaction as shown by txpool_inspect.
struct TxSummary {
    std::optional<core::uint160> to;
    uint64_t                     value = 0;
    uint64_t                     gas_limit = 0;
    uint64_t                     gas_price = 0;

    static TxSummary from(const primitives::PendingTransaction& tx);

    /// "<to>: <value> wei + <gas_limit> gas x <gas_price> wei"; contract
    /// creations show "contract creation" in place of the recipient.
    [[nodiscard]] std::string to_string() const;
};

/// sender -> nonce -> T
template <typename T>
using BySender = std::map<core::uint160, std::map<uint64_t, T>>;

/// `pending` holds ready transactions, `queued` blocked ones.
struct TxpoolInspect {
    BySender<TxSummary> pending;
    BySender<TxSummary> queued;
};

struct TxpoolContent {
    BySender<primitives::PendingTransaction> pending;
    BySender<primitives::PendingTransaction> queued;
};

[[nodiscard]] TxpoolInspect txpool_inspect(const Pool& pool);
[[nodiscard]] TxpoolContent txpool_content(const Pool& pool);

}  // namespace pool
