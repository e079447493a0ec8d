#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// PendingTransaction -- a signed account-model transaction awaiting inclusion
// ---------------------------------------------------------------------------
// Signature, balance and gas checks happen before a transaction reaches the
// pool; this type only carries the fields the pool and its views need.
// The hash is SHA3-256 over the canonical field encoding and is computed
// once, at construction.
// ---------------------------------------------------------------------------
class PendingTransaction {
public:
    PendingTransaction(core::uint160 sender,
                       uint64_t nonce,
                       std::optional<core::uint160> to,
                       uint64_t value,
                       uint64_t gas_limit,
                       uint64_t gas_price,
                       std::vector<uint8_t> input = {});

    [[nodiscard]] const core::uint256& hash() const { return hash_; }
    [[nodiscard]] const core::uint160& sender() const { return sender_; }
    [[nodiscard]] uint64_t nonce() const { return nonce_; }
    /// Empty for contract creation.
    [[nodiscard]] const std::optional<core::uint160>& to() const { return to_; }
    [[nodiscard]] uint64_t value() const { return value_; }
    [[nodiscard]] uint64_t gas_limit() const { return gas_limit_; }
    [[nodiscard]] uint64_t gas_price() const { return gas_price_; }
    [[nodiscard]] const std::vector<uint8_t>& input() const { return input_; }

    /// Canonical byte encoding the hash is computed over.
    [[nodiscard]] std::vector<uint8_t> encode() const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const PendingTransaction& other) const {
        return hash_ == other.hash_;
    }

private:
    [[nodiscard]] core::uint256 compute_hash() const;

    core::uint160                sender_;
    uint64_t                     nonce_ = 0;
    std::optional<core::uint160> to_;
    uint64_t                     value_ = 0;
    uint64_t                     gas_limit_ = 0;
    uint64_t                     gas_price_ = 0;
    std::vector<uint8_t>         input_;
    core::uint256                hash_;
};

}  // namespace primitives
