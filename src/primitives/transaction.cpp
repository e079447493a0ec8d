// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include "crypto/keccak.h"

#include <sstream>

namespace primitives {

namespace {

void append_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

}  // namespace

PendingTransaction::PendingTransaction(core::uint160 sender,
                                       uint64_t nonce,
                                       std::optional<core::uint160> to,
                                       uint64_t value,
                                       uint64_t gas_limit,
                                       uint64_t gas_price,
                                       std::vector<uint8_t> input)
    : sender_(sender)
    , nonce_(nonce)
    , to_(to)
    , value_(value)
    , gas_limit_(gas_limit)
    , gas_price_(gas_price)
    , input_(std::move(input))
    , hash_(compute_hash())
{
}

// Layout: sender(20) | nonce(8 LE) | has_to(1) [| to(20)] | value(8 LE) |
//         gas_limit(8 LE) | gas_price(8 LE) | input_len(4 LE) | input
std::vector<uint8_t> PendingTransaction::encode() const {
    std::vector<uint8_t> out;
    out.reserve(20 + 8 + 1 + 20 + 24 + 4 + input_.size());

    out.insert(out.end(), sender_.bytes().begin(), sender_.bytes().end());
    append_u64(out, nonce_);
    out.push_back(to_.has_value() ? 1 : 0);
    if (to_) {
        out.insert(out.end(), to_->bytes().begin(), to_->bytes().end());
    }
    append_u64(out, value_);
    append_u64(out, gas_limit_);
    append_u64(out, gas_price_);

    const auto len = static_cast<uint32_t>(input_.size());
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(len >> (8 * i)));
    }
    out.insert(out.end(), input_.begin(), input_.end());
    return out;
}

core::uint256 PendingTransaction::compute_hash() const {
    crypto::Keccak256Hasher hasher;
    hasher.write(sender_.span());
    hasher.write_u64(nonce_);
    const uint8_t has_to = to_.has_value() ? 1 : 0;
    hasher.write(std::span<const uint8_t>(&has_to, 1));
    if (to_) {
        hasher.write(to_->span());
    }
    hasher.write_u64(value_);
    hasher.write_u64(gas_limit_);
    hasher.write_u64(gas_price_);
    hasher.write_sized(input_);
    return hasher.finalize();
}

std::string PendingTransaction::to_string() const {
    std::ostringstream ss;
    ss << "PendingTransaction(hash=" << hash_.to_hex()
       << ", sender=0x" << sender_.to_hex()
       << ", nonce=" << nonce_
       << ", to=" << (to_ ? "0x" + to_->to_hex() : std::string("<create>"))
       << ", value=" << value_
       << ", gas_limit=" << gas_limit_
       << ", gas_price=" << gas_price_
       << ", input_len=" << input_.size() << ")";
    return ss.str();
}

}  // namespace primitives
