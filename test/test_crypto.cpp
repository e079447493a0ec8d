// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for hashing and the transaction primitive.

#include "test_framework.h"

#include "crypto/keccak.h"
#include "primitives/transaction.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

core::uint160 addr(uint8_t fill) {
    std::array<uint8_t, 20> raw{};
    raw.fill(fill);
    return core::uint160::from_bytes(raw);
}

} // anonymous namespace

// ============================================================================
// Keccak256 (SHA3-256)
// ============================================================================

TEST_CASE(Keccak, empty_input_vector) {
    auto h = crypto::keccak256(std::vector<uint8_t>{});
    CHECK_EQ(h.to_hex(),
             "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST_CASE(Keccak, abc_vector) {
    auto h = crypto::keccak256(bytes_of("abc"));
    CHECK_EQ(h.to_hex(),
             "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST_CASE(Keccak, streaming_matches_one_shot) {
    crypto::Keccak256Hasher hasher;
    auto a = bytes_of("ab");
    auto c = bytes_of("c");
    hasher.write(a).write(c);
    CHECK_EQ(hasher.finalize(), crypto::keccak256(bytes_of("abc")));

    hasher.reset();
    hasher.write_u64(0x0102030405060708ULL);
    std::vector<uint8_t> le = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    CHECK_EQ(hasher.finalize(), crypto::keccak256(le));
}

TEST_CASE(Keccak, sized_write_prefixes_length) {
    crypto::Keccak256Hasher hasher;
    hasher.write_sized(bytes_of("xy"));
    std::vector<uint8_t> expected = {0x02, 0x00, 0x00, 0x00, 'x', 'y'};
    CHECK_EQ(hasher.finalize(), crypto::keccak256(expected));
}

// ============================================================================
// PendingTransaction
// ============================================================================

TEST_CASE(PendingTransaction, hash_is_digest_of_encoding) {
    primitives::PendingTransaction tx(addr(0x11), 7, addr(0x22), 1000, 21000, 5);
    CHECK_EQ(tx.hash(), crypto::keccak256(tx.encode()));
    CHECK_EQ(tx.encode().size(), 20u + 8 + 1 + 20 + 24 + 4);
}

TEST_CASE(PendingTransaction, fields_change_hash) {
    primitives::PendingTransaction base(addr(0x11), 7, addr(0x22), 1000, 21000, 5);
    primitives::PendingTransaction other_nonce(addr(0x11), 8, addr(0x22), 1000, 21000, 5);
    primitives::PendingTransaction create(addr(0x11), 7, std::nullopt, 1000, 21000, 5);
    primitives::PendingTransaction with_input(addr(0x11), 7, addr(0x22), 1000, 21000, 5,
                                              {0x01});
    primitives::PendingTransaction same(addr(0x11), 7, addr(0x22), 1000, 21000, 5);

    CHECK(base.hash() != other_nonce.hash());
    CHECK(base.hash() != create.hash());
    CHECK(base.hash() != with_input.hash());
    CHECK(base == same);
}

TEST_CASE(PendingTransaction, to_string_mentions_fields) {
    primitives::PendingTransaction tx(addr(0x11), 3, std::nullopt, 0, 21000, 9);
    auto s = tx.to_string();
    CHECK(s.find("nonce=3") != std::string::npos);
    CHECK(s.find("<create>") != std::string::npos);
    CHECK(s.find(tx.hash().to_hex()) != std::string::npos);
}
