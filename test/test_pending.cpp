// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the pending (blocked) index.

#include "test_framework.h"
#include "pool_test_util.h"

#include "core/time.h"
#include "pool/pending.h"

#include <vector>

namespace {

pool::PendingPoolTransaction blocked(const pool::PoolTransactionPtr& tx) {
    return pool::PendingPoolTransaction(tx, {});
}

} // anonymous namespace

TEST_CASE(PendingTransactions, add_and_lookup) {
    pool::PendingTransactions pending;
    auto a = test::make_tx("a", {"X"}, {"A"});
    CHECK_OK(pending.add_transaction(blocked(a)));
    CHECK(pending.contains(a->hash()));
    CHECK_EQ(pending.len(), 1u);
    CHECK_EQ(pending.get(a->hash())->missing_markers(), test::markers({"X"}));
    CHECK(pending.get(core::uint256{}) == nullptr);
}

TEST_CASE(PendingTransactions, rejects_ready_and_duplicate) {
    pool::PendingTransactions pending;
    auto ready = test::make_tx("r", {}, {"R"});
    CHECK_ERR_CODE(pending.add_transaction(blocked(ready)),
                   core::ErrorCode::POOL_INVALID_STATE);

    auto a = test::make_tx("a", {"X"}, {"A"});
    CHECK_OK(pending.add_transaction(blocked(a)));
    CHECK_ERR_CODE(pending.add_transaction(blocked(a)),
                   core::ErrorCode::POOL_INVALID_STATE);
    CHECK_EQ(pending.len(), 1u);
}

TEST_CASE(PendingTransactions, mark_and_unlock_releases_when_complete) {
    pool::PendingTransactions pending;
    auto a = test::make_tx("a", {"X"}, {"A"});
    auto b = test::make_tx("b", {"X", "Y"}, {"B"});
    CHECK_OK(pending.add_transaction(blocked(a)));
    CHECK_OK(pending.add_transaction(blocked(b)));

    pool::MarkJournal journal;
    auto unlocked = pending.mark_and_unlock(test::markers({"X"}), &journal);
    CHECK_EQ(unlocked.size(), 1u);
    CHECK_EQ(unlocked.front().hash(), a->hash());
    CHECK(unlocked.front().is_ready());
    CHECK_EQ(journal.size(), 2u);
    CHECK(!pending.contains(a->hash()));
    CHECK_EQ(pending.get(b->hash())->missing_markers(), test::markers({"Y"}));

    CHECK(pending.mark_and_unlock(test::markers({"X"})).empty());

    unlocked = pending.mark_and_unlock(test::markers({"Y"}));
    CHECK_EQ(unlocked.size(), 1u);
    CHECK(pending.is_empty());
}

TEST_CASE(PendingTransactions, remove_ignores_unknown) {
    pool::PendingTransactions pending;
    auto a = test::make_tx("a", {"X"}, {"A"});
    auto b = test::make_tx("b", {"X"}, {"B"});
    CHECK_OK(pending.add_transaction(blocked(a)));
    CHECK_OK(pending.add_transaction(blocked(b)));

    auto removed = pending.remove({a->hash(), core::uint256{}});
    CHECK_EQ(test::hashes_of(removed), std::vector<core::uint256>{a->hash()});

    // a no longer waits on X.
    auto unlocked = pending.mark_and_unlock(test::markers({"X"}));
    CHECK_EQ(unlocked.size(), 1u);
    CHECK_EQ(unlocked.front().hash(), b->hash());
}

TEST_CASE(PendingTransactions, restore_undoes_marks) {
    pool::PendingTransactions pending;
    auto a = test::make_tx("a", {"X"}, {"A"});
    auto b = test::make_tx("b", {"X", "Y"}, {"B"});
    CHECK_OK(pending.add_transaction(blocked(a)));
    CHECK_OK(pending.add_transaction(blocked(b)));
    const int64_t added_at = pending.get(a->hash())->added_at();

    pool::MarkJournal journal;
    auto unlocked = pending.mark_and_unlock(test::markers({"X"}), &journal);
    CHECK_OK(pending.restore(journal, unlocked));

    CHECK_EQ(pending.len(), 2u);
    CHECK_EQ(pending.get(a->hash())->missing_markers(), test::markers({"X"}));
    CHECK_EQ(pending.get(a->hash())->added_at(), added_at);
    CHECK_EQ(pending.get(b->hash())->missing_markers().size(), 2u);

    // Both wait on X again.
    CHECK_EQ(pending.mark_and_unlock(test::markers({"X"})).size(), 1u);
}

TEST_CASE(PendingTransactions, restore_rejects_inconsistent_journal) {
    pool::PendingTransactions pending;
    auto a = test::make_tx("a", {"X"}, {"A"});
    pool::MarkJournal journal{pool::MarkRecord{a->hash(), test::marker("X")}};
    CHECK_ERR_CODE(pending.restore(journal, {}), core::ErrorCode::POOL_INVALID_STATE);
}

TEST_CASE(PendingTransactions, snapshot_ordered_by_arrival) {
    pool::PendingTransactions pending;
    auto a = test::make_tx("a", {"X"}, {"A"});
    auto b = test::make_tx("b", {"X"}, {"B"});
    core::MockableClock::set_mock_millis(2000);
    CHECK_OK(pending.add_transaction(blocked(b)));
    core::MockableClock::set_mock_millis(1000);
    CHECK_OK(pending.add_transaction(blocked(a)));
    core::MockableClock::set_mock_millis(0);

    CHECK_EQ(test::hashes_of(pending.transactions()),
             (std::vector<core::uint256>{a->hash(), b->hash()}));
    CHECK_EQ(pending.transactions_by_sender(test::address(0x01)).size(), 2u);
    CHECK(pending.transactions_by_sender(test::address(0x09)).empty());

    pending.clear();
    CHECK(pending.is_empty());
}
