// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the pool: admission, promotion, cycles, pruning and
// listener fan-out.

#include "test_framework.h"
#include "pool_test_util.h"

#include "core/logging.h"
#include "pool/inspect.h"
#include "pool/pool.h"

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Snapshot {
    std::vector<core::uint256> ready;
    std::vector<core::uint256> pending;
    std::vector<core::uint256> order;

    bool operator==(const Snapshot&) const = default;
};

Snapshot snapshot(const pool::Pool& p) {
    auto contents = p.contents();
    Snapshot s;
    s.ready = test::sorted(test::hashes_of(contents.ready));
    s.pending = test::sorted(test::hashes_of(contents.pending));
    s.order = test::hashes_of(contents.ready);
    return s;
}

std::vector<core::uint256> ready_order(const pool::Pool& p) {
    return test::hashes_of(p.ready_transactions().collect());
}

} // anonymous namespace

// ============================================================================
// Admission
// ============================================================================

TEST_CASE(Pool, no_requirements_is_ready) {
    pool::Pool p;
    auto a = test::make_tx("a", {}, {"A"});
    auto added = p.add_transaction(a);
    CHECK_OK(added);
    CHECK(added.value().is_ready());
    CHECK_EQ(added.value().hash(), a->hash());
    CHECK(p.contains(a->hash()));
    CHECK(p.txpool_status() == (pool::TxpoolStatus{1, 0}));

    auto fetched = p.get_transaction(a->hash());
    CHECK(fetched.has_value());
    CHECK_EQ(fetched->hash(), a->hash());
    CHECK(!p.get_transaction(core::uint256{}).has_value());
}

TEST_CASE(Pool, missing_requirement_is_pending) {
    pool::Pool p;
    auto b = test::make_tx("b", {"A"}, {"B"});
    auto added = p.add_transaction(b);
    CHECK_OK(added);
    CHECK(added.value().is_pending());
    CHECK(added.value().ready() == nullptr);
    CHECK(p.txpool_status() == (pool::TxpoolStatus{0, 1}));
    CHECK_EQ(test::hashes_of(p.pending_transactions()),
             std::vector<core::uint256>{b->hash()});
}

TEST_CASE(Pool, duplicate_is_already_imported) {
    pool::Pool p;
    auto a = test::make_tx("a", {}, {"A"});
    auto b = test::make_tx("b", {"Z"}, {"B"});
    CHECK_OK(p.add_transaction(a));
    CHECK_OK(p.add_transaction(b));

    auto again = p.add_transaction(a);
    CHECK_ERR_CODE(again, core::ErrorCode::POOL_ALREADY_IMPORTED);
    if (!again.ok()) {
        CHECK(again.error().transaction() == a);
    }
    CHECK_ERR_CODE(p.add_transaction(b), core::ErrorCode::POOL_ALREADY_IMPORTED);
    CHECK(p.txpool_status() == (pool::TxpoolStatus{1, 1}));
}

TEST_CASE(Pool, hash_lives_in_one_set) {
    pool::Pool p;
    auto a = test::make_tx("a", {}, {"A"});
    auto b = test::make_tx("b", {"A"}, {"B"});
    CHECK_OK(p.add_transaction(b));
    CHECK_OK(p.add_transaction(a));
    auto contents = p.contents();
    CHECK_EQ(contents.ready.size(), 2u);
    CHECK(contents.pending.empty());
}

// ============================================================================
// Scenario A -- promotion cascade
// ============================================================================

TEST_CASE(Pool, scenario_a_promotes_waiting_nonce) {
    pool::Pool p;
    auto tx2 = test::make_account_tx(0x0a, 1, 0);
    auto tx1 = test::make_account_tx(0x0a, 0, 0);

    auto first = p.add_transaction(tx2);
    CHECK_OK(first);
    CHECK(first.value().is_pending());

    auto second = p.add_transaction(tx1);
    CHECK_OK(second);
    const pool::AddedReady* ready = second.value().ready();
    CHECK(ready != nullptr);
    if (ready) {
        CHECK_EQ(ready->hash, tx1->hash());
        CHECK_EQ(ready->promoted, std::vector<core::uint256>{tx2->hash()});
        CHECK(ready->discarded.empty());
        CHECK(ready->removed.empty());
    }
    CHECK(p.pending_transactions().empty());
    CHECK_EQ(ready_order(p), (std::vector<core::uint256>{tx1->hash(), tx2->hash()}));
}

TEST_CASE(Pool, cascade_runs_through_chain) {
    pool::Pool p;
    auto t3 = test::make_account_tx(0x0b, 3, 0);
    auto t2 = test::make_account_tx(0x0b, 2, 0);
    auto t1 = test::make_account_tx(0x0b, 1, 0);
    auto t0 = test::make_account_tx(0x0b, 0, 0);
    CHECK_OK(p.add_transaction(t3));
    CHECK_OK(p.add_transaction(t1));
    CHECK_OK(p.add_transaction(t2));

    auto added = p.add_transaction(t0);
    CHECK_OK(added);
    CHECK_EQ(added.value().ready()->promoted,
             (std::vector<core::uint256>{t1->hash(), t2->hash(), t3->hash()}));
    CHECK_EQ(ready_order(p),
             (std::vector<core::uint256>{t0->hash(), t1->hash(), t2->hash(), t3->hash()}));
}

TEST_CASE(Pool, replacement_reports_removed) {
    pool::Pool p;
    auto a = test::make_tx("a", {}, {"A"});
    auto a2 = test::make_tx("a2", {}, {"A"});
    CHECK_OK(p.add_transaction(a));
    auto added = p.add_transaction(a2);
    CHECK_OK(added);
    CHECK_EQ(test::hashes_of(added.value().ready()->removed),
             std::vector<core::uint256>{a->hash()});
    CHECK(!p.contains(a->hash()));
    CHECK(p.contains(a2->hash()));
}

// ============================================================================
// Scenario B -- cycles roll back
// ============================================================================

TEST_CASE(Pool, scenario_b_cycle_leaves_pool_unchanged) {
    pool::Pool p;
    auto tx_a = test::make_tx("A", {"X"}, {"Y"});
    auto tx_b = test::make_tx("B", {}, {"X", "Y"});
    CHECK_OK(p.add_transaction(tx_a));
    const Snapshot before = snapshot(p);

    auto result = p.add_transaction(tx_b);
    CHECK_ERR_CODE(result, core::ErrorCode::POOL_CYCLIC_TRANSACTION);
    CHECK(snapshot(p) == before);
    CHECK(!p.contains(tx_b->hash()));
    CHECK(p.contains(tx_a->hash()));

    // The restored pending entry still waits on X.
    auto x = test::make_tx("x", {}, {"X"});
    auto added = p.add_transaction(x);
    CHECK_OK(added);
    CHECK_EQ(added.value().ready()->promoted, std::vector<core::uint256>{tx_a->hash()});
}

TEST_CASE(Pool, cycle_restores_displaced_ready_entries) {
    pool::Pool p;
    auto r = test::make_tx("R", {}, {"Y"});
    auto d = test::make_tx("D", {"Y"}, {"Z"});
    auto other = test::make_tx("O", {}, {"O"});
    auto tx_a = test::make_tx("A", {"X"}, {"Y"});
    auto tx_b = test::make_tx("B", {}, {"X", "Y"});
    for (const auto& tx : {r, d, other, tx_a}) CHECK_OK(p.add_transaction(tx));
    const Snapshot before = snapshot(p);
    CHECK_EQ(before.ready.size(), 3u);
    CHECK_EQ(before.pending.size(), 1u);

    CHECK_ERR_CODE(p.add_transaction(tx_b), core::ErrorCode::POOL_CYCLIC_TRANSACTION);
    CHECK(snapshot(p) == before);

    // R still provides Y and D still depends on it.
    auto pruned = p.prune_markers(1, test::markers({"Z"}));
    CHECK_EQ(test::sorted(test::hashes_of(pruned.pruned)),
             test::sorted({r->hash(), d->hash()}));
}

TEST_CASE(Pool, cycle_logs_rollback_warning) {
    auto& logger = core::Logger::instance();
    const auto saved_level = logger.level();
    std::vector<std::string> lines;
    logger.set_capture([&](std::string_view line) { lines.emplace_back(line); });
    logger.set_level(core::LogLevel::WARN);

    pool::Pool p;
    CHECK_OK(p.add_transaction(test::make_tx("A", {"X"}, {"Y"})));
    CHECK_ERR(p.add_transaction(test::make_tx("B", {}, {"X", "Y"})));

    logger.set_capture({});
    logger.set_level(saved_level);

    bool found = false;
    for (const auto& line : lines) {
        if (line.find("[WARN] [MEMPOOL]") != std::string::npos &&
            line.find("cyclic transaction") != std::string::npos) {
            found = true;
        }
    }
    CHECK(found);
}

TEST_CASE(Pool, replacing_own_provider_is_cyclic) {
    pool::Pool p;
    auto t1 = test::make_tx("t1", {"E", "A"}, {"E", "B"});
    auto t2 = test::make_tx("t2", {"B"}, {"C", "D"});
    auto t3 = test::make_tx("t3", {}, {"A", "C"});
    auto t4 = test::make_tx("t4", {"C"}, {"B", "A"});
    auto t5 = test::make_tx("t5", {"B"}, {"E", "A"});
    for (const auto& tx : {t1, t2, t3}) CHECK_OK(p.add_transaction(tx));
    const Snapshot before = snapshot(p);

    // t4 needs C from t3 but would displace t3 through A.
    CHECK_ERR_CODE(p.add_transaction(t4), core::ErrorCode::POOL_CYCLIC_TRANSACTION);
    CHECK(snapshot(p) == before);

    auto added = p.add_transaction(t5);
    CHECK_OK(added);
    CHECK(added.value().is_pending());
    CHECK(p.txpool_status() == (pool::TxpoolStatus{1, 3}));
    CHECK_EQ(ready_order(p), std::vector<core::uint256>{t3->hash()});
}

TEST_CASE(Pool, cascade_discards_transaction_needing_displaced_provider) {
    pool::Pool p;
    auto r = test::make_tx("R", {}, {"X", "N"});
    auto waiting = test::make_tx("P", {"M", "N"}, {"X"});
    auto s = test::make_tx("S", {}, {"M"});
    CHECK_OK(p.add_transaction(r));
    CHECK_OK(p.add_transaction(waiting));
    auto rx = p.add_ready_listener();

    auto added = p.add_transaction(s);
    CHECK_OK(added);
    const auto* ready = added.value().ready();
    CHECK(ready != nullptr);
    if (ready) {
        CHECK(ready->promoted.empty());
        CHECK_EQ(ready->discarded, std::vector<core::uint256>{waiting->hash()});
        CHECK(ready->removed.empty());
    }
    CHECK(!p.contains(waiting->hash()));
    CHECK(p.txpool_status() == (pool::TxpoolStatus{2, 0}));
    CHECK_EQ(ready_order(p), (std::vector<core::uint256>{r->hash(), s->hash()}));
    CHECK_EQ(rx.drain(), std::vector<core::uint256>{s->hash()});
}

// ============================================================================
// Scenario C -- mined blocks
// ============================================================================

TEST_CASE(Pool, scenario_c_mining_empties_pool) {
    pool::Pool p;
    auto tx2 = test::make_account_tx(0x0c, 1, 0);
    auto tx1 = test::make_account_tx(0x0c, 0, 0);
    CHECK_OK(p.add_transaction(tx2));
    CHECK_OK(p.add_transaction(tx1));

    pool::MinedBlockOutcome outcome;
    outcome.block_number = 1;
    outcome.included = {tx1, tx2};
    auto result = p.on_mined_block(outcome);
    CHECK_EQ(test::sorted(test::hashes_of(result.pruned)),
             test::sorted({tx1->hash(), tx2->hash()}));
    CHECK(result.promoted.empty());
    CHECK(result.failed.empty());
    CHECK(p.txpool_status() == (pool::TxpoolStatus{0, 0}));
}

TEST_CASE(Pool, mined_marker_promotes_pending) {
    pool::Pool p;
    auto tx1 = test::make_account_tx(0x0d, 1, 0);
    auto tx2 = test::make_account_tx(0x0d, 2, 0);
    CHECK_OK(p.add_transaction(tx1));
    CHECK_OK(p.add_transaction(tx2));
    CHECK(p.txpool_status() == (pool::TxpoolStatus{0, 2}));

    // Nonce 0 was mined elsewhere.
    auto mined = test::make_account_tx(0x0d, 0, 0);
    pool::MinedBlockOutcome outcome;
    outcome.block_number = 7;
    outcome.included = {mined};
    auto result = p.on_mined_block(outcome);

    CHECK(result.pruned.empty());
    CHECK_EQ(result.promoted.size(), 1u);
    if (!result.promoted.empty()) {
        CHECK_EQ(result.promoted.front().hash(), tx1->hash());
        CHECK_EQ(result.promoted.front().ready()->promoted,
                 std::vector<core::uint256>{tx2->hash()});
    }
    CHECK(p.txpool_status() == (pool::TxpoolStatus{2, 0}));
}

TEST_CASE(Pool, mined_block_removes_invalid) {
    pool::Pool p;
    auto a = test::make_tx("a", {}, {"A"});
    auto b = test::make_tx("b", {"A"}, {"B"});
    auto q = test::make_tx("q", {"Q"}, {"QQ"});
    for (const auto& tx : {a, b, q}) CHECK_OK(p.add_transaction(tx));

    pool::MinedBlockOutcome outcome;
    outcome.block_number = 2;
    outcome.invalid = {a, q};
    p.on_mined_block(outcome);
    CHECK(p.txpool_status() == (pool::TxpoolStatus{0, 0}));
}

TEST_CASE(Pool, prune_reports_failed_promotion) {
    pool::Pool p;
    auto waiting = test::make_tx("P", {"M"}, {"X", "Y"});
    auto q = test::make_tx("Q", {"X"}, {"Y"});
    CHECK_OK(p.add_transaction(waiting));
    CHECK_OK(p.add_transaction(q));

    // Q, unlocked by P, would displace P while depending on it.
    auto result = p.prune_markers(5, test::markers({"M"}));
    CHECK_EQ(result.failed, std::vector<core::uint256>{waiting->hash()});
    CHECK(result.promoted.empty());
    CHECK(result.pruned.empty());
    CHECK(!p.contains(waiting->hash()));
    CHECK(p.txpool_status() == (pool::TxpoolStatus{0, 1}));

    // Q is back in pending, still waiting on X.
    auto added = p.add_transaction(test::make_tx("x", {}, {"X"}));
    CHECK_OK(added);
    CHECK_EQ(added.value().ready()->promoted, std::vector<core::uint256>{q->hash()});
}

TEST_CASE(Pool, pruning_is_idempotent) {
    pool::Pool p;
    auto a = test::make_tx("a", {}, {"A"});
    auto b = test::make_tx("b", {"A"}, {"B"});
    auto c = test::make_tx("c", {"B", "W"}, {"C"});
    for (const auto& tx : {a, b, c}) CHECK_OK(p.add_transaction(tx));

    auto first = p.prune_markers(1, test::markers({"A"}));
    CHECK_EQ(test::hashes_of(first.pruned), std::vector<core::uint256>{a->hash()});
    const Snapshot after_first = snapshot(p);

    auto second = p.prune_markers(1, test::markers({"A"}));
    CHECK(second.pruned.empty());
    CHECK(second.promoted.empty());
    CHECK(second.failed.empty());
    CHECK(snapshot(p) == after_first);
}

// ============================================================================
// Scenario D -- listeners
// ============================================================================

TEST_CASE(Pool, scenario_d_listener_sees_primary_then_promoted) {
    pool::Pool p;
    auto rx = p.add_ready_listener();
    auto tx2 = test::make_account_tx(0x0e, 1, 0);
    auto tx1 = test::make_account_tx(0x0e, 0, 0);

    CHECK_OK(p.add_transaction(tx2));
    CHECK(rx.empty());
    CHECK_OK(p.add_transaction(tx1));

    CHECK_EQ(rx.drain(), (std::vector<core::uint256>{tx1->hash(), tx2->hash()}));
    CHECK(rx.empty());
}

TEST_CASE(Pool, every_listener_notified_once) {
    pool::Pool p;
    auto rx1 = p.add_ready_listener();
    auto rx2 = p.add_ready_listener();
    auto a = test::make_tx("a", {}, {"A"});
    CHECK_OK(p.add_transaction(a));
    CHECK_EQ(rx1.drain(), std::vector<core::uint256>{a->hash()});
    CHECK_EQ(rx2.drain(), std::vector<core::uint256>{a->hash()});
}

TEST_CASE(Pool, closed_listener_is_removed) {
    pool::Pool p;
    auto keep = p.add_ready_listener();
    {
        auto dropped = p.add_ready_listener();
    }
    CHECK_EQ(p.listener_count(), 2u);
    CHECK_OK(p.add_transaction(test::make_tx("a", {}, {"A"})));
    CHECK_EQ(p.listener_count(), 1u);
    CHECK_EQ(keep.size(), 1u);
}

TEST_CASE(Pool, full_listener_drops_but_stays) {
    pool::Pool p(1);
    auto rx = p.add_ready_listener();
    auto a = test::make_tx("a", {}, {"A"});
    auto b = test::make_tx("b", {}, {"B"});
    CHECK_OK(p.add_transaction(a));
    CHECK_OK(p.add_transaction(b));
    CHECK_EQ(p.listener_count(), 1u);
    CHECK_EQ(rx.drain(), std::vector<core::uint256>{a->hash()});

    auto c = test::make_tx("c", {}, {"C"});
    CHECK_OK(p.add_transaction(c));
    CHECK_EQ(rx.drain(), std::vector<core::uint256>{c->hash()});
}

TEST_CASE(Pool, zero_listener_capacity_stays_bounded) {
    pool::Pool p(0);
    CHECK_EQ(p.listener_capacity(), 1u);
    auto rx = p.add_ready_listener();
    auto a = test::make_tx("a", {}, {"A"});
    CHECK_OK(p.add_transaction(a));
    CHECK_OK(p.add_transaction(test::make_tx("b", {}, {"B"})));
    CHECK_EQ(rx.drain(), std::vector<core::uint256>{a->hash()});
}

TEST_CASE(Pool, pending_admission_and_rejection_do_not_notify) {
    pool::Pool p;
    auto rx = p.add_ready_listener();
    auto a = test::make_tx("a", {"Z"}, {"A"});
    CHECK_OK(p.add_transaction(a));
    CHECK_ERR(p.add_transaction(a));
    CHECK_ERR(p.add_transaction(test::make_tx("B", {}, {"Z", "A"})));
    CHECK(rx.empty());
}

TEST_CASE(Pool, prune_promotion_notifies) {
    pool::Pool p;
    auto rx = p.add_ready_listener();
    auto w = test::make_tx("w", {"M"}, {"W"});
    CHECK_OK(p.add_transaction(w));
    p.prune_markers(3, test::markers({"M"}));
    CHECK_EQ(rx.drain(), std::vector<core::uint256>{w->hash()});
}

// ============================================================================
// Removal
// ============================================================================

TEST_CASE(Pool, remove_invalid_cascades_and_is_total) {
    pool::Pool p;
    CHECK(p.remove_invalid({}).empty());

    auto a = test::make_tx("a", {}, {"A"});
    auto b = test::make_tx("b", {"A"}, {"B"});
    auto q = test::make_tx("q", {"Q"}, {"QQ"});
    for (const auto& tx : {a, b, q}) CHECK_OK(p.add_transaction(tx));

    auto removed = p.remove_invalid({a->hash(), q->hash(), core::uint256{}});
    CHECK_EQ(test::sorted(test::hashes_of(removed)),
             test::sorted({a->hash(), b->hash(), q->hash()}));
    CHECK(p.txpool_status() == (pool::TxpoolStatus{0, 0}));
    CHECK(p.remove_invalid({a->hash()}).empty());
}

TEST_CASE(Pool, remove_transactions_by_address) {
    pool::Pool p;
    auto mine0 = test::make_account_tx(0x21, 0, 0);
    auto mine2 = test::make_account_tx(0x21, 2, 0);
    auto theirs = test::make_account_tx(0x22, 0, 0);
    for (const auto& tx : {mine0, mine2, theirs}) CHECK_OK(p.add_transaction(tx));

    auto removed = p.remove_transactions_by_address(test::address(0x21));
    CHECK_EQ(test::sorted(test::hashes_of(removed)),
             test::sorted({mine0->hash(), mine2->hash()}));
    CHECK(p.txpool_status() == (pool::TxpoolStatus{1, 0}));
    CHECK(p.remove_transactions_by_address(test::address(0x21)).empty());
}

TEST_CASE(Pool, drop_transaction) {
    pool::Pool p;
    auto a = test::make_tx("a", {}, {"A"});
    CHECK_OK(p.add_transaction(a));
    CHECK(p.drop_transaction(core::uint256{}) == nullptr);
    auto dropped = p.drop_transaction(a->hash());
    CHECK(dropped == a);
    CHECK(!p.contains(a->hash()));
}

TEST_CASE(Pool, clear_empties_both_sets) {
    pool::Pool p;
    CHECK_OK(p.add_transaction(test::make_tx("a", {}, {"A"})));
    CHECK_OK(p.add_transaction(test::make_tx("b", {"Q"}, {"B"})));
    p.clear();
    CHECK(p.txpool_status() == (pool::TxpoolStatus{0, 0}));
}

// ============================================================================
// Ordering and concurrency
// ============================================================================

TEST_CASE(Pool, fees_order_prefers_gas_price) {
    pool::Pool p;
    auto cheap = test::make_account_tx(0x31, 0, 0, 1, pool::TransactionOrder::FEES);
    auto rich = test::make_account_tx(0x32, 0, 0, 50, pool::TransactionOrder::FEES);
    auto rich_next = test::make_account_tx(0x32, 1, 0, 60, pool::TransactionOrder::FEES);
    for (const auto& tx : {cheap, rich, rich_next}) CHECK_OK(p.add_transaction(tx));
    CHECK_EQ(ready_order(p),
             (std::vector<core::uint256>{rich->hash(), rich_next->hash(), cheap->hash()}));
}

TEST_CASE(Pool, concurrent_submissions) {
    auto p = std::make_shared<pool::Pool>();
    auto rx = p->add_ready_listener();
    std::vector<std::thread> threads;
    for (uint8_t t = 0; t < 4; ++t) {
        threads.emplace_back([p, t] {
            for (uint64_t nonce = 0; nonce < 25; ++nonce) {
                auto added = p->add_transaction(
                    test::make_account_tx(static_cast<uint8_t>(0x40 + t), nonce, 0));
                (void)added;
                (void)p->txpool_status();
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(p->txpool_status() == (pool::TxpoolStatus{100, 0}));
    CHECK_EQ(p->ready_transactions().collect().size(), 100u);
    CHECK_EQ(rx.drain().size(), 100u);
}

// ============================================================================
// Inspect views
// ============================================================================

TEST_CASE(Inspect, groups_by_sender_and_nonce) {
    pool::Pool p;
    auto s0 = test::make_account_tx(0x51, 0, 0, 3);
    auto s1 = test::make_account_tx(0x51, 1, 0, 3);
    auto gap = test::make_account_tx(0x52, 4, 2, 7);
    for (const auto& tx : {s0, s1, gap}) CHECK_OK(p.add_transaction(tx));

    auto inspect = pool::txpool_inspect(p);
    CHECK_EQ(inspect.pending.size(), 1u);
    CHECK_EQ(inspect.pending[test::address(0x51)].size(), 2u);
    CHECK_EQ(inspect.queued[test::address(0x52)].count(4), 1u);

    const auto& summary = inspect.pending[test::address(0x51)][1];
    CHECK_EQ(summary.gas_price, 3u);
    CHECK_EQ(summary.gas_limit, 21000u);
    CHECK_EQ(summary.to_string(),
             "0x" + test::address(0xee).to_hex() + ": 0 wei + 21000 gas x 3 wei");

    auto content = pool::txpool_content(p);
    CHECK(content.queued[test::address(0x52)].at(4) == gap->pending_transaction());
    CHECK(content.pending[test::address(0x51)].at(0) == s0->pending_transaction());
}

TEST_CASE(Inspect, contract_creation_summary) {
    pool::TxSummary summary;
    summary.value = 5;
    summary.gas_limit = 100;
    summary.gas_price = 2;
    CHECK_EQ(summary.to_string(), "contract creation: 5 wei + 100 gas x 2 wei");
}
