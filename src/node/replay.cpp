// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/replay.h"
#include "core/hex.h"
#include "core/logging.h"
#include "crypto/keccak.h"
#include "pool/inspect.h"
#include "primitives/transaction.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace node {

namespace {

core::Error line_error(size_t line_no, const std::string& msg) {
    return core::make_error(core::ErrorCode::PARSE_ERROR,
        "line " + std::to_string(line_no) + ": " + msg);
}

core::Result<uint64_t> parse_u64(const std::string& s, std::string_view what,
                                 size_t line_no) {
    uint64_t value = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc() || ptr != end || s.empty()) {
        return line_error(line_no,
            "invalid " + std::string(what) + " `" + s + "`");
    }
    return value;
}

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::istringstream iss{std::string(line)};
    std::string word;
    while (iss >> word) words.push_back(std::move(word));
    return words;
}

}  // namespace

Replay::Replay(std::shared_ptr<pool::Pool> pool, pool::TransactionOrder order,
               std::ostream& out)
    : pool_(std::move(pool)),
      order_(order),
      out_(out),
      listener_(pool_->add_ready_listener()) {}

core::uint160 Replay::sender_address(std::string_view name) {
    std::string_view bare = core::strip_hex_prefix(name);
    if (bare.size() == core::uint160::SIZE * 2 && core::is_hex(bare)) {
        return core::uint160::from_hex(bare);
    }
    auto digest = crypto::keccak256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(name.data()), name.size()));
    // Last 20 bytes of the digest, as account addresses are derived.
    return core::uint160::from_bytes(
        std::span<const uint8_t, 20>(digest.data() + 12, 20));
}

core::Result<void> Replay::run_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return core::make_error(core::ErrorCode::CONFIG_FILE_MISSING,
            "Cannot open scenario: " + path);
    }
    return run(in);
}

core::Result<void> Replay::run(std::istream& in) {
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        SLUICE_TRY_VOID(execute(line, line_no));
    }
    return core::make_ok();
}

core::Result<void> Replay::execute(std::string_view line, size_t line_no) {
    if (auto hash = line.find('#'); hash != std::string_view::npos) {
        line = line.substr(0, hash);
    }
    Args args = split_words(line);
    if (args.empty()) return core::make_ok();

    const std::string cmd = args.front();
    args.erase(args.begin());

    core::Result<void> result;
    if (cmd == "submit") {
        result = cmd_submit(args, line_no);
    } else if (cmd == "mine") {
        result = cmd_mine(args, line_no);
    } else if (cmd == "invalid") {
        result = cmd_invalid(args, line_no);
    } else if (cmd == "drop") {
        result = cmd_drop(args, line_no);
    } else if (cmd == "evict") {
        result = cmd_evict(args, line_no);
    } else if (cmd == "status" && args.empty()) {
        cmd_status();
    } else if (cmd == "ready" && args.empty()) {
        cmd_ready();
    } else if (cmd == "inspect" && args.empty()) {
        cmd_inspect();
    } else if (cmd == "clear" && args.empty()) {
        cmd_clear();
    } else {
        return line_error(line_no, "unknown command `" + std::string(line) + "`");
    }
    if (!result.ok()) return result;

    print_notifications();
    return core::make_ok();
}

core::Result<void> Replay::cmd_submit(const Args& args, size_t line_no) {
    if (args.size() != 5) {
        return line_error(line_no,
            "usage: submit <tag> <sender> <nonce> <on_chain_nonce> <gas_price>");
    }
    const std::string& tag = args[0];
    SLUICE_TRY_ASSIGN(nonce, parse_u64(args[2], "nonce", line_no));
    SLUICE_TRY_ASSIGN(on_chain, parse_u64(args[3], "on_chain_nonce", line_no));
    SLUICE_TRY_ASSIGN(gas_price, parse_u64(args[4], "gas_price", line_no));

    const core::uint160 sender = sender_address(args[1]);
    primitives::PendingTransaction tx(
        sender, nonce, sender, 0, 21000, gas_price,
        std::vector<uint8_t>(tag.begin(), tag.end()));
    auto pool_tx = pool::make_pool_transaction(std::move(tx), on_chain, order_);

    auto added = pool_->add_transaction(pool_tx);
    if (!added.ok()) {
        out_ << "submit " << tag << " -> rejected: "
             << core::error_code_name(added.error().code()) << "\n";
        return core::make_ok();
    }

    by_tag_[tag] = pool_tx;
    tags_[pool_tx->hash()] = tag;

    const auto& outcome = added.value();
    if (const auto* ready = outcome.ready()) {
        out_ << "submit " << tag << " -> Ready promoted=[" << tags_of(ready->promoted)
             << "] discarded=[" << tags_of(ready->discarded)
             << "] removed=[" << tags_of(ready->removed) << "]\n";
    } else {
        out_ << "submit " << tag << " -> Pending\n";
    }
    return core::make_ok();
}

core::Result<void> Replay::cmd_mine(const Args& args, size_t line_no) {
    if (args.empty()) {
        return line_error(line_no, "usage: mine <block> <tag>...");
    }
    SLUICE_TRY_ASSIGN(block, parse_u64(args[0], "block number", line_no));

    pool::MinedBlockOutcome outcome;
    outcome.block_number = block;
    for (size_t i = 1; i < args.size(); ++i) {
        SLUICE_TRY_ASSIGN(tx, lookup(args[i], line_no));
        outcome.included.push_back(std::move(tx));
    }

    auto result = pool_->on_mined_block(outcome);
    std::vector<core::uint256> promoted;
    for (const auto& added : result.promoted) promoted.push_back(added.hash());
    out_ << "mine " << block << " -> pruned=[" << tags_of(result.pruned)
         << "] promoted=[" << tags_of(promoted)
         << "] failed=[" << tags_of(result.failed) << "]\n";
    return core::make_ok();
}

core::Result<void> Replay::cmd_invalid(const Args& args, size_t line_no) {
    std::vector<core::uint256> hashes;
    for (const auto& tag : args) {
        SLUICE_TRY_ASSIGN(tx, lookup(tag, line_no));
        hashes.push_back(tx->hash());
    }
    auto removed = pool_->remove_invalid(hashes);
    out_ << "invalid -> removed=[" << tags_of(removed) << "]\n";
    return core::make_ok();
}

core::Result<void> Replay::cmd_drop(const Args& args, size_t line_no) {
    if (args.size() != 1) {
        return line_error(line_no, "usage: drop <tag>");
    }
    SLUICE_TRY_ASSIGN(tx, lookup(args[0], line_no));
    auto dropped = pool_->drop_transaction(tx->hash());
    out_ << "drop " << args[0] << " -> " << (dropped ? "dropped" : "unknown") << "\n";
    return core::make_ok();
}

core::Result<void> Replay::cmd_evict(const Args& args, size_t line_no) {
    if (args.size() != 1) {
        return line_error(line_no, "usage: evict <sender>");
    }
    auto removed = pool_->remove_transactions_by_address(sender_address(args[0]));
    out_ << "evict " << args[0] << " -> removed=[" << tags_of(removed) << "]\n";
    return core::make_ok();
}

void Replay::cmd_status() {
    const auto status = pool_->txpool_status();
    out_ << "status -> pending=" << status.pending
         << " queued=" << status.queued << "\n";
}

void Replay::cmd_ready() {
    out_ << "ready -> [" << tags_of(pool_->ready_transactions().collect()) << "]\n";
}

void Replay::cmd_inspect() {
    const auto inspect = pool::txpool_inspect(*pool_);
    auto print = [&](std::string_view section,
                     const pool::BySender<pool::TxSummary>& by_sender) {
        for (const auto& [sender, by_nonce] : by_sender) {
            for (const auto& [nonce, summary] : by_nonce) {
                out_ << "  " << section << " 0x" << sender.to_hex() << " "
                     << nonce << ": " << summary.to_string() << "\n";
            }
        }
    };
    out_ << "inspect ->\n";
    print("pending", inspect.pending);
    print("queued", inspect.queued);
}

void Replay::cmd_clear() {
    pool_->clear();
    out_ << "clear -> ok\n";
}

core::Result<pool::PoolTransactionPtr> Replay::lookup(const std::string& tag,
                                                      size_t line_no) const {
    auto it = by_tag_.find(tag);
    if (it == by_tag_.end()) {
        return line_error(line_no, "unknown transaction tag `" + tag + "`");
    }
    return it->second;
}

std::string Replay::tag_of(const core::uint256& hash) const {
    auto it = tags_.find(hash);
    return it != tags_.end() ? it->second : hash.to_hex().substr(0, 12);
}

std::string Replay::tags_of(const std::vector<core::uint256>& hashes) const {
    std::string out;
    for (const auto& h : hashes) {
        if (!out.empty()) out += ' ';
        out += tag_of(h);
    }
    return out;
}

std::string Replay::tags_of(const std::vector<pool::PoolTransactionPtr>& txs) const {
    std::vector<core::uint256> hashes;
    hashes.reserve(txs.size());
    for (const auto& tx : txs) hashes.push_back(tx->hash());
    return tags_of(hashes);
}

void Replay::print_notifications() {
    auto hashes = listener_.drain();
    if (hashes.empty()) return;
    out_ << "notify -> [" << tags_of(hashes) << "]\n";
}

}  // namespace node
