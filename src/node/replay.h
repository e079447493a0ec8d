#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Replay -- drives a Pool from a line-oriented scenario.
//
// One command per line, '#' starts a comment:
//   submit <tag> <sender> <nonce> <on_chain_nonce> <gas_price>
//   mine <block> <tag>...       invalid <tag>...      drop <tag>
//   evict <sender>              status                ready
//   inspect                     clear
//
// <sender> is either 40 hex digits or a name hashed to an address. Every
// command prints one result line; hashes reported by the ready listener
// follow as "notify" lines.
// ---------------------------------------------------------------------------

#include "core/channel.h"
#include "core/error.h"
#include "core/types.h"
#include "pool/pool.h"
#include "pool/transaction.h"

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace node {

class Replay {
public:
    Replay(std::shared_ptr<pool::Pool> pool, pool::TransactionOrder order,
           std::ostream& out);

    /// Runs every line of @p in. Stops at the first malformed line with a
    /// PARSE_ERROR naming its line number.
    core::Result<void> run(std::istream& in);

    core::Result<void> run_file(const std::string& path);

    /// Executes one scenario line.
    core::Result<void> execute(std::string_view line, size_t line_no);

    /// Address used for @p name ("0x..." or 40 hex digits taken verbatim).
    [[nodiscard]] static core::uint160 sender_address(std::string_view name);

private:
    using Args = std::vector<std::string>;

    core::Result<void> cmd_submit(const Args& args, size_t line_no);
    core::Result<void> cmd_mine(const Args& args, size_t line_no);
    core::Result<void> cmd_invalid(const Args& args, size_t line_no);
    core::Result<void> cmd_drop(const Args& args, size_t line_no);
    core::Result<void> cmd_evict(const Args& args, size_t line_no);
    void cmd_status();
    void cmd_ready();
    void cmd_inspect();
    void cmd_clear();

    core::Result<pool::PoolTransactionPtr> lookup(const std::string& tag,
                                                  size_t line_no) const;
    [[nodiscard]] std::string tag_of(const core::uint256& hash) const;
    [[nodiscard]] std::string tags_of(const std::vector<core::uint256>& hashes) const;
    [[nodiscard]] std::string tags_of(
        const std::vector<pool::PoolTransactionPtr>& txs) const;
    void print_notifications();

    std::shared_ptr<pool::Pool>                               pool_;
    pool::TransactionOrder                                    order_;
    std::ostream&                                             out_;
    core::Receiver<core::uint256>                             listener_;
    std::unordered_map<std::string, pool::PoolTransactionPtr> by_tag_;
    std::unordered_map<core::uint256, std::string>            tags_;
};

}  // namespace node
