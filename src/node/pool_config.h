#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// PoolConfig -- typed pool and logging settings read from core::Config.
//
// Keys (command line -key=value overrides the file given by -conf):
//   order=fifo|fees        listenercapacity=<n>     loglevel=<level>
//   debug=<cat>[,<cat>]    logfile=<path>           printtoconsole=<0|1>
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "pool/pool.h"
#include "pool/transaction.h"

#include <cstddef>
#include <memory>
#include <string>

namespace node {

struct PoolConfig {
    // -- Pool ----------------------------------------------------------------
    pool::TransactionOrder order = pool::TransactionOrder::FIFO;
    size_t listener_capacity = pool::DEFAULT_LISTENER_CAPACITY;

    // -- Logging -------------------------------------------------------------
    core::LogLevel log_level = core::LogLevel::INFO;
    core::LogCategory log_categories = core::LogCategory::ALL;
    std::string log_file;  // empty: no file sink
    bool print_to_console = true;

    /// Reads every key above from @p config. Unknown values are
    /// PARSE_BAD_FORMAT, a listener capacity below 1 is VALIDATION_RANGE.
    [[nodiscard]] static core::Result<PoolConfig> from_config(
        const core::Config& config);

    [[nodiscard]] std::shared_ptr<pool::Pool> make_pool() const;
};

/// Parses the command line into @p config, loads the -conf file if one is
/// named, and builds the PoolConfig.
[[nodiscard]] core::Result<PoolConfig> load_pool_config(
    int argc, const char* const argv[], core::Config& config);

}  // namespace node
