#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization.
//
// Configures the global Logger singleton from PoolConfig:
//   - Sets the log level threshold.
//   - Replaces the category mask.
//   - Opens the append-mode log file when one is configured.
//   - Enables or disables the console sink.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "core/logging.h"

#include <string_view>

namespace node {

struct PoolConfig;

/// Applies @p config to core::Logger. Fails with CONFIG_ERROR if the log
/// file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const PoolConfig& config);

/// Parse a comma-separated list of category names into a bitmask.
///
/// Recognised names (case-insensitive):
///   mempool (or pool), mining, lock, bench, config, all, none
///
/// An empty list means all categories. Unknown names are PARSE_BAD_FORMAT.
[[nodiscard]] core::Result<core::LogCategory> parse_log_categories(
    std::string_view category_str);

}  // namespace node
