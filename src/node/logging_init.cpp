// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/logging_init.h"
#include "node/pool_config.h"
#include "pool/transaction.h"

#include <cctype>
#include <string>

namespace node {

namespace {

/// Trim leading and trailing whitespace.
std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

} // anonymous namespace

core::Result<void> init_logging(const PoolConfig& config) {
    auto& logger = core::Logger::instance();

    logger.set_level(config.log_level);
    logger.set_categories(config.log_categories);
    logger.set_print_to_console(config.print_to_console);

    if (!config.log_file.empty()) {
        if (!logger.set_log_file(config.log_file)) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                "Cannot open log file: " + config.log_file);
        }
        logger.set_print_to_file(true);
    } else {
        logger.set_print_to_file(false);
    }

    LOG_INFO(core::LogCategory::CONFIG,
        std::string("logging initialized: level=")
        + std::string(core::log_level_string(config.log_level))
        + " order=" + std::string(pool::transaction_order_name(config.order))
        + " listenercapacity=" + std::to_string(config.listener_capacity));
    return core::make_ok();
}

core::Result<core::LogCategory> parse_log_categories(std::string_view category_str) {
    if (trim_ws(category_str).empty()) {
        return core::LogCategory::ALL;
    }

    core::LogCategory result = core::LogCategory::NONE;

    // Split by comma.
    size_t start = 0;
    while (start <= category_str.size()) {
        size_t comma = category_str.find(',', start);
        if (comma == std::string_view::npos) {
            comma = category_str.size();
        }

        std::string_view token = trim_ws(category_str.substr(start, comma - start));
        if (!token.empty()) {
            auto cat = core::log_category_from_string(token);
            if (!cat) {
                return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                    "Unknown log category: `" + std::string(token) + "`");
            }
            result |= *cat;
        }

        start = comma + 1;
    }
    return result;
}

} // namespace node
