// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/pool_config.h"
#include "node/logging_init.h"

namespace node {

core::Result<PoolConfig> PoolConfig::from_config(const core::Config& config) {
    PoolConfig out;

    if (auto order = config.get(core::CONF_ORDER)) {
        SLUICE_TRY_ASSIGN(parsed, pool::parse_transaction_order(*order));
        out.order = parsed;
    }

    SLUICE_TRY_ASSIGN(capacity, config.get_int(
        core::CONF_LISTENERCAPACITY,
        static_cast<int64_t>(pool::DEFAULT_LISTENER_CAPACITY)));
    if (capacity < 1) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
            "listenercapacity must be at least 1, got "
            + std::to_string(capacity));
    }
    out.listener_capacity = static_cast<size_t>(capacity);

    if (auto level = config.get(core::CONF_LOGLEVEL)) {
        auto parsed = core::log_level_from_string(*level);
        if (!parsed) {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                "Unknown loglevel: `" + *level + "`");
        }
        out.log_level = *parsed;
    }

    const auto debug = config.get_list(core::CONF_DEBUG);
    if (!debug.empty()) {
        core::LogCategory mask = core::LogCategory::NONE;
        for (const auto& entry : debug) {
            SLUICE_TRY_ASSIGN(cats, parse_log_categories(entry));
            mask |= cats;
        }
        out.log_categories = mask;
    }

    out.log_file = config.get_or(core::CONF_LOGFILE, "");
    out.print_to_console = config.get_bool(core::CONF_PRINTTOCONSOLE, true);
    return out;
}

std::shared_ptr<pool::Pool> PoolConfig::make_pool() const {
    return std::make_shared<pool::Pool>(listener_capacity);
}

core::Result<PoolConfig> load_pool_config(int argc, const char* const argv[],
                                          core::Config& config) {
    config.parse_args(argc, argv);
    if (auto path = config.get(core::CONF_CONF)) {
        SLUICE_TRY_VOID(config.parse_file(*path));
    }
    return PoolConfig::from_config(config);
}

}  // namespace node
