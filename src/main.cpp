// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// sluice-replay -- run a transaction pool scenario and print the results.

#include "core/config.h"
#include "core/logging.h"
#include "node/logging_init.h"
#include "node/pool_config.h"
#include "node/replay.h"

#include <cstdlib>
#include <iostream>

namespace {

void print_usage() {
    std::cout
        << "Usage: sluice-replay [options] <scenario>\n"
        << "\n"
        << "Options:\n"
        << "  -conf=<file>             Read options from <file>\n"
        << "  -order=<fifo|fees>       Ready ordering (default: fifo)\n"
        << "  -listenercapacity=<n>    Listener channel capacity (default: 2048)\n"
        << "  -loglevel=<level>        trace, debug, info, warn, error, fatal, off\n"
        << "  -debug=<cat>[,<cat>]     mempool, mining, lock, bench, config, all\n"
        << "  -logfile=<path>          Append log output to <path>\n"
        << "  -printtoconsole=<0|1>    Log to stderr (default: 1)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    core::Config args;
    auto config = node::load_pool_config(argc, argv, args);
    if (!config.ok()) {
        std::cerr << "Error: " << config.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    if (args.has("help") || args.has("h") || args.positional_args().size() != 1) {
        print_usage();
        return args.has("help") || args.has("h") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    auto logging = node::init_logging(config.value());
    if (!logging.ok()) {
        std::cerr << "Error: " << logging.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    node::Replay replay(config.value().make_pool(), config.value().order, std::cout);
    auto result = replay.run_file(args.positional_args().front());
    core::Logger::instance().flush();
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
