// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"

#include <iostream>

int main() {
    // Keep test output readable; individual tests raise the level or
    // install a capture sink when they check log lines.
    core::Logger::instance().set_level(core::LogLevel::OFF);
    core::Logger::instance().set_print_to_console(false);

    std::cout << "Sluice Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    return test::run_all_tests();
}
