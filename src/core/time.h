#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <chrono>
#include <cstdint>

namespace core {

/// Returns current time in milliseconds since epoch.
int64_t get_time_millis();

// ---------------------------------------------------------------------------
// MockableClock - wall clock in milliseconds that tests can pin.
// ---------------------------------------------------------------------------

class MockableClock {
public:
    /// The mock time if set (non-zero), otherwise get_time_millis().
    static int64_t now_millis();

    /// Pins the clock. Pass 0 to go back to real time.
    static void set_mock_millis(int64_t t);

private:
    static std::atomic<int64_t> mock_millis_;
};

// ---------------------------------------------------------------------------
// StopWatch - steady-clock interval timer.
// ---------------------------------------------------------------------------

class StopWatch {
public:
    StopWatch();

    int64_t elapsed_us() const;
    void reset();

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace core
