// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/time.h"

namespace core {

int64_t get_time_millis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// ---------------------------------------------------------------------------
// MockableClock
// ---------------------------------------------------------------------------

std::atomic<int64_t> MockableClock::mock_millis_{0};

int64_t MockableClock::now_millis()
{
    int64_t mocked = mock_millis_.load(std::memory_order_relaxed);
    return mocked != 0 ? mocked : get_time_millis();
}

void MockableClock::set_mock_millis(int64_t t)
{
    mock_millis_.store(t, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// StopWatch
// ---------------------------------------------------------------------------

StopWatch::StopWatch()
    : start_(std::chrono::steady_clock::now())
{
}

int64_t StopWatch::elapsed_us() const
{
    using namespace std::chrono;
    return duration_cast<microseconds>(steady_clock::now() - start_).count();
}

void StopWatch::reset()
{
    start_ = std::chrono::steady_clock::now();
}

} // namespace core
