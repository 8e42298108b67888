// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/time.h"

#include <array>
#include <ctime>

namespace core {

int64_t get_time()
{
    using namespace std::chrono;
    return duration_cast<seconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

std::string format_iso8601(int64_t timestamp)
{
    std::time_t tt = static_cast<std::time_t>(timestamp);
    std::tm utc{};

#ifdef _WIN32
    gmtime_s(&utc, &tt);
#else
    gmtime_r(&tt, &utc);
#endif

    std::array<char, 32> buf{};
    std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf.data());
}

// ---------------------------------------------------------------------------
// MockableClock
// ---------------------------------------------------------------------------

int64_t MockableClock::now()
{
    int64_t mt = mock_time.load(std::memory_order_relaxed);
    if (mt != 0) {
        return mt;
    }
    return get_time();
}

void MockableClock::set_mock_time(int64_t t)
{
    mock_time.store(t, std::memory_order_relaxed);
}

int64_t MockableClock::advance(int64_t seconds)
{
    int64_t current = mock_time.load(std::memory_order_relaxed);
    if (current == 0) current = get_time();
    if (seconds > 0) current += seconds;
    mock_time.store(current, std::memory_order_relaxed);
    return current;
}

int64_t MockableClock::get_mock_time()
{
    return mock_time.load(std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// StopWatch
// ---------------------------------------------------------------------------

StopWatch::StopWatch()
    : start_(std::chrono::steady_clock::now())
{
}

int64_t StopWatch::elapsed_ms() const
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - start_).count();
}

void StopWatch::reset()
{
    start_ = std::chrono::steady_clock::now();
}

} // namespace core
