#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace core {

/// Returns current Unix timestamp in seconds since epoch.
int64_t get_time();

/// Formats a Unix timestamp (seconds) as ISO 8601: "2026-02-03T00:00:00Z".
std::string format_iso8601(int64_t timestamp);

// ---------------------------------------------------------------------------
// MockableClock - process-wide clock that tests and the simulator drive.
// ---------------------------------------------------------------------------

inline std::atomic<int64_t> mock_time{0};

class MockableClock {
public:
    /// Returns the mock time if set (non-zero), otherwise real wall-clock time.
    static int64_t now();

    /// Sets the mock time. Pass 0 to disable mocking and revert to real time.
    static void set_mock_time(int64_t t);

    /// Moves the mock time forward by @p seconds (negative values are
    /// ignored).  Starts from the wall clock if mocking was off.
    static int64_t advance(int64_t seconds);

    /// Returns the current mock time value (0 means not mocking).
    static int64_t get_mock_time();
};

// ---------------------------------------------------------------------------
// StopWatch - elapsed wall time of a run.
// ---------------------------------------------------------------------------

class StopWatch {
public:
    StopWatch();

    int64_t elapsed_ms() const;

    void reset();

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace core
