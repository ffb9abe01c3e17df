#pragma once

#include <chrono>
#include <cstdint>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;

using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;

// Bar timestamps are epoch milliseconds, UTC.
using Timestamp = std::int64_t;

std::string timestamp_to_string(Timestamp ts);
std::string now_utc_string();

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
