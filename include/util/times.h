#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;

// milliseconds since the unix epoch, as reported by the exchange
using Timestamp = int64_t;

using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;

inline constexpr minutes M_15{15}, H_1{hours{1}}, H_4{hours{4}},
    D_1{hours{24}};

// coarsest first
inline constexpr minutes timeframes[] = {D_1, H_4, H_1, M_15};

constexpr int timeframe_weight(minutes timeframe) {
  if (timeframe == D_1)
    return 4;
  if (timeframe == H_4)
    return 3;
  if (timeframe == H_1)
    return 2;
  return 1;
}

std::string timeframe_to_str(minutes timeframe);
std::optional<minutes> parse_timeframe(std::string_view label);

std::string timestamp_to_string(Timestamp ts);

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
