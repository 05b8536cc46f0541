#pragma once

#include "ind/candle.h"

#include <algorithm>
#include <cmath>
#include <vector>

inline constexpr Timestamp HOUR_MS = 3600000;

// one candle per close, opening at the previous close
inline std::vector<Candle> make_candles(const std::vector<double>& closes,
                                        double volume = 100.0) {
  std::vector<Candle> candles;
  for (size_t i = 0; i < closes.size(); i++) {
    auto open = i == 0 ? closes[i] : closes[i - 1];
    auto close = closes[i];
    candles.push_back({
        .open_time = static_cast<Timestamp>(i) * HOUR_MS,
        .close_time = static_cast<Timestamp>(i + 1) * HOUR_MS - 1,
        .open = open,
        .high = std::max(open, close) * 1.002,
        .low = std::min(open, close) * 0.998,
        .close = close,
        .volume = volume,
        .quote_volume = volume * close,
        .trade_count = 10,
    });
  }
  return candles;
}

inline std::vector<double> geometric(size_t n, double start, double rate) {
  std::vector<double> res;
  for (size_t i = 0; i < n; i++)
    res.push_back(start * std::pow(1 + rate, i));
  return res;
}

inline std::vector<double> constant(size_t n, double value) {
  return std::vector<double>(n, value);
}

// oscillates between a 100 floor and a 110 ceiling, period of 10 candles
inline std::vector<Candle> box_candles(size_t n = 60) {
  constexpr double mids[] = {100.5, 102, 104, 106, 108,
                             109.5, 108, 106, 104, 102};
  std::vector<Candle> candles;
  for (size_t i = 0; i < n; i++) {
    auto mid = mids[i % 10];
    candles.push_back({
        .open_time = static_cast<Timestamp>(i) * HOUR_MS,
        .close_time = static_cast<Timestamp>(i + 1) * HOUR_MS - 1,
        .open = mid,
        .high = mid + 0.5,
        .low = mid - 0.5,
        .close = mid,
        .volume = 100.0,
        .quote_volume = 100.0 * mid,
        .trade_count = 10,
    });
  }
  return candles;
}

inline Candle next_candle(const std::vector<Candle>& candles,
                          double open,
                          double high,
                          double low,
                          double close,
                          double volume) {
  auto t = candles.empty() ? 0 : candles.back().open_time + HOUR_MS;
  return {
      .open_time = t,
      .close_time = t + HOUR_MS - 1,
      .open = open,
      .high = high,
      .low = low,
      .close = close,
      .volume = volume,
      .quote_volume = volume * close,
      .trade_count = 10,
  };
}

inline TimeframeCandles every_timeframe(const std::vector<Candle>& candles) {
  TimeframeCandles res;
  for (auto timeframe : timeframes)
    res[timeframe] = candles;
  return res;
}
