#pragma once

#include "ind/candle.h"
#include "sig/signal_types.h"
#include "util/config.h"
#include "util/times.h"

#include <optional>
#include <string>
#include <vector>

// ordered from the most bullish to the most bearish
enum class TrendState {
  StrongUptrend,
  Uptrend,
  WeakUptrend,
  Ranging,
  WeakDowntrend,
  Downtrend,
  StrongDowntrend,
};

// +3 for a strong uptrend down to -3 for a strong downtrend
constexpr int trend_score(TrendState t) {
  return 3 - static_cast<int>(t);
}

// 1 for any uptrend, -1 for any downtrend, 0 when ranging
constexpr int trend_direction(TrendState t) {
  auto score = trend_score(t);
  return score > 0 ? 1 : score < 0 ? -1 : 0;
}

constexpr bool is_strong(TrendState t) {
  return t == TrendState::StrongUptrend || t == TrendState::StrongDowntrend;
}

struct TimeframeTrend {
  minutes timeframe = M_15;
  TrendState trend = TrendState::Ranging;
  double confidence = 0.0;
  double trend_strength = 0.0;
  double current_price = 0.0;
  double ema20 = 0.0;
  double ema60 = 0.0;
  double ema120 = 0.0;
  bool divergence = false;
  std::string analysis = "";
};

enum class Action { StrongBuy, Buy, Hold, Sell, StrongSell, Wait };

enum class Risk { Low, Medium, High };

struct Alignment {
  bool is_aligned = false;
  double alignment_score = 0.0;
  std::vector<minutes> conflicting_timeframes;
};

struct TradingSuggestion {
  Action action = Action::Wait;
  std::string reason = "";
  Risk risk = Risk::High;
};

struct MultiTimeframeTrend {
  std::string symbol;
  Timestamp timestamp = 0;

  TrendState overall_trend = TrendState::Ranging;
  double overall_confidence = 0.0;

  std::vector<TimeframeTrend> timeframes;  // finest first
  Alignment alignment;
  TradingSuggestion suggestion;

  Failures failures;

  const TimeframeTrend* find(minutes timeframe) const;
};

// nullopt when the series is too short for the slowest ema
std::optional<TimeframeTrend> timeframe_trend(
    const std::vector<Candle>& candles,
    minutes timeframe,
    const TrendConfig& cfg = {});

// weighted fusion of already analyzed timeframes
MultiTimeframeTrend aggregate_trends(std::vector<TimeframeTrend> trends,
                                     const TrendConfig& cfg = {});

// Analyzes every timeframe present in `candles`. Timeframes without enough
// candles are recorded as failures and left out of the fusion.
MultiTimeframeTrend find_multi_timeframe_trend(const TimeframeCandles& candles,
                                               const TrendConfig& cfg = {});
