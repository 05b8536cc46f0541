#include "sig/trend.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

const TimeframeTrend* MultiTimeframeTrend::find(minutes timeframe) const {
  auto it = std::find_if(timeframes.begin(), timeframes.end(),
                         [timeframe](auto& t) { return t.timeframe == timeframe; });
  return it == timeframes.end() ? nullptr : &*it;
}

inline TrendState overall_trend(const std::vector<TimeframeTrend>& trends,
                                const TrendConfig& cfg) {
  double score = 0.0, total = 0.0;
  for (auto& t : trends) {
    auto w = timeframe_weight(t.timeframe);
    score += trend_score(t.trend) * w;
    total += w;
  }
  auto avg = score / total;

  if (avg >= cfg.strong_threshold)
    return TrendState::StrongUptrend;
  if (avg >= cfg.threshold)
    return TrendState::Uptrend;
  if (avg >= cfg.weak_threshold)
    return TrendState::WeakUptrend;
  if (avg <= -cfg.strong_threshold)
    return TrendState::StrongDowntrend;
  if (avg <= -cfg.threshold)
    return TrendState::Downtrend;
  if (avg <= -cfg.weak_threshold)
    return TrendState::WeakDowntrend;
  return TrendState::Ranging;
}

inline Alignment alignment(const std::vector<TimeframeTrend>& trends,
                           TrendState overall,
                           const TrendConfig& cfg) {
  size_t up = 0, down = 0, ranging = 0;
  for (auto& t : trends) {
    auto dir = trend_direction(t.trend);
    (dir > 0 ? up : dir < 0 ? down : ranging)++;
  }

  auto n = trends.size();
  auto needed = static_cast<size_t>(std::ceil(cfg.aligned_ratio * n));

  Alignment res;
  res.is_aligned = std::max(up, down) >= needed;
  res.alignment_score =
      static_cast<double>(std::max({up, down, ranging})) / n * 100;

  auto overall_dir = trend_direction(overall);
  for (auto& t : trends)
    if (trend_direction(t.trend) * overall_dir < 0)
      res.conflicting_timeframes.push_back(t.timeframe);

  return res;
}

inline TradingSuggestion suggestion(const Alignment& align,
                                    TrendState overall,
                                    const TrendConfig& cfg) {
  if (align.is_aligned && align.alignment_score > cfg.suggestion_alignment) {
    switch (overall) {
      case TrendState::StrongUptrend:
        return {Action::StrongBuy,
                "every timeframe in a strong uptrend, highly aligned",
                Risk::Low};
      case TrendState::Uptrend:
      case TrendState::WeakUptrend:
        return {Action::Buy, "uptrend across timeframes", Risk::Low};
      case TrendState::StrongDowntrend:
        return {Action::StrongSell,
                "every timeframe in a strong downtrend, highly aligned",
                Risk::Low};
      case TrendState::Downtrend:
      case TrendState::WeakDowntrend:
        return {Action::Sell, "downtrend across timeframes", Risk::Low};
      case TrendState::Ranging:
        return {Action::Hold, "timeframes agree on a range", Risk::Medium};
    }
  }

  if (align.alignment_score < cfg.wait_alignment)
    return {Action::Wait, "timeframes conflict, wait for a clear signal",
            Risk::High};

  return {Action::Hold, "trend not clear enough, hold and watch",
          Risk::Medium};
}

MultiTimeframeTrend aggregate_trends(std::vector<TimeframeTrend> trends,
                                     const TrendConfig& cfg) {
  MultiTimeframeTrend res;
  if (trends.empty()) {
    res.suggestion = {Action::Wait, "no timeframe could be analyzed",
                      Risk::High};
    return res;
  }

  std::sort(trends.begin(), trends.end(), [](auto& l, auto& r) {
    return l.timeframe < r.timeframe;
  });

  res.overall_trend = overall_trend(trends, cfg);
  res.alignment = alignment(trends, res.overall_trend, cfg);

  double conf = 0.0;
  for (auto& t : trends)
    conf += t.confidence;
  conf /= trends.size();
  res.overall_confidence = std::min(
      conf + res.alignment.alignment_score * cfg.alignment_bonus, 100.0);

  res.suggestion = suggestion(res.alignment, res.overall_trend, cfg);
  res.timeframes = std::move(trends);
  return res;
}

MultiTimeframeTrend find_multi_timeframe_trend(const TimeframeCandles& candles,
                                               const TrendConfig& cfg) {
  std::vector<TimeframeTrend> trends;
  Failures failures;
  Timestamp timestamp = 0;

  for (auto& [timeframe, series] : candles) {
    auto t = timeframe_trend(series, timeframe, cfg);
    if (!t) {
      spdlog::warn("[trend] {} skipped: {} candles", to_str(timeframe),
                   series.size());
      failures.push_back(
          {std::format("trend.{}", to_str(timeframe)),
           std::format("insufficient data: {} candles, need {}",
                       series.size(), cfg.ema_slow)});
      continue;
    }

    if (timestamp == 0)
      timestamp = series.back().close_time;
    trends.push_back(std::move(*t));
  }

  auto res = aggregate_trends(std::move(trends), cfg);
  res.timestamp = timestamp;
  res.failures = std::move(failures);

  spdlog::debug("[trend] overall {} ({:.0f}), aligned {}",
                to_str(res.overall_trend), res.overall_confidence,
                res.alignment.is_aligned);
  return res;
}
