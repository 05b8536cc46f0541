#include "ind/indicators.h"
#include "sig/trend.h"
#include "util/format.h"
#include "util/math.h"

#include <algorithm>
#include <cmath>

inline std::vector<double> tail(const std::vector<double>& v, size_t n) {
  n = std::min(n, v.size());
  return {v.end() - n, v.end()};
}

inline double slope(const std::vector<double>& values) {
  if (values.size() < 2)
    return 0.0;
  return (values.back() - values.front()) / values.front() / values.size();
}

inline TrendState classify(double price,
                           double ema20,
                           double ema60,
                           double ema120,
                           double ema20_slope,
                           const TrendConfig& cfg) {
  if (price > ema20 && ema20 > ema60 && ema60 > ema120) {
    auto extension = (price - ema20) / ema20;
    if (ema20_slope > cfg.strong_slope && extension > cfg.strong_extension)
      return TrendState::StrongUptrend;
    if (ema20_slope > cfg.slope)
      return TrendState::Uptrend;
    return TrendState::WeakUptrend;
  }

  if (price < ema20 && ema20 < ema60 && ema60 < ema120) {
    auto extension = (ema20 - price) / ema20;
    if (ema20_slope < -cfg.strong_slope && extension > cfg.strong_extension)
      return TrendState::StrongDowntrend;
    if (ema20_slope < -cfg.slope)
      return TrendState::Downtrend;
    return TrendState::WeakDowntrend;
  }

  return TrendState::Ranging;
}

inline double trend_strength(double price,
                             double ema20,
                             double ema60,
                             double ema120,
                             const std::vector<double>& closes,
                             const TrendConfig& cfg) {
  double strength = 0.0;

  bool up_partial = price > ema20 && ema20 > ema60;
  bool down_partial = price < ema20 && ema20 < ema60;

  // ema ordering
  if ((up_partial && ema60 > ema120) || (down_partial && ema60 < ema120))
    strength += 40;
  else if (up_partial || down_partial)
    strength += 25;

  // ema spread
  auto spread_20_60 = std::abs(ema20 - ema60) / std::max(ema20, ema60);
  auto spread_60_120 = std::abs(ema60 - ema120) / std::max(ema60, ema120);
  strength += std::min((spread_20_60 + spread_60_120) / 2 * 400, 20.0);

  // momentum
  auto recent = tail(closes, cfg.momentum_window);
  if (recent.size() > 1) {
    auto mom = (recent.back() - recent.front()) / recent.front();
    strength += std::min(std::abs(mom) * 500, 20.0);
  }

  // bars moving with the trend
  recent = tail(closes, cfg.consistency_window);
  if (recent.size() > 1) {
    size_t consistent = 0;
    for (size_t i = 1; i < recent.size(); i++) {
      if (up_partial && recent[i] > recent[i - 1])
        consistent++;
      else if (!up_partial && recent[i] < recent[i - 1])
        consistent++;
    }
    strength += static_cast<double>(consistent) / (recent.size() - 1) * 20;
  }

  return std::min(strength, 100.0);
}

inline double trend_confidence(TrendState trend,
                               double strength,
                               const std::vector<double>& closes,
                               const TrendConfig& cfg) {
  double conf = strength * 0.7;

  if (is_strong(trend))
    conf += 15;
  else if (trend != TrendState::Ranging)
    conf += 10;

  auto r = returns(tail(closes, cfg.volatility_window));
  auto vol = stdev(r.begin(), r.end());
  if (vol < cfg.low_volatility)
    conf += 10;
  else if (vol > cfg.high_volatility)
    conf -= 10;

  return clamp(conf, 0, 100);
}

// price near its recent extreme while the ema lags well behind its own
inline bool divergence(const std::vector<double>& closes,
                       const std::vector<double>& ema20,
                       const TrendConfig& cfg) {
  auto n = cfg.divergence_window;
  if (closes.size() < n || ema20.size() < n)
    return false;

  auto prices = tail(closes, n);
  auto emas = tail(ema20, n);

  auto [price_lo, price_hi] = std::minmax_element(prices.begin(), prices.end());
  auto [ema_lo, ema_hi] = std::minmax_element(emas.begin(), emas.end());

  auto price = prices.back();
  auto ema = emas.back();

  if (price > *price_hi * (1 - cfg.divergence_price) &&
      ema < *ema_hi * (1 - cfg.divergence_ema))
    return true;

  return price < *price_lo * (1 + cfg.divergence_price) &&
         ema > *ema_lo * (1 + cfg.divergence_ema);
}

inline std::string describe(const TimeframeTrend& t) {
  auto strength = t.trend_strength > 80   ? "strong"
                  : t.trend_strength > 60 ? "moderate"
                                          : "weak";
  auto conf = t.confidence > 80   ? "high"
              : t.confidence > 60 ? "medium"
                                  : "low";

  auto res = std::format("{} shows {}, {} strength, {} confidence",
                         to_str(t.timeframe), to_str(t.trend), strength, conf);
  if (t.divergence)
    res += ", divergence detected";
  return res;
}

std::optional<TimeframeTrend> timeframe_trend(
    const std::vector<Candle>& candles,
    minutes timeframe,
    const TrendConfig& cfg) {
  auto ema20 = values_of(ema(candles, cfg.ema_fast));
  auto ema60 = values_of(ema(candles, cfg.ema_mid));
  auto ema120 = values_of(ema(candles, cfg.ema_slow));

  if (ema20.empty() || ema60.empty() || ema120.empty())
    return std::nullopt;

  std::vector<double> closes;
  closes.reserve(candles.size());
  for (auto& c : candles)
    closes.push_back(c.price());

  TimeframeTrend t;
  t.timeframe = timeframe;
  t.current_price = closes.back();
  t.ema20 = ema20.back();
  t.ema60 = ema60.back();
  t.ema120 = ema120.back();

  auto ema20_slope = slope(tail(ema20, cfg.slope_window));
  t.trend = classify(t.current_price, t.ema20, t.ema60, t.ema120, ema20_slope,
                     cfg);

  auto strength =
      trend_strength(t.current_price, t.ema20, t.ema60, t.ema120, closes, cfg);
  auto conf = trend_confidence(t.trend, strength, closes, cfg);

  t.trend_strength = std::round(strength);
  t.confidence = std::round(conf);
  t.divergence = divergence(closes, ema20, cfg);
  t.analysis = describe(t);
  return t;
}
