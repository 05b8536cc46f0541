#include "sig/patterns.h"

#include <cstdlib>
#include <format>

std::vector<Pattern> trend_patterns(const std::vector<Candle>& candles,
                                    const std::vector<PatternLevel>&,
                                    const PatternConfig& cfg) {
  std::vector<Pattern> patterns;
  auto period = cfg.trend_period;
  if (candles.size() < period || period < cfg.trend_min_candles)
    return patterns;

  auto first = candles.size() - period;

  int up = 0, down = 0;
  for (size_t i = first + 1; i < candles.size(); i++) {
    if (candles[i].price() > candles[i - 1].price())
      up++;
    else if (candles[i].price() < candles[i - 1].price())
      down++;
  }

  if (up + down == 0)
    return patterns;

  double strength = static_cast<double>(std::abs(up - down)) / (up + down);
  if (strength < cfg.trend_min_strength)
    return patterns;

  bool rising = up > down;
  patterns.push_back({
      .kind = rising ? PatternKind::Uptrend : PatternKind::Downtrend,
      .signal = rising ? Signal::Buy : Signal::Sell,
      .confidence = strength * 100,
      .start = candles[first].time(),
      .end = candles.back().time(),
      .description = std::format("{} run, strength {:.1f}%",
                                 rising ? "rising" : "falling",
                                 strength * 100),
  });
  return patterns;
}
