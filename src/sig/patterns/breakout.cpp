#include "sig/patterns.h"

#include <algorithm>
#include <cmath>
#include <format>

inline double breakout_confidence(double price,
                                  const PatternLevel& level,
                                  bool volume_confirmed,
                                  const PatternConfig& cfg) {
  double conf = 50 + level.strength * cfg.breakout_strength_conf;
  if (volume_confirmed)
    conf += cfg.breakout_volume_bonus;

  auto pct = std::abs(price - level.price) / level.price;
  conf += std::min(pct * cfg.breakout_pct_mult, cfg.breakout_pct_cap);

  return std::min(conf, cfg.breakout_max_conf);
}

std::vector<Pattern> breakout_patterns(const std::vector<Candle>& candles,
                                       const std::vector<PatternLevel>& levels,
                                       const PatternConfig& cfg) {
  std::vector<Pattern> patterns;
  if (candles.empty())
    return patterns;

  auto n = std::min(cfg.breakout_volume_window, candles.size());
  auto first = candles.end() - n;

  auto& last = candles.back();
  auto price = last.price();

  double avg_volume = 0.0;
  for (auto it = first; it != candles.end(); it++)
    avg_volume += it->volume;
  avg_volume /= n;

  bool volume_confirmed = last.volume > avg_volume * cfg.breakout_volume_mult;

  for (auto& level : levels) {
    if (std::abs(price - level.price) / level.price > cfg.breakout_proximity)
      continue;

    Signal signal = Signal::Neutral;
    if (level.type == SR::Resistance && price > level.price)
      signal = Signal::Buy;
    else if (level.type == SR::Support && price < level.price)
      signal = Signal::Sell;

    if (signal == Signal::Neutral)
      continue;

    auto conf = breakout_confidence(price, level, volume_confirmed, cfg);
    if (conf < cfg.breakout_min_conf)
      continue;

    patterns.push_back({
        .kind = PatternKind::Breakout,
        .signal = signal,
        .confidence = conf,
        .start = first->time(),
        .end = last.time(),
        .description = std::format(
            "{} breakout at {:.2f}",
            level.type == SR::Resistance ? "resistance" : "support",
            level.price),
        .key_levels = {.breakout = level.price},
    });
  }
  return patterns;
}
