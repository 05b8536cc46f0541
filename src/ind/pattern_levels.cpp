#include "ind/support_resistance.h"

#include <algorithm>
#include <cmath>

struct Extreme {
  Timestamp ts;
  double price;
  SR type;
};

inline std::vector<Extreme> local_extremes(const std::vector<Candle>& candles,
                                           size_t window) {
  std::vector<Extreme> extremes;
  if (candles.size() < 2 * window + 1)
    return extremes;

  for (size_t i = window; i + window < candles.size(); i++) {
    auto& cur = candles[i];
    bool is_high = true, is_low = true;
    for (size_t j = i - window; j <= i + window; j++) {
      is_high &= cur.high >= candles[j].high;
      is_low &= cur.low <= candles[j].low;
    }

    if (is_high)
      extremes.push_back({cur.time(), cur.high, SR::Resistance});
    if (is_low)
      extremes.push_back({cur.time(), cur.low, SR::Support});
  }
  return extremes;
}

inline PatternLevel to_pattern_level(const std::vector<Candle>& candles,
                                     const Extreme& extreme,
                                     double tolerance) {
  PatternLevel level{
      .price = extreme.price,
      .type = extreme.type,
      .first_touch = extreme.ts,
      .last_touch = extreme.ts,
  };

  for (auto& c : candles) {
    auto val = extreme.type == SR::Resistance ? c.high : c.low;
    if (std::abs(val - level.price) / level.price > tolerance)
      continue;

    level.touch_count++;
    level.first_touch = std::min(level.first_touch, c.time());
    level.last_touch = std::max(level.last_touch, c.time());
  }
  return level;
}

std::vector<PatternLevel> find_pattern_levels(
    const std::vector<Candle>& candles,
    const SupportResistanceConfig& cfg) {
  std::vector<PatternLevel> levels;
  if (candles.size() < cfg.pl_min_candles)
    return levels;

  for (auto& extreme : local_extremes(candles, cfg.pl_window)) {
    auto level = to_pattern_level(candles, extreme, cfg.pl_touch_tolerance);
    if (level.touch_count < cfg.pl_min_touches)
      continue;

    level.strength =
        std::min(static_cast<int>(level.touch_count), cfg.pl_max_strength);

    auto it = std::find_if(levels.begin(), levels.end(), [&](auto& l) {
      return l.type == level.type &&
             std::abs(l.price - level.price) / level.price <=
                 cfg.pl_merge_tolerance;
    });

    if (it == levels.end()) {
      levels.push_back(level);
      continue;
    }

    it->strength = std::max(it->strength, level.strength);
    it->touch_count += level.touch_count;
    it->first_touch = std::min(it->first_touch, level.first_touch);
    it->last_touch = std::max(it->last_touch, level.last_touch);
  }

  std::stable_sort(levels.begin(), levels.end(), [](auto& l, auto& r) {
    return l.strength > r.strength;
  });
  return levels;
}
