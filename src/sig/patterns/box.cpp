#include "sig/patterns.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>

struct BoxValidation {
  bool valid = false;
  double confidence = 0.0;
};

inline BoxValidation validate_box(const std::vector<Candle>& candles,
                                  double support,
                                  double resistance,
                                  const PatternConfig& cfg) {
  size_t touch_support = 0, touch_resistance = 0, within = 0;
  auto tol = cfg.box_tolerance;

  for (auto& c : candles) {
    if (std::abs(c.low - support) / support <= tol)
      touch_support++;
    if (std::abs(c.high - resistance) / resistance <= tol)
      touch_resistance++;
    if (c.low >= support * (1 - tol) && c.high <= resistance * (1 + tol))
      within++;
  }

  double ratio = static_cast<double>(within) / candles.size();
  return {
      ratio >= cfg.box_within_ratio && touch_support >= cfg.box_min_touches &&
          touch_resistance >= cfg.box_min_touches,
      std::min(ratio * 100, cfg.box_max_conf),
  };
}

std::vector<Pattern> box_patterns(const std::vector<Candle>& candles,
                                  const std::vector<PatternLevel>& levels,
                                  const PatternConfig& cfg) {
  std::vector<Pattern> patterns;
  if (candles.size() < cfg.box_min_duration * 2)
    return patterns;

  for (size_t i = 0; i < levels.size(); i++) {
    for (size_t j = i + 1; j < levels.size(); j++) {
      if (levels[i].type == levels[j].type)
        continue;

      auto& support = levels[i].type == SR::Support ? levels[i] : levels[j];
      auto& resistance =
          levels[i].type == SR::Resistance ? levels[i] : levels[j];

      auto height = (resistance.price - support.price) / support.price;
      if (height < cfg.box_min_height || height > cfg.box_max_height)
        continue;

      auto start = std::max(support.first_touch, resistance.first_touch);
      auto end = std::min(support.last_touch, resistance.last_touch);

      std::vector<Candle> window;
      std::copy_if(candles.begin(), candles.end(), std::back_inserter(window),
                   [start, end](auto& c) {
                     return c.time() >= start && c.time() <= end;
                   });
      if (window.size() < cfg.box_min_duration)
        continue;

      auto [valid, confidence] =
          validate_box(window, support.price, resistance.price, cfg);
      if (!valid)
        continue;

      patterns.push_back({
          .kind = PatternKind::Box,
          .signal = Signal::Neutral,
          .confidence = confidence,
          .start = start,
          .end = end,
          .description = std::format("box between support {:.2f} and "
                                     "resistance {:.2f}",
                                     support.price, resistance.price),
          .key_levels = {.support = support.price,
                         .resistance = resistance.price},
      });
    }
  }
  return patterns;
}
