#include "ind/support_resistance.h"
#include "util/format.h"
#include "util/math.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

struct Swing {
  size_t idx;
  double price;
};

template <SR sr>
inline std::vector<Swing> find_swings(const std::vector<Candle>& candles,
                                      size_t lookback) {
  constexpr bool is_support = sr == SR::Support;

  auto val = [&candles](size_t idx) {
    return is_support ? candles[idx].low : candles[idx].high;
  };

  std::vector<Swing> swings;
  size_t n = candles.size();
  if (n < 2 * lookback + 1)
    return swings;

  for (size_t i = lookback; i + lookback < n; i++) {
    double cur = val(i);
    bool is_swing = true;
    for (size_t j = i - lookback; j <= i + lookback && is_swing; j++)
      is_swing = is_support ? cur <= val(j) : cur >= val(j);

    if (is_swing)
      swings.push_back({i, cur});
  }
  return swings;
}

inline double volatility(const std::vector<Candle>& candles) {
  std::vector<double> closes;
  closes.reserve(candles.size());
  for (auto& c : candles)
    closes.push_back(c.price());

  auto r = returns(closes);
  return stdev(r.begin(), r.end());
}

inline Strength level_strength(size_t touches,
                               minutes timeframe,
                               double price,
                               double current_price,
                               const SupportResistanceConfig& cfg) {
  int score = touches >= 5 ? 4 : touches >= 3 ? 3 : touches >= 2 ? 2 : 1;
  score += timeframe_weight(timeframe);

  auto distance = std::abs(price - current_price) / current_price;
  if (distance < cfg.near_distance)
    score += 2;
  else if (distance < cfg.mid_distance)
    score += 1;

  if (score >= 8)
    return Strength::Major;
  if (score >= 6)
    return Strength::Strong;
  if (score >= 4)
    return Strength::Medium;
  return Strength::Weak;
}

constexpr double strength_bonus(Strength s) {
  switch (s) {
    case Strength::Major:
      return 20;
    case Strength::Strong:
      return 15;
    case Strength::Medium:
      return 10;
    case Strength::Weak:
      return 0;
  }
  return 0;
}

constexpr double timeframe_bonus(minutes timeframe) {
  if (timeframe == D_1)
    return 15;
  if (timeframe == H_4)
    return 10;
  if (timeframe == H_1)
    return 5;
  return 0;
}

inline double level_confidence(size_t touches,
                               Strength strength,
                               minutes timeframe,
                               double vol,
                               const SupportResistanceConfig& cfg) {
  double conf = cfg.base_conf + touches * cfg.touch_conf;
  conf += strength_bonus(strength);
  conf += timeframe_bonus(timeframe);

  if (vol < cfg.low_volatility)
    conf += 10;
  else if (vol > cfg.high_volatility)
    conf -= 10;

  return std::round(clamp(conf, 0, 100));
}

// inactive once a recent close went through the level by more than the buffer
inline bool is_active(double price,
                      double current_price,
                      const std::vector<Candle>& candles,
                      const SupportResistanceConfig& cfg) {
  auto n = std::min(cfg.active_lookback, candles.size());
  for (size_t i = candles.size() - n; i < candles.size(); i++) {
    auto close = candles[i].price();
    if (price < current_price && close < price * (1 - cfg.break_buffer))
      return false;
    if (price > current_price && close > price * (1 + cfg.break_buffer))
      return false;
  }
  return true;
}

inline std::string describe(const Level& level) {
  return std::format("{} {} {} at {:.5f}, touched {} times",
                     to_str(level.timeframe), to_str(level.strength),
                     to_str(level.type), level.range.center,
                     level.touch_count);
}

template <SR sr>
inline Level to_level(const std::vector<Candle>& candles,
                      Swing swing,
                      minutes timeframe,
                      double current_price,
                      double vol,
                      const SupportResistanceConfig& cfg) {
  constexpr bool is_support = sr == SR::Support;

  Level level;
  level.type = sr;
  level.timeframe = timeframe;

  auto price = swing.price;
  auto range = price * vol * cfg.range_vol_mult;
  level.range = {price - range, price + range, price};

  level.last_touch = candles[swing.idx].time();
  for (auto& c : candles) {
    auto extreme = is_support ? c.low : c.high;
    if (extreme < price - range || extreme > price + range)
      continue;
    level.touch_count++;
    level.last_touch = std::max(level.last_touch, c.time());
  }

  level.strength = level_strength(level.touch_count, timeframe, price,
                                  current_price, cfg);
  level.confidence = level_confidence(level.touch_count, level.strength,
                                      timeframe, vol, cfg);
  level.distance = std::abs(price - current_price) / current_price * 100;
  level.is_active = is_active(price, current_price, candles, cfg);
  level.description = describe(level);
  return level;
}

template <SR sr>
inline std::vector<Level> swing_levels(const std::vector<Candle>& candles,
                                       minutes timeframe,
                                       double current_price,
                                       double vol,
                                       const SupportResistanceConfig& cfg) {
  constexpr bool is_support = sr == SR::Support;

  std::vector<Level> levels;
  for (auto swing : find_swings<sr>(candles, cfg.swing_lookback)) {
    // no same-side levels
    bool valid = is_support
                     ? swing.price < current_price * (1 - cfg.side_margin)
                     : swing.price > current_price * (1 + cfg.side_margin);
    if (!valid)
      continue;
    levels.push_back(
        to_level<sr>(candles, swing, timeframe, current_price, vol, cfg));
  }
  return levels;
}

inline Level volume_level(SR type,
                          double price,
                          const Candle& candle,
                          minutes timeframe,
                          double current_price,
                          const SupportResistanceConfig& cfg) {
  auto range = price * cfg.volume_range;

  Level level;
  level.type = type;
  level.range = {price - range, price + range, price};
  level.strength = Strength::Medium;
  level.confidence = cfg.volume_conf;
  level.touch_count = 1;
  level.last_touch = candle.time();
  level.distance = std::abs(price - current_price) / current_price * 100;
  level.timeframe = timeframe;
  level.is_active = true;
  level.description =
      std::format("{} volume anomaly {} at {:.5f}", to_str(timeframe),
                  to_str(type), price);
  return level;
}

inline std::vector<Level> volume_levels(const std::vector<Candle>& candles,
                                        minutes timeframe,
                                        double current_price,
                                        const SupportResistanceConfig& cfg) {
  std::vector<Level> levels;
  if (candles.empty())
    return levels;

  double avg = 0.0;
  for (auto& c : candles)
    avg += c.volume;
  avg /= candles.size();

  for (auto& c : candles) {
    if (c.volume <= avg * cfg.volume_mult)
      continue;

    if (c.high > current_price * (1 + cfg.volume_side_margin))
      levels.push_back(volume_level(SR::Resistance, c.high, c, timeframe,
                                    current_price, cfg));

    if (c.low < current_price * (1 - cfg.volume_side_margin))
      levels.push_back(
          volume_level(SR::Support, c.low, c, timeframe, current_price, cfg));
  }
  return levels;
}

std::vector<Level> find_levels(const std::vector<Candle>& candles,
                               minutes timeframe,
                               double current_price,
                               const SupportResistanceConfig& cfg) {
  std::vector<Level> levels;
  if (candles.empty())
    return levels;

  auto vol = volatility(candles);

  auto resistances = swing_levels<SR::Resistance>(candles, timeframe,
                                                  current_price, vol, cfg);
  auto supports =
      swing_levels<SR::Support>(candles, timeframe, current_price, vol, cfg);
  auto by_volume = volume_levels(candles, timeframe, current_price, cfg);

  levels.insert(levels.end(), resistances.begin(), resistances.end());
  levels.insert(levels.end(), supports.begin(), supports.end());
  levels.insert(levels.end(), by_volume.begin(), by_volume.end());

  spdlog::debug("[sr] {} levels: {} resistances, {} supports, {} by volume",
                to_str(timeframe), resistances.size(), supports.size(),
                by_volume.size());
  return levels;
}

inline void merge_level(Level& existing,
                        const Level& next,
                        double current_price,
                        const SupportResistanceConfig& cfg) {
  double w1 = existing.weight();
  double w2 = next.weight();

  auto& range = existing.range;
  range.center = (range.center * w1 + next.range.center * w2) / (w1 + w2);
  range.min = std::min(range.min, next.range.min);
  range.max = std::max(range.max, next.range.max);

  existing.touch_count += next.touch_count;
  existing.confidence =
      std::min(existing.confidence + cfg.merge_conf_step, 100.0);
  existing.strength = std::max(existing.strength, next.strength);
  existing.last_touch = std::max(existing.last_touch, next.last_touch);
  existing.is_active = existing.is_active || next.is_active;
  existing.distance =
      std::abs(range.center - current_price) / current_price * 100;
  existing.description = describe(existing);
}

inline bool merge_pass(std::vector<Level>& levels,
                       double current_price,
                       const SupportResistanceConfig& cfg) {
  auto tolerance = current_price * cfg.merge_tolerance;

  std::vector<Level> merged;
  bool changed = false;

  for (auto& level : levels) {
    auto it = std::find_if(merged.begin(), merged.end(), [&](auto& existing) {
      return existing.type == level.type &&
             std::abs(existing.range.center - level.range.center) < tolerance;
    });

    if (it == merged.end()) {
      merged.push_back(std::move(level));
      continue;
    }

    merge_level(*it, level, current_price, cfg);
    changed = true;
  }

  levels = std::move(merged);
  return changed;
}

std::vector<Level> consolidate_levels(std::vector<Level> levels,
                                      double current_price,
                                      const SupportResistanceConfig& cfg) {
  // a merge moves the center, which can bring another level into range
  while (merge_pass(levels, current_price, cfg))
    ;

  std::erase_if(levels,
                [&cfg](auto& l) { return l.confidence < cfg.min_conf; });
  return levels;
}

KeyLevels key_levels(const std::vector<Level>& supports,
                     const std::vector<Level>& resistances,
                     double current_price) {
  KeyLevels res;

  for (auto& s : supports) {
    auto center = s.range.center;
    if (center < current_price &&
        (!res.nearest_support || center > res.nearest_support->range.center))
      res.nearest_support = s;
    if (!res.strongest_support || s.weight() > res.strongest_support->weight())
      res.strongest_support = s;
  }

  for (auto& r : resistances) {
    auto center = r.range.center;
    if (center > current_price &&
        (!res.nearest_resistance ||
         center < res.nearest_resistance->range.center))
      res.nearest_resistance = r;
    if (!res.strongest_resistance ||
        r.weight() > res.strongest_resistance->weight())
      res.strongest_resistance = r;
  }

  return res;
}

PricePosition price_position(const std::vector<Level>& supports,
                             const std::vector<Level>& resistances,
                             double current_price,
                             const SupportResistanceConfig& cfg) {
  PricePosition pos;

  auto inside = [current_price](auto& l) {
    return l.range.contains(current_price);
  };
  pos.in_support_zone = std::any_of(supports.begin(), supports.end(), inside);
  pos.in_resistance_zone =
      std::any_of(resistances.begin(), resistances.end(), inside);
  pos.between_levels = !pos.in_support_zone && !pos.in_resistance_zone;

  auto keys = key_levels(supports, resistances, current_price);
  auto approach = cfg.approach_distance / 100;

  auto& next_r = keys.nearest_resistance;
  auto& next_s = keys.nearest_support;

  if (next_r &&
      (next_r->range.center - current_price) / current_price < approach)
    pos.price_action = PriceAction::ApproachingResistance;
  else if (next_s &&
           (current_price - next_s->range.center) / current_price < approach)
    pos.price_action = PriceAction::ApproachingSupport;
  else
    pos.price_action = PriceAction::Consolidating;

  return pos;
}

inline TradingZone to_zone(const Level& level) {
  return {
      level.range.min,
      level.range.max,
      level.strength,
      std::format("{} {} {}", to_str(level.timeframe), to_str(level.strength),
                  to_str(level.type)),
  };
}

TradingZones trading_zones(const std::vector<Level>& supports,
                           const std::vector<Level>& resistances,
                           const SupportResistanceConfig& cfg) {
  auto tradable = [&cfg](auto& l) {
    return l.strength != Strength::Weak && l.confidence > cfg.zone_min_conf;
  };

  TradingZones zones;
  for (auto& s : supports)
    if (tradable(s))
      zones.buy.push_back(to_zone(s));
  for (auto& r : resistances)
    if (tradable(r))
      zones.sell.push_back(to_zone(r));
  return zones;
}

SupportResistance find_support_resistance(const TimeframeCandles& candles,
                                          const SupportResistanceConfig& cfg) {
  SupportResistance res;

  auto finest = std::find_if(candles.begin(), candles.end(),
                             [](auto& kv) { return !kv.second.empty(); });
  if (finest == candles.end()) {
    spdlog::warn("[sr] no candles to find levels in");
    return res;
  }

  res.current_price = finest->second.back().price();
  res.timestamp = finest->second.back().close_time;

  std::vector<Level> all;
  for (auto it = candles.rbegin(); it != candles.rend(); it++) {
    auto& [timeframe, series] = *it;
    auto levels = find_levels(series, timeframe, res.current_price, cfg);
    all.insert(all.end(), levels.begin(), levels.end());
  }

  for (auto& level : consolidate_levels(std::move(all), res.current_price, cfg))
    (level.type == SR::Support ? res.supports : res.resistances)
        .push_back(std::move(level));

  // strongest ties go to the earliest level in consolidation order
  res.key_levels = key_levels(res.supports, res.resistances, res.current_price);

  std::stable_sort(res.supports.begin(), res.supports.end(),
                   [](auto& l, auto& r) {
                     return l.range.center > r.range.center;
                   });
  std::stable_sort(res.resistances.begin(), res.resistances.end(),
                   [](auto& l, auto& r) {
                     return l.range.center < r.range.center;
                   });

  res.position =
      price_position(res.supports, res.resistances, res.current_price, cfg);
  res.zones = trading_zones(res.supports, res.resistances, cfg);

  spdlog::debug("[sr] {} supports, {} resistances around {:.5f}",
                res.supports.size(), res.resistances.size(),
                res.current_price);
  return res;
}
