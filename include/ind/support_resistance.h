#pragma once

#include "ind/candle.h"
#include "sig/signal_types.h"
#include "util/config.h"
#include "util/times.h"

#include <optional>
#include <string>
#include <vector>

enum class SR {
  Support,
  Resistance,
};

enum class Strength { Weak = 1, Medium = 2, Strong = 3, Major = 4 };

constexpr int strength_weight(Strength s) {
  return static_cast<int>(s);
}

struct PriceRange {
  double min = 0.0;
  double max = 0.0;
  double center = 0.0;

  bool contains(double price) const { return price >= min && price <= max; }
  bool operator==(const PriceRange&) const = default;
};

struct Level {
  SR type = SR::Support;
  PriceRange range;
  Strength strength = Strength::Weak;
  double confidence = 0.0;
  size_t touch_count = 0;
  Timestamp last_touch = 0;
  double distance = 0.0;  // percent from the current price
  minutes timeframe = M_15;
  bool is_active = true;
  std::string description = "";

  int weight() const {
    return timeframe_weight(timeframe) * strength_weight(strength);
  }
  bool operator==(const Level&) const = default;
};

struct KeyLevels {
  std::optional<Level> nearest_support;
  std::optional<Level> nearest_resistance;
  std::optional<Level> strongest_support;
  std::optional<Level> strongest_resistance;
};

enum class PriceAction {
  ApproachingResistance,
  ApproachingSupport,
  Consolidating,
};

struct PricePosition {
  bool between_levels = true;
  bool in_support_zone = false;
  bool in_resistance_zone = false;
  PriceAction price_action = PriceAction::Consolidating;
};

struct TradingZone {
  double min = 0.0;
  double max = 0.0;
  Strength strength = Strength::Weak;
  std::string reason = "";
};

struct TradingZones {
  std::vector<TradingZone> buy;
  std::vector<TradingZone> sell;
};

struct SupportResistance {
  std::string symbol;
  double current_price = 0.0;
  Timestamp timestamp = 0;

  KeyLevels key_levels;
  std::vector<Level> supports;     // descending by center
  std::vector<Level> resistances;  // ascending by center
  PricePosition position;
  TradingZones zones;

  Failures failures;
};

// swing and volume anomaly levels of one timeframe, not consolidated
std::vector<Level> find_levels(const std::vector<Candle>& candles,
                               minutes timeframe,
                               double current_price,
                               const SupportResistanceConfig& cfg = {});

std::vector<Level> consolidate_levels(std::vector<Level> levels,
                                      double current_price,
                                      const SupportResistanceConfig& cfg = {});

// Strongest ties go to the earlier level in the given order.
KeyLevels key_levels(const std::vector<Level>& supports,
                     const std::vector<Level>& resistances,
                     double current_price);

PricePosition price_position(const std::vector<Level>& supports,
                             const std::vector<Level>& resistances,
                             double current_price,
                             const SupportResistanceConfig& cfg = {});

TradingZones trading_zones(const std::vector<Level>& supports,
                           const std::vector<Level>& resistances,
                           const SupportResistanceConfig& cfg = {});

// Levels of every timeframe present in `candles`, coarsest first. The
// current price is the latest close of the finest timeframe.
SupportResistance find_support_resistance(
    const TimeframeCandles& candles,
    const SupportResistanceConfig& cfg = {});

struct PatternLevel {
  double price = 0.0;
  int strength = 1;  // 1 to 10
  SR type = SR::Support;
  size_t touch_count = 0;
  Timestamp first_touch = 0;
  Timestamp last_touch = 0;
};

// touch based levels of a single series, strongest first
std::vector<PatternLevel> find_pattern_levels(
    const std::vector<Candle>& candles,
    const SupportResistanceConfig& cfg = {});
