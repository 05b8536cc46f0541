#include "sig/assessment.h"
#include "util/format.h"

inline MarketCondition market_condition(const MultiTimeframeTrend& trend) {
  auto dir = trend_direction(trend.overall_trend);
  if (dir > 0)
    return MarketCondition::Bullish;
  if (dir < 0)
    return MarketCondition::Bearish;
  if (trend.overall_confidence < 50)
    return MarketCondition::Volatile;
  return MarketCondition::Neutral;
}

inline Risk risk(const MultiTimeframeTrend& trend, const PricePosition& pos) {
  if (pos.in_support_zone || pos.in_resistance_zone)
    return Risk::High;

  auto& align = trend.alignment;
  if (align.is_aligned && trend.overall_confidence > 80)
    return Risk::Low;
  if (align.alignment_score < 50 || trend.overall_confidence < 40)
    return Risk::High;
  return Risk::Medium;
}

inline Opportunity opportunity(MarketCondition cond,
                               Risk risk,
                               const KeyLevels& key) {
  bool directional =
      cond == MarketCondition::Bullish || cond == MarketCondition::Bearish;

  if (risk == Risk::Low && cond == MarketCondition::Bullish &&
      key.nearest_support)
    return Opportunity::Excellent;
  if (risk == Risk::Low && cond == MarketCondition::Bearish &&
      key.nearest_resistance)
    return Opportunity::Excellent;
  if (directional && risk == Risk::Medium)
    return Opportunity::Good;
  if (risk == Risk::High || cond == MarketCondition::Volatile)
    return Opportunity::Poor;
  return Opportunity::Fair;
}

inline Horizon horizon(const MultiTimeframeTrend& trend) {
  auto aligned = trend.alignment.is_aligned;
  if (aligned && is_strong(trend.overall_trend))
    return Horizon::LongTerm;
  if (trend.overall_confidence < 60 || !aligned)
    return Horizon::ShortTerm;
  return Horizon::MediumTerm;
}

inline std::string recommendation(const Assessment& a,
                                  const SupportResistance& levels) {
  std::string res;
  switch (a.market_condition) {
    case MarketCondition::Bullish:
      res = "timeframes point to an uptrend";
      break;
    case MarketCondition::Bearish:
      res = "timeframes point to a downtrend";
      break;
    case MarketCondition::Volatile:
      res = "volatile market without a clear trend";
      break;
    case MarketCondition::Neutral:
      res = "market is ranging";
      break;
  }

  auto& key = levels.key_levels;
  if (key.nearest_support && key.nearest_resistance)
    res += std::format(", trading between support {:.2f} and resistance {:.2f}",
                       key.nearest_support->range.center,
                       key.nearest_resistance->range.center);

  auto& pos = levels.position;
  if (pos.in_support_zone)
    res += ", inside a support zone, watch for a bounce";
  else if (pos.in_resistance_zone)
    res += ", inside a resistance zone, avoid chasing";
  else if (pos.price_action == PriceAction::ApproachingSupport)
    res += ", approaching support";
  else if (pos.price_action == PriceAction::ApproachingResistance)
    res += ", approaching resistance, consider reducing exposure";

  if (a.risk == Risk::Low && a.opportunity == Opportunity::Excellent)
    res += ". Low risk with an excellent setup";
  else if (a.risk == Risk::Medium && a.opportunity == Opportunity::Good)
    res += ". Moderate risk with a good setup";
  else if (a.risk == Risk::High || a.opportunity == Opportunity::Poor)
    res += ". Risk is high, better to wait";

  switch (a.horizon) {
    case Horizon::LongTerm:
      res += ", suited to long term positions";
      break;
    case Horizon::MediumTerm:
      res += ", suited to medium term trades";
      break;
    case Horizon::ShortTerm:
      res += ", short term only, monitor closely";
      break;
  }
  return res;
}

Assessment assess(const MultiTimeframeTrend& trend,
                  const SupportResistance& levels) {
  Assessment a;
  a.market_condition = market_condition(trend);
  a.risk = risk(trend, levels.position);
  a.opportunity = opportunity(a.market_condition, a.risk, levels.key_levels);
  a.horizon = horizon(trend);
  a.recommendation = recommendation(a, levels);
  return a;
}
