#pragma once

#include "ind/support_resistance.h"
#include "sig/trend.h"

#include <string>

enum class MarketCondition { Bullish, Bearish, Neutral, Volatile };

enum class Opportunity { Excellent, Good, Fair, Poor };

enum class Horizon { ShortTerm, MediumTerm, LongTerm };

struct Assessment {
  MarketCondition market_condition = MarketCondition::Neutral;
  Risk risk = Risk::Medium;
  Opportunity opportunity = Opportunity::Fair;
  Horizon horizon = Horizon::MediumTerm;
  std::string recommendation = "";
};

Assessment assess(const MultiTimeframeTrend& trend,
                  const SupportResistance& levels);
