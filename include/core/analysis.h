#pragma once

#include "ind/indicators.h"
#include "ind/support_resistance.h"
#include "sig/assessment.h"
#include "sig/patterns.h"
#include "sig/score.h"
#include "sig/trend.h"
#include "util/config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Both throw std::invalid_argument on malformed input.
void validate_symbol(std::string_view symbol);
minutes validate_timeframe(std::string_view label);

struct ComprehensiveAnalysis {
  std::string symbol;
  minutes timeframe = H_1;
  Timestamp timestamp = 0;
  size_t candle_count = 0;

  IndicatorSnapshot indicators;
  std::vector<Pattern> patterns;
  std::vector<PatternLevel> pattern_levels;
  std::optional<ComprehensiveScore> score;
  std::string summary = "";

  Failures failures;
};

struct TechnicalAnalysis {
  std::string symbol;
  Timestamp timestamp = 0;

  MultiTimeframeTrend trend;
  SupportResistance levels;
  Assessment assessment;
};

ComprehensiveAnalysis perform_comprehensive_analysis(
    std::string_view symbol,
    minutes timeframe,
    const std::vector<Candle>& candles,
    const Config& config = {});

MultiTimeframeTrend analyze_multi_timeframe_trend(
    std::string_view symbol,
    const TimeframeCandles& candles,
    const Config& config = {});

SupportResistance analyze_support_resistance(std::string_view symbol,
                                             const TimeframeCandles& candles,
                                             const Config& config = {});

TechnicalAnalysis perform_technical_analysis(std::string_view symbol,
                                             const TimeframeCandles& candles,
                                             const Config& config = {});
