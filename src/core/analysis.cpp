#include "core/analysis.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>
#include <stdexcept>

void validate_symbol(std::string_view symbol) {
  static const std::regex pattern{"[A-Z0-9]+([/-][A-Z0-9]+)?"};

  std::string s{symbol};
  if (s.size() < 2 || s.size() > 20 || !std::regex_match(s, pattern))
    throw std::invalid_argument(std::format("invalid symbol '{}'", s));
}

minutes validate_timeframe(std::string_view label) {
  auto timeframe = parse_timeframe(label);
  if (!timeframe)
    throw std::invalid_argument(
        std::format("invalid timeframe '{}', expected one of {}", label,
                    join(std::begin(timeframes), std::end(timeframes))));
  return *timeframe;
}

inline void validate_timeframes(const TimeframeCandles& candles) {
  for (auto& [timeframe, _] : candles)
    if (std::find(std::begin(timeframes), std::end(timeframes), timeframe) ==
        std::end(timeframes))
      throw std::invalid_argument(
          std::format("unsupported timeframe {}", to_str(timeframe)));
}

ComprehensiveAnalysis perform_comprehensive_analysis(
    std::string_view symbol,
    minutes timeframe,
    const std::vector<Candle>& candles,
    const Config& config) {
  validate_symbol(symbol);
  validate_timeframe(timeframe_to_str(timeframe));

  ComprehensiveAnalysis res;
  res.symbol = symbol;
  res.timeframe = timeframe;
  res.candle_count = candles.size();
  if (!candles.empty())
    res.timestamp = candles.back().close_time;

  auto& score_cfg = config.score_config;
  if (candles.size() < score_cfg.min_candles) {
    spdlog::warn("[score] {} {}: {} candles, need {}", symbol,
                 to_str(timeframe), candles.size(), score_cfg.min_candles);
    res.failures.push_back(
        {"score", std::format("insufficient data: {} candles, need {}",
                              candles.size(), score_cfg.min_candles)});
    return res;
  }

  Indicators ind{candles, config.ind_config};
  res.indicators = ind.snapshot();

  res.pattern_levels = find_pattern_levels(candles, config.sr_config);
  res.patterns = recognize_all_patterns(candles, res.pattern_levels,
                                        config.pattern_config, res.failures);

  auto score = comprehensive_score(ind, res.patterns, score_cfg);
  res.summary =
      summarize(score, res.patterns, res.pattern_levels, score_cfg);
  res.score = score;

  spdlog::debug("[score] {} {}: {} ({:.0f})", symbol, to_str(timeframe),
                to_str(score.signal), score.confidence);
  return res;
}

MultiTimeframeTrend analyze_multi_timeframe_trend(
    std::string_view symbol,
    const TimeframeCandles& candles,
    const Config& config) {
  validate_symbol(symbol);
  validate_timeframes(candles);

  auto res = find_multi_timeframe_trend(candles, config.trend_config);
  res.symbol = symbol;
  return res;
}

SupportResistance analyze_support_resistance(std::string_view symbol,
                                             const TimeframeCandles& candles,
                                             const Config& config) {
  validate_symbol(symbol);
  validate_timeframes(candles);

  auto res = find_support_resistance(candles, config.sr_config);
  res.symbol = symbol;

  for (auto& [timeframe, series] : candles)
    if (series.empty())
      res.failures.push_back(
          {std::format("levels.{}", to_str(timeframe)), "no candles"});
  return res;
}

TechnicalAnalysis perform_technical_analysis(std::string_view symbol,
                                             const TimeframeCandles& candles,
                                             const Config& config) {
  TechnicalAnalysis res;
  res.symbol = symbol;
  res.trend = analyze_multi_timeframe_trend(symbol, candles, config);
  res.levels = analyze_support_resistance(symbol, candles, config);
  res.assessment = assess(res.trend, res.levels);
  res.timestamp = res.trend.timestamp ? res.trend.timestamp : res.levels.timestamp;

  spdlog::debug("[analysis] {}: {}", symbol,
                to_str(res.assessment.market_condition));
  return res;
}
