#include "sig/score.h"
#include "util/format.h"
#include "util/math.h"

#include <algorithm>
#include <cmath>

SignalDecision derive_signal(double trend,
                             double momentum,
                             const ScoreConfig& cfg) {
  auto combined = (trend + momentum) / 2;

  if (combined > cfg.signal_threshold)
    return {Signal::Buy, std::min(cfg.max_signal_conf, std::abs(combined))};
  if (combined < -cfg.signal_threshold)
    return {Signal::Sell, std::min(cfg.max_signal_conf, std::abs(combined))};
  return {Signal::Neutral, 50 + std::abs(combined)};
}

inline double trend_component(const Indicators& ind) {
  auto sma20 = latest(ind.sma20());
  auto sma50 = latest(ind.sma50());
  auto price = ind.price(-1);

  double trend = 0.0;
  if (sma20)
    trend += (price - *sma20) / *sma20 * 100 * 0.4;
  if (sma50)
    trend += (price - *sma50) / *sma50 * 100 * 0.3;
  if (sma20 && sma50)
    trend += (*sma20 - *sma50) / *sma50 * 100 * 0.3;
  return clamp(trend, -100, 100);
}

inline double momentum_component(const Indicators& ind, const ScoreConfig& cfg) {
  double momentum = 0.0;
  if (auto rsi = latest(ind.rsi()))
    momentum += (*rsi - 50) * 2;
  if (auto macd = latest(ind.macd()))
    momentum +=
        clamp(macd->histogram * cfg.hist_mult, -cfg.hist_cap, cfg.hist_cap);
  return clamp(momentum / 2, -100, 100);
}

ComprehensiveScore comprehensive_score(const Indicators& ind,
                                       const std::vector<Pattern>& patterns,
                                       const ScoreConfig& cfg) {
  auto trend = trend_component(ind);
  auto momentum = momentum_component(ind, cfg);
  double volatility = 0.0;

  auto bb = latest(ind.bollinger());
  if (bb && bb->upper > bb->lower) {
    volatility = std::min(bb->width() * cfg.width_mult, 100.0);

    auto pos = bb->position(ind.price(-1));
    if (pos > 1 - cfg.band_edge)
      momentum += cfg.band_bonus;
    if (pos < cfg.band_edge)
      momentum -= cfg.band_bonus;
  }

  double max_pattern_conf = 0.0;
  for (auto& p : patterns) {
    auto w = p.confidence / 100;
    if (p.signal == Signal::Buy) {
      trend += cfg.pattern_trend_weight * w;
      momentum += cfg.pattern_momentum_weight * w;
    } else if (p.signal == Signal::Sell) {
      trend -= cfg.pattern_trend_weight * w;
      momentum -= cfg.pattern_momentum_weight * w;
    }
    max_pattern_conf = std::max(max_pattern_conf, p.confidence);
  }

  ComprehensiveScore res;
  res.trend = std::round(clamp(trend, -100, 100));
  res.momentum = std::round(clamp(momentum, -100, 100));
  res.volatility = std::round(clamp(volatility, 0, 100));

  auto [signal, conf] = derive_signal(res.trend, res.momentum, cfg);
  res.signal = signal;
  res.confidence = std::round(clamp((conf + max_pattern_conf) / 2, 0, 100));
  return res;
}

std::string summarize(const ComprehensiveScore& score,
                      const std::vector<Pattern>& patterns,
                      const std::vector<PatternLevel>& levels,
                      const ScoreConfig& cfg) {
  std::vector<std::string> parts;

  if (score.trend > 30)
    parts.push_back("strong uptrend");
  else if (score.trend > 10)
    parts.push_back("weak uptrend");
  else if (score.trend < -30)
    parts.push_back("strong downtrend");
  else if (score.trend < -10)
    parts.push_back("weak downtrend");
  else
    parts.push_back("sideways");

  if (score.momentum > 20)
    parts.push_back("strong momentum");
  else if (score.momentum < -20)
    parts.push_back("weak momentum");
  else
    parts.push_back("neutral momentum");

  if (score.volatility > 60)
    parts.push_back("high volatility");
  else if (score.volatility < 30)
    parts.push_back("low volatility");
  else
    parts.push_back("moderate volatility");

  std::vector<std::string> names;
  for (auto& p : patterns)
    if (p.confidence > cfg.strong_pattern_conf)
      names.push_back(p.str());
  if (!names.empty())
    parts.push_back(std::format("{} detected",
                                join(names.begin(), names.end(), ", ")));

  auto strong = std::count_if(levels.begin(), levels.end(), [&](auto& l) {
    return l.strength >= cfg.strong_level_strength;
  });
  if (strong > 0)
    parts.push_back(std::format("{} key support/resistance levels", strong));

  parts.push_back(std::format("signal {} ({:.0f}% confidence)",
                              to_str(score.signal), score.confidence));

  return join(parts.begin(), parts.end(), "; ");
}
