#include "core/alerts.h"
#include "util/format.h"

#include <algorithm>

inline Severity severity(const ComprehensiveAnalysis& analysis) {
  if (!analysis.score)
    return Severity::Low;

  auto sev = Severity::Low;
  for (auto& p : analysis.patterns)
    sev = std::max(sev, p.severity());

  auto& score = *analysis.score;
  if (score.signal != Signal::Neutral)
    sev = std::max(sev, score.confidence >= 70 ? Severity::High
                                               : Severity::Medium);
  return sev;
}

AlertPayload make_alert(const ComprehensiveAnalysis& analysis) {
  AlertPayload alert;
  alert.title = std::format("{} {}", analysis.symbol,
                            to_str(analysis.timeframe));
  alert.severity = severity(analysis);
  alert.body = analysis.summary;

  auto& meta = alert.metadata;
  meta["symbol"] = analysis.symbol;
  meta["timeframe"] = to_str(analysis.timeframe);
  meta["time"] = timestamp_to_string(analysis.timestamp);
  meta["candles"] = std::to_string(analysis.candle_count);

  if (analysis.score) {
    auto& score = *analysis.score;
    meta["signal"] = to_str(score.signal);
    meta["confidence"] = std::format("{:.0f}", score.confidence);
    meta["trend"] = std::format("{:.0f}", score.trend);
    meta["momentum"] = std::format("{:.0f}", score.momentum);
    meta["volatility"] = std::format("{:.0f}", score.volatility);
  }

  if (!analysis.patterns.empty()) {
    std::vector<std::string> names;
    for (auto& p : analysis.patterns)
      names.push_back(p.str());
    meta["patterns"] = join(names.begin(), names.end());
  }

  if (!analysis.failures.empty())
    meta["failures"] = std::to_string(analysis.failures.size());
  return alert;
}

AlertPayload make_alert(const TechnicalAnalysis& analysis) {
  auto& a = analysis.assessment;

  AlertPayload alert;
  alert.title = std::format("{} {}", analysis.symbol,
                            to_str(a.market_condition));
  alert.body = a.recommendation;

  switch (a.opportunity) {
    case Opportunity::Excellent:
      alert.severity = Severity::High;
      break;
    case Opportunity::Good:
      alert.severity = Severity::Medium;
      break;
    case Opportunity::Fair:
    case Opportunity::Poor:
      alert.severity = Severity::Low;
      break;
  }

  auto& meta = alert.metadata;
  meta["symbol"] = analysis.symbol;
  meta["time"] = timestamp_to_string(analysis.timestamp);
  meta["trend"] = to_str(analysis.trend.overall_trend);
  meta["action"] = to_str(analysis.trend.suggestion.action);
  meta["risk"] = to_str(a.risk);
  meta["opportunity"] = to_str(a.opportunity);
  meta["horizon"] = to_str(a.horizon);

  auto& key = analysis.levels.key_levels;
  if (key.nearest_support)
    meta["support"] = std::format("{:.2f}", key.nearest_support->range.center);
  if (key.nearest_resistance)
    meta["resistance"] =
        std::format("{:.2f}", key.nearest_resistance->range.center);
  return alert;
}
