#include "util/format.h"
#include "core/alerts.h"
#include "ind/support_resistance.h"
#include "sig/assessment.h"
#include "sig/patterns.h"
#include "sig/signal_types.h"
#include "sig/trend.h"
#include "util/times.h"

#include <string>

template <>
std::string to_str(const int& v) {
  return std::to_string(v);
}

template <>
std::string to_str(const size_t& v) {
  return std::to_string(v);
}

template <>
std::string to_str(const double& v) {
  return std::format("{:.2f}", v);
}

template <>
std::string to_str(const minutes& timeframe) {
  return timeframe_to_str(timeframe);
}

template <>
std::string to_str(const Candle& candle) {
  return std::format("{} {:.2f} {:.2f} {:.2f} {:.2f} {:.2f}",
                     timestamp_to_string(candle.time()), candle.open,
                     candle.high, candle.low, candle.close, candle.volume);
}

template <>
std::string to_str(const Signal& signal) {
  switch (signal) {
    case Signal::Buy:
      return "BUY";
    case Signal::Sell:
      return "SELL";
    case Signal::Neutral:
      return "NEUTRAL";
  }
  return "";
}

template <>
std::string to_str(const Severity& sev) {
  switch (sev) {
    case Severity::Urgent:
      return "urgent";
    case Severity::High:
      return "high";
    case Severity::Medium:
      return "medium";
    case Severity::Low:
      return "low";
  }
  return "";
}

template <>
std::string to_str(const SR& type) {
  return type == SR::Support ? "support" : "resistance";
}

template <>
std::string to_str(const Strength& strength) {
  switch (strength) {
    case Strength::Weak:
      return "weak";
    case Strength::Medium:
      return "medium";
    case Strength::Strong:
      return "strong";
    case Strength::Major:
      return "major";
  }
  return "";
}

template <>
std::string to_str(const PriceAction& action) {
  switch (action) {
    case PriceAction::ApproachingResistance:
      return "approaching resistance";
    case PriceAction::ApproachingSupport:
      return "approaching support";
    case PriceAction::Consolidating:
      return "consolidating";
  }
  return "";
}

template <>
std::string to_str(const Level& level) {
  return std::format("{} {:.2f} [{:.2f}, {:.2f}] {} {:.0f}%",
                     to_str(level.type), level.range.center, level.range.min,
                     level.range.max, to_str(level.strength),
                     level.confidence);
}

template <>
std::string to_str(const PatternKind& kind) {
  return Pattern{.kind = kind}.str();
}

template <>
std::string to_str(const Pattern& p) {
  return std::format("{} {} {:.0f}%", p.str(), to_str(p.signal),
                     p.confidence);
}

template <>
std::string to_str(const TrendState& trend) {
  switch (trend) {
    case TrendState::StrongUptrend:
      return "strong uptrend";
    case TrendState::Uptrend:
      return "uptrend";
    case TrendState::WeakUptrend:
      return "weak uptrend";
    case TrendState::Ranging:
      return "ranging";
    case TrendState::WeakDowntrend:
      return "weak downtrend";
    case TrendState::Downtrend:
      return "downtrend";
    case TrendState::StrongDowntrend:
      return "strong downtrend";
  }
  return "";
}

template <>
std::string to_str(const Action& action) {
  switch (action) {
    case Action::StrongBuy:
      return "strong buy";
    case Action::Buy:
      return "buy";
    case Action::Hold:
      return "hold";
    case Action::Sell:
      return "sell";
    case Action::StrongSell:
      return "strong sell";
    case Action::Wait:
      return "wait";
  }
  return "";
}

template <>
std::string to_str(const Risk& risk) {
  switch (risk) {
    case Risk::Low:
      return "low";
    case Risk::Medium:
      return "medium";
    case Risk::High:
      return "high";
  }
  return "";
}

template <>
std::string to_str(const MarketCondition& cond) {
  switch (cond) {
    case MarketCondition::Bullish:
      return "bullish";
    case MarketCondition::Bearish:
      return "bearish";
    case MarketCondition::Neutral:
      return "neutral";
    case MarketCondition::Volatile:
      return "volatile";
  }
  return "";
}

template <>
std::string to_str(const Opportunity& opportunity) {
  switch (opportunity) {
    case Opportunity::Excellent:
      return "excellent";
    case Opportunity::Good:
      return "good";
    case Opportunity::Fair:
      return "fair";
    case Opportunity::Poor:
      return "poor";
  }
  return "";
}

template <>
std::string to_str(const Horizon& horizon) {
  switch (horizon) {
    case Horizon::ShortTerm:
      return "short term";
    case Horizon::MediumTerm:
      return "medium term";
    case Horizon::LongTerm:
      return "long term";
  }
  return "";
}

template <>
std::string to_str(const Failure& failure) {
  return std::format("{}: {}", failure.part, failure.what);
}

inline std::string escape_markdown(const std::string& text) {
  std::string res;
  for (auto c : text) {
    if (c == '_' || c == '*' || c == '`' || c == '[')
      res += '\\';
    res += c;
  }
  return res;
}

template <>
std::string to_str<FormatTarget::Telegram>(const AlertPayload& alert) {
  auto res = std::format("*{}* ({})\n{}\n", escape_markdown(alert.title),
                         to_str(alert.severity), escape_markdown(alert.body));
  for (auto& [key, value] : alert.metadata)
    res += std::format("\n`{}`: {}", key, escape_markdown(value));
  return res;
}
