#include "core/serialization.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <glaze/glaze.hpp>

template <>
struct glz::meta<minutes> {
  static constexpr auto value = [](const auto& timeframe) {
    return timeframe_to_str(timeframe);
  };
};

template <>
struct glz::meta<Signal> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<Severity> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<SR> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<Strength> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<PriceAction> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<PatternKind> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<TrendState> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<Action> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<Risk> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<MarketCondition> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<Opportunity> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

template <>
struct glz::meta<Horizon> {
  static constexpr auto value = [](const auto& v) { return to_str(v); };
};

inline std::string write_json(const auto& t, const char* what) {
  constexpr auto opts = glz::opts{.prettify = true};

  std::string buffer;
  auto ec = glz::write<opts>(t, buffer);
  if (ec)
    spdlog::error("[json] error writing {}", what);
  return buffer;
}

std::string to_json(const ComprehensiveAnalysis& analysis) {
  return write_json(analysis, "comprehensive analysis");
}

std::string to_json(const std::vector<ComprehensiveAnalysis>& analyses) {
  return write_json(analyses, "watchlist");
}

std::string to_json(const MultiTimeframeTrend& trend) {
  return write_json(trend, "trend");
}

std::string to_json(const SupportResistance& levels) {
  return write_json(levels, "levels");
}

std::string to_json(const TechnicalAnalysis& analysis) {
  return write_json(analysis, "technical analysis");
}
