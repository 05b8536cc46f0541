#include "core/analyzer.h"
#include "mt/thread_pool.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

TimeframeCandles Analyzer::fetch(const std::string& symbol,
                                 size_t limit,
                                 Failures& failures) {
  TimeframeCandles candles;
  std::vector<minutes> missing;
  std::mutex mtx;

  Timer timer;
  {
    thread_pool<minutes> pool{
        config.n_concurrency,
        [&](minutes timeframe) {
          auto series = provider.candles(symbol, timeframe, limit);

          std::lock_guard lk{mtx};
          if (series.empty()) {
            missing.push_back(timeframe);
            return;
          }
          candles[timeframe] = std::move(series);
        },
        {std::begin(timeframes), std::end(timeframes)},
    };
  }

  // coarsest first, like timeframes[], whatever order the workers finished in
  std::sort(missing.begin(), missing.end(), std::greater<>{});
  for (auto timeframe : missing)
    failures.push_back(
        {std::format("fetch.{}", to_str(timeframe)), "no candles"});

  spdlog::debug("[analyzer] {} fetched {} timeframes in {:.0f}ms", symbol,
                candles.size(), timer.diff_ms());
  return candles;
}

inline void append(Failures& to, const Failures& from) {
  to.insert(to.end(), from.begin(), from.end());
}

ComprehensiveAnalysis Analyzer::comprehensive(const std::string& symbol,
                                              minutes timeframe) {
  validate_symbol(symbol);
  validate_timeframe(timeframe_to_str(timeframe));

  auto candles =
      provider.candles(symbol, timeframe, config.score_config.n_candles);
  auto res = perform_comprehensive_analysis(symbol, timeframe, candles, config);
  if (candles.empty())
    res.failures.push_back(
        {std::format("fetch.{}", to_str(timeframe)), "no candles"});
  return res;
}

MultiTimeframeTrend Analyzer::trend(const std::string& symbol) {
  validate_symbol(symbol);

  Failures failures;
  auto candles = fetch(symbol, config.trend_config.n_candles, failures);
  auto res = analyze_multi_timeframe_trend(symbol, candles, config);
  append(res.failures, failures);
  return res;
}

SupportResistance Analyzer::levels(const std::string& symbol) {
  validate_symbol(symbol);

  Failures failures;
  auto candles = fetch(symbol, config.sr_config.n_candles, failures);
  auto res = analyze_support_resistance(symbol, candles, config);
  append(res.failures, failures);
  return res;
}

TechnicalAnalysis Analyzer::technical(const std::string& symbol) {
  validate_symbol(symbol);

  Failures failures;
  auto limit =
      std::max(config.trend_config.n_candles, config.sr_config.n_candles);
  auto candles = fetch(symbol, limit, failures);

  auto res = perform_technical_analysis(symbol, candles, config);
  append(res.trend.failures, failures);
  append(res.levels.failures, failures);
  return res;
}

std::vector<ComprehensiveAnalysis> Analyzer::watchlist(
    const std::vector<std::string>& symbols,
    minutes timeframe) {
  std::vector<std::optional<ComprehensiveAnalysis>> slots(symbols.size());

  std::vector<size_t> idxs(symbols.size());
  for (size_t i = 0; i < idxs.size(); i++)
    idxs[i] = i;

  {
    thread_pool<size_t> pool{
        config.n_concurrency,
        [&](size_t i) {
          try {
            slots[i] = comprehensive(symbols[i], timeframe);
          } catch (const std::invalid_argument& e) {
            spdlog::error("[analyzer] watchlist: {}", e.what());
          }
        },
        std::move(idxs),
    };
  }

  std::vector<ComprehensiveAnalysis> res;
  for (auto& slot : slots)
    if (slot)
      res.push_back(std::move(*slot));
  return res;
}
