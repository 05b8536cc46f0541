#pragma once

#include "core/analysis.h"
#include "core/market_data.h"
#include "util/config.h"

#include <string>
#include <vector>

// Fetches candles through a provider and feeds them to the analysis entry
// points. Timeframes and watchlist symbols are fetched concurrently.
class Analyzer {
  CandleProvider& provider;
  const Config& config;

 public:
  Analyzer(CandleProvider& provider, const Config& config)
      : provider{provider}, config{config} {}

  // every supported timeframe, missing ones recorded in `failures`
  TimeframeCandles fetch(const std::string& symbol,
                         size_t limit,
                         Failures& failures);

  ComprehensiveAnalysis comprehensive(const std::string& symbol,
                                      minutes timeframe);
  MultiTimeframeTrend trend(const std::string& symbol);
  SupportResistance levels(const std::string& symbol);
  TechnicalAnalysis technical(const std::string& symbol);

  // input order is kept, invalid symbols are skipped
  std::vector<ComprehensiveAnalysis> watchlist(
      const std::vector<std::string>& symbols,
      minutes timeframe);
};
