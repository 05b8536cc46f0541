#pragma once

#include "util/times.h"

#include <cstdint>
#include <map>
#include <vector>

struct Candle {
  Timestamp open_time = 0;
  Timestamp close_time = 0;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  double volume = 0.0;
  double quote_volume = 0.0;
  int64_t trade_count = 0;

  double price() const { return close; }
  Timestamp time() const { return open_time; }
};

// one ascending series per timeframe, finest first
using TimeframeCandles = std::map<minutes, std::vector<Candle>>;
