#pragma once

#include "ind/candle.h"
#include "util/config.h"
#include "util/times.h"

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// inclusive bounds on the open time, ms since the epoch
struct TimeRange {
  Timestamp start = 0;
  Timestamp end = 0;
};

class CandleProvider {
 public:
  virtual ~CandleProvider() = default;

  // Latest `limit` candles, within `range` when given. Ascending by open
  // time without duplicates, empty on failure.
  virtual std::vector<Candle> candles(
      const std::string& symbol,
      minutes timeframe,
      size_t limit,
      const std::optional<TimeRange>& range = std::nullopt) = 0;
};

// Binance spot REST klines.
class Binance : public CandleProvider {
  const APIConfig cfg;

  std::atomic<bool> connected = false;
  std::atomic<int> n_reconnects = 0;
  std::atomic<int> n_failed_reconnects = 0;  // since the last good connect
  std::mutex conn_mtx;

  std::mutex mtx;
  std::deque<TimePoint> call_timestamps;  // to enforce max_calls_min

  void throttle();
  bool ensure_connected(const std::string& symbol);

 public:
  explicit Binance(const APIConfig& cfg);
  ~Binance() override;

  bool connect();
  bool reconnect();
  void close();

  bool is_connected() const { return connected; }
  int reconnects() const { return n_reconnects; }

  std::vector<Candle> candles(
      const std::string& symbol,
      minutes timeframe,
      size_t limit,
      const std::optional<TimeRange>& range = std::nullopt) override;
};

// Reads <dir>/<SYMBOL>_<tf>.json, a json array of candles.
class CandleFiles : public CandleProvider {
  const std::string dir;

 public:
  explicit CandleFiles(std::string dir) : dir{std::move(dir)} {}

  std::string path(const std::string& symbol, minutes timeframe) const;

  std::vector<Candle> candles(
      const std::string& symbol,
      minutes timeframe,
      size_t limit,
      const std::optional<TimeRange>& range = std::nullopt) override;
};
