#pragma once

#include "ind/candle.h"
#include "util/config.h"

#include <iterator>
#include <optional>
#include <vector>

template <typename T>
struct Sample {
  Timestamp ts;
  T value;
};

template <typename T>
using Series = std::vector<Sample<T>>;

struct MACDValue {
  double macd = 0.0;
  double signal = 0.0;
  double histogram = 0.0;
};

struct BollingerValue {
  double upper = 0.0;
  double middle = 0.0;
  double lower = 0.0;

  double width() const { return (upper - lower) / middle; }
  // 0 at the lower band, 1 at the upper band
  double position(double price) const {
    return (price - lower) / (upper - lower);
  }
};

struct StochasticValue {
  double k = 0.0;
  double d = 0.0;
};

// Every function returns an empty series when the input is shorter than
// its minimum length.
Series<double> sma(const std::vector<Candle>& candles, int period);
Series<double> sma(const Series<double>& values, int period);

Series<double> ema(const std::vector<Candle>& candles, int period);
Series<double> ema(const Series<double>& values, int period);

Series<MACDValue> macd(const std::vector<Candle>& candles,
                       int fast = 12,
                       int slow = 26,
                       int signal = 9);

Series<double> rsi(const std::vector<Candle>& candles,
                   int period = 14,
                   double loss_floor = 0.0001);

Series<BollingerValue> bollinger(const std::vector<Candle>& candles,
                                 int period = 20,
                                 double std_dev = 2.0);

Series<StochasticValue> stochastic(const std::vector<Candle>& candles,
                                   int k_period = 14,
                                   int d_period = 3);

Series<double> williams_r(const std::vector<Candle>& candles, int period = 14);

Series<double> momentum(const std::vector<Candle>& candles, int period = 10);

template <typename T>
std::optional<T> latest(const Series<T>& series) {
  if (series.empty())
    return std::nullopt;
  return series.back().value;
}

template <typename T>
std::vector<T> values_of(const Series<T>& series) {
  std::vector<T> res;
  res.reserve(series.size());
  for (auto& s : series)
    res.push_back(s.value);
  return res;
}

enum class IndicatorKind {
  Sma20,
  Sma50,
  Ema12,
  Ema26,
  Macd,
  Rsi,
  Bollinger,
  Stochastic,
  Williams,
  Momentum,
};

inline constexpr IndicatorKind all_indicators[] = {
    IndicatorKind::Sma20,      IndicatorKind::Sma50,
    IndicatorKind::Ema12,      IndicatorKind::Ema26,
    IndicatorKind::Macd,       IndicatorKind::Rsi,
    IndicatorKind::Bollinger,  IndicatorKind::Stochastic,
    IndicatorKind::Williams,   IndicatorKind::Momentum,
};

// latest value of each computed indicator
struct IndicatorSnapshot {
  std::optional<double> sma20;
  std::optional<double> sma50;
  std::optional<double> ema12;
  std::optional<double> ema26;
  std::optional<MACDValue> macd;
  std::optional<double> rsi;
  std::optional<BollingerValue> bollinger;
  std::optional<StochasticValue> stochastic;
  std::optional<double> williams_r;
  std::optional<double> momentum;
};

struct Indicators {
 protected:
  std::vector<Candle> candles;
  IndicatorsConfig cfg;

  Series<double> _sma20, _sma50, _ema12, _ema26;
  Series<MACDValue> _macd;
  Series<double> _rsi;
  Series<BollingerValue> _bollinger;
  Series<StochasticValue> _stochastic;
  Series<double> _williams_r;
  Series<double> _momentum;

  size_t sanitize(int idx) const {
    return idx < 0 ? candles.size() + idx : idx;
  }

 public:
  Indicators(std::vector<Candle> c,
             const IndicatorsConfig& cfg = {},
             const std::vector<IndicatorKind>& kinds = {
                 std::begin(all_indicators),
                 std::end(all_indicators)}) noexcept;

  void compute(IndicatorKind kind) noexcept;

  auto size() const { return candles.size(); }

  Timestamp time(int idx) const { return candles[sanitize(idx)].time(); }
  double price(int idx) const { return candles[sanitize(idx)].price(); }

  auto& sma20() const { return _sma20; }
  auto& sma50() const { return _sma50; }
  auto& ema12() const { return _ema12; }
  auto& ema26() const { return _ema26; }
  auto& macd() const { return _macd; }
  auto& rsi() const { return _rsi; }
  auto& bollinger() const { return _bollinger; }
  auto& stochastic() const { return _stochastic; }
  auto& williams_r() const { return _williams_r; }
  auto& momentum() const { return _momentum; }

  IndicatorSnapshot snapshot() const;
};
