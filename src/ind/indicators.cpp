#include "ind/indicators.h"

#include <algorithm>
#include <cmath>

inline Series<double> to_closes(const std::vector<Candle>& candles) {
  Series<double> res;
  res.reserve(candles.size());
  for (auto& c : candles)
    res.push_back({c.time(), c.price()});
  return res;
}

Series<double> sma(const Series<double>& values, int period) {
  Series<double> res;
  if (period <= 0 || values.size() < size_t(period))
    return res;

  res.reserve(values.size() - period + 1);
  for (size_t i = period - 1; i < values.size(); i++) {
    double sum = 0.0;
    for (size_t j = i + 1 - period; j <= i; j++)
      sum += values[j].value;
    res.push_back({values[i].ts, sum / period});
  }
  return res;
}

Series<double> sma(const std::vector<Candle>& candles, int period) {
  return sma(to_closes(candles), period);
}

Series<double> ema(const Series<double>& values, int period) {
  Series<double> res;
  if (period <= 0 || values.size() < size_t(period))
    return res;

  res.reserve(values.size() - period + 1);

  double seed = 0.0;
  for (int i = 0; i < period; i++)
    seed += values[i].value;
  res.push_back({values[period - 1].ts, seed / period});

  auto alpha = 2.0 / (period + 1);
  for (size_t i = period; i < values.size(); i++) {
    auto prev = res.back().value;
    res.push_back({values[i].ts, values[i].value * alpha + prev * (1 - alpha)});
  }
  return res;
}

Series<double> ema(const std::vector<Candle>& candles, int period) {
  return ema(to_closes(candles), period);
}

Series<MACDValue> macd(const std::vector<Candle>& candles,
                       int fast,
                       int slow,
                       int signal) {
  Series<MACDValue> res;
  if (candles.size() < size_t(slow + signal))
    return res;

  auto fast_ema = ema(candles, fast);
  auto slow_ema = ema(candles, slow);

  // align on the shorter series, trimming the front of the longer one
  auto n = std::min(fast_ema.size(), slow_ema.size());
  auto fast_off = fast_ema.size() - n;
  auto slow_off = slow_ema.size() - n;

  Series<double> macd_line;
  macd_line.reserve(n);
  for (size_t i = 0; i < n; i++)
    macd_line.push_back({slow_ema[slow_off + i].ts,
                         fast_ema[fast_off + i].value -
                             slow_ema[slow_off + i].value});

  auto signal_line = ema(macd_line, signal);

  auto m = std::min(macd_line.size(), signal_line.size());
  auto macd_off = macd_line.size() - m;
  auto signal_off = signal_line.size() - m;

  res.reserve(m);
  for (size_t i = 0; i < m; i++) {
    auto& [ts, line] = macd_line[macd_off + i];
    auto sig = signal_line[signal_off + i].value;
    res.push_back({ts, {line, sig, line - sig}});
  }
  return res;
}

Series<double> rsi(const std::vector<Candle>& candles,
                   int period,
                   double loss_floor) {
  Series<double> res;
  if (period <= 0 || candles.size() < size_t(period + 1))
    return res;

  auto to_rsi = [loss_floor](double avg_gain, double avg_loss) {
    double rs = avg_gain / (avg_loss == 0.0 ? loss_floor : avg_loss);
    return 100.0 - (100.0 / (1.0 + rs));
  };

  auto change = [&candles](size_t i) {
    return candles[i].price() - candles[i - 1].price();
  };

  // initial gain/loss values
  double avg_gain = 0.0, avg_loss = 0.0;
  for (int i = 1; i <= period; i++) {
    auto c = change(i);
    avg_gain += c > 0 ? c : 0.0;
    avg_loss += c < 0 ? -c : 0.0;
  }
  avg_gain /= period;
  avg_loss /= period;

  res.reserve(candles.size() - period);
  res.push_back({candles[period].time(), to_rsi(avg_gain, avg_loss)});

  // wilder smoothing for the rest of the series
  for (size_t i = period + 1; i < candles.size(); i++) {
    auto c = change(i);
    double gain = c > 0 ? c : 0.0;
    double loss = c < 0 ? -c : 0.0;

    avg_gain = (avg_gain * (period - 1) + gain) / period;
    avg_loss = (avg_loss * (period - 1) + loss) / period;

    res.push_back({candles[i].time(), to_rsi(avg_gain, avg_loss)});
  }
  return res;
}

Series<BollingerValue> bollinger(const std::vector<Candle>& candles,
                                 int period,
                                 double std_dev) {
  Series<BollingerValue> res;
  if (period <= 0 || candles.size() < size_t(period))
    return res;

  res.reserve(candles.size() - period + 1);
  for (size_t i = period - 1; i < candles.size(); i++) {
    double middle = 0.0;
    for (size_t j = i + 1 - period; j <= i; j++)
      middle += candles[j].price();
    middle /= period;

    double var = 0.0;
    for (size_t j = i + 1 - period; j <= i; j++)
      var += std::pow(candles[j].price() - middle, 2);
    double sd = std::sqrt(var / period);

    res.push_back({candles[i].time(),
                   {middle + sd * std_dev, middle, middle - sd * std_dev}});
  }
  return res;
}

inline auto high_low(const std::vector<Candle>& candles, size_t i, int period) {
  double hh = candles[i].high, ll = candles[i].low;
  for (size_t j = i + 1 - period; j < i; j++) {
    hh = std::max(hh, candles[j].high);
    ll = std::min(ll, candles[j].low);
  }
  return std::pair{hh, ll};
}

Series<StochasticValue> stochastic(const std::vector<Candle>& candles,
                                   int k_period,
                                   int d_period) {
  Series<StochasticValue> res;
  if (k_period <= 0 || candles.size() < size_t(k_period))
    return res;

  Series<double> k_values;
  for (size_t i = k_period - 1; i < candles.size(); i++) {
    auto [hh, ll] = high_low(candles, i, k_period);
    // a flat window sits in the middle of its range
    double k = hh == ll ? 50.0 : (candles[i].price() - ll) / (hh - ll) * 100;
    k_values.push_back({candles[i].time(), k});
  }

  auto d_values = sma(k_values, d_period);
  auto off = k_values.size() - d_values.size();
  for (size_t i = 0; i < d_values.size(); i++)
    res.push_back({d_values[i].ts, {k_values[off + i].value, d_values[i].value}});
  return res;
}

Series<double> williams_r(const std::vector<Candle>& candles, int period) {
  Series<double> res;
  if (period <= 0 || candles.size() < size_t(period))
    return res;

  for (size_t i = period - 1; i < candles.size(); i++) {
    auto [hh, ll] = high_low(candles, i, period);
    double wr = hh == ll ? -50.0 : (hh - candles[i].price()) / (hh - ll) * -100;
    res.push_back({candles[i].time(), wr});
  }
  return res;
}

Series<double> momentum(const std::vector<Candle>& candles, int period) {
  Series<double> res;
  if (period <= 0 || candles.size() < size_t(period + 1))
    return res;

  for (size_t i = period; i < candles.size(); i++) {
    auto prev = candles[i - period].price();
    res.push_back({candles[i].time(), (candles[i].price() - prev) / prev * 100});
  }
  return res;
}

Indicators::Indicators(std::vector<Candle> c,
                       const IndicatorsConfig& cfg,
                       const std::vector<IndicatorKind>& kinds) noexcept
    : candles{std::move(c)}, cfg{cfg} {
  for (auto kind : kinds)
    compute(kind);
}

void Indicators::compute(IndicatorKind kind) noexcept {
  switch (kind) {
    case IndicatorKind::Sma20:
      _sma20 = ::sma(candles, cfg.sma_short);
      return;
    case IndicatorKind::Sma50:
      _sma50 = ::sma(candles, cfg.sma_long);
      return;
    case IndicatorKind::Ema12:
      _ema12 = ::ema(candles, cfg.ema_fast);
      return;
    case IndicatorKind::Ema26:
      _ema26 = ::ema(candles, cfg.ema_slow);
      return;
    case IndicatorKind::Macd:
      _macd = ::macd(candles, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal);
      return;
    case IndicatorKind::Rsi:
      _rsi = ::rsi(candles, cfg.rsi_period, cfg.rsi_loss_floor);
      return;
    case IndicatorKind::Bollinger:
      _bollinger = ::bollinger(candles, cfg.bb_period, cfg.bb_std_dev);
      return;
    case IndicatorKind::Stochastic:
      _stochastic = ::stochastic(candles, cfg.stoch_k, cfg.stoch_d);
      return;
    case IndicatorKind::Williams:
      _williams_r = ::williams_r(candles, cfg.williams_period);
      return;
    case IndicatorKind::Momentum:
      _momentum = ::momentum(candles, cfg.momentum_period);
      return;
  }
}

IndicatorSnapshot Indicators::snapshot() const {
  return {
      .sma20 = latest(_sma20),
      .sma50 = latest(_sma50),
      .ema12 = latest(_ema12),
      .ema26 = latest(_ema26),
      .macd = latest(_macd),
      .rsi = latest(_rsi),
      .bollinger = latest(_bollinger),
      .stochastic = latest(_stochastic),
      .williams_r = latest(_williams_r),
      .momentum = latest(_momentum),
  };
}
