#include "core/market_data.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <thread>

using nlohmann::json;

inline constexpr size_t MAX_LIMIT = 1000;

Binance::Binance(const APIConfig& cfg) : cfg{cfg} {}

Binance::~Binance() {
  close();
}

bool Binance::connect() {
  auto r = cpr::Get(cpr::Url{cfg.binance_url + "/api/v3/ping"},
                    cpr::Timeout{cfg.timeout_ms});

  if (r.status_code != 200) {
    spdlog::error("[binance] connect failed {}: {}", r.status_code,
                  r.error.message);
    connected = false;
    return false;
  }

  connected = true;
  n_failed_reconnects = 0;
  spdlog::info("[binance] connected to {}", cfg.binance_url);
  return true;
}

bool Binance::reconnect() {
  close();
  n_reconnects++;
  spdlog::info("[binance] reconnecting, attempt {}", n_reconnects.load());
  if (!connect()) {
    n_failed_reconnects++;
    return false;
  }
  return true;
}

// At most one reconnect per call, and none once max_reconnects attempts in a
// row have failed.
bool Binance::ensure_connected(const std::string& symbol) {
  if (connected)
    return true;

  std::lock_guard lk{conn_mtx};
  if (connected)
    return true;

  if (n_failed_reconnects >= cfg.max_reconnects) {
    spdlog::error("[binance] ({}) not connected, {} reconnects failed", symbol,
                  n_failed_reconnects.load());
    return false;
  }
  if (!reconnect()) {
    spdlog::error("[binance] ({}) not connected", symbol);
    return false;
  }
  return true;
}

void Binance::close() {
  if (connected.exchange(false))
    spdlog::debug("[binance] closed");
}

void Binance::throttle() {
  std::unique_lock lk{mtx};

  while (true) {
    auto now = Clock::now();
    while (!call_timestamps.empty() &&
           now - call_timestamps.front() >= minutes{1})
      call_timestamps.pop_front();

    if (call_timestamps.size() < cfg.max_calls_min)
      break;

    auto wait = call_timestamps.front() + minutes{1} - now;
    lk.unlock();
    std::this_thread::sleep_for(wait);
    lk.lock();
  }

  call_timestamps.push_back(Clock::now());
}

// BTC/USDT and BTC-USDT are BTCUSDT on the exchange
inline std::string exchange_symbol(std::string symbol) {
  std::erase_if(symbol, [](char c) { return c == '/' || c == '-'; });
  return symbol;
}

inline double to_double(const json& v) {
  return v.is_string() ? std::stod(v.get<std::string>()) : v.get<double>();
}

std::vector<Candle> Binance::candles(const std::string& symbol,
                                     minutes timeframe,
                                     size_t limit,
                                     const std::optional<TimeRange>& range) {
  if (!ensure_connected(symbol))
    return {};

  throttle();

  cpr::Parameters params{{"symbol", exchange_symbol(symbol)},
                         {"interval", timeframe_to_str(timeframe)},
                         {"limit", std::to_string(std::min(limit, MAX_LIMIT))}};
  if (range) {
    params.Add({"startTime", std::to_string(range->start)});
    params.Add({"endTime", std::to_string(range->end)});
  }
  auto r = cpr::Get(cpr::Url{cfg.binance_url + "/api/v3/klines"}, params,
                    cpr::Timeout{cfg.timeout_ms});

  if (r.status_code == 0) {
    spdlog::error("[binance] ({}) connection lost: {}", symbol,
                  r.error.message);
    connected = false;
    return {};
  }

  if (r.status_code != 200) {
    spdlog::error("[binance] ({} {}) klines http error {}: {}", symbol,
                  timeframe_to_str(timeframe), r.status_code, r.text);
    return {};
  }

  auto js = json::parse(r.text, nullptr, false);
  if (js.is_discarded() || !js.is_array()) {
    spdlog::error("[binance] ({}) klines json error: {}", symbol,
                  r.text.substr(0, 80));
    return {};
  }

  std::vector<Candle> candles;
  candles.reserve(js.size());

  try {
    for (auto& k : js) {
      candles.push_back({
          .open_time = k.at(0).get<Timestamp>(),
          .close_time = k.at(6).get<Timestamp>(),
          .open = to_double(k.at(1)),
          .high = to_double(k.at(2)),
          .low = to_double(k.at(3)),
          .close = to_double(k.at(4)),
          .volume = to_double(k.at(5)),
          .quote_volume = to_double(k.at(7)),
          .trade_count = k.at(8).get<int64_t>(),
      });
    }
  } catch (const json::exception& e) {
    spdlog::error("[binance] ({}) malformed kline: {}", symbol, e.what());
    return {};
  } catch (const std::logic_error& e) {
    spdlog::error("[binance] ({}) malformed price: {}", symbol, e.what());
    return {};
  }

  spdlog::debug("[binance] ({} {}) {} candles", symbol,
                timeframe_to_str(timeframe), candles.size());
  return candles;
}
