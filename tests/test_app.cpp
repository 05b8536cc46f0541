#include "core/alerts.h"
#include "core/analyzer.h"
#include "core/market_data.h"
#include "core/serialization.h"
#include "helpers.h"
#include "mt/thread_pool.h"
#include "util/format.h"

#include <catch2/catch.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;

// serves the same series for every symbol, keeping the last `limit` candles
class FakeProvider : public CandleProvider {
  const TimeframeCandles data;

 public:
  std::atomic<int> n_calls = 0;

  explicit FakeProvider(TimeframeCandles data) : data{std::move(data)} {}

  std::vector<Candle> candles(
      const std::string&,
      minutes timeframe,
      size_t limit,
      const std::optional<TimeRange>& = std::nullopt) override {
    n_calls++;
    auto it = data.find(timeframe);
    if (it == data.end())
      return {};

    auto& series = it->second;
    auto n = std::min(limit, series.size());
    return {series.end() - n, series.end()};
  }
};

inline bool has_failure(const Failures& failures, const std::string& part) {
  return std::any_of(failures.begin(), failures.end(),
                     [&](auto& f) { return f.part == part; });
}

TEST_CASE("thread pool", "[app]") {
  std::atomic<int> sum = 0;

  SECTION("every value is processed") {
    std::vector<int> vals;
    for (int i = 1; i <= 100; i++)
      vals.push_back(i);

    {
      thread_pool<int> pool{4, [&](int v) { sum += v; }, vals};
    }
    CHECK(sum == 5050);
  }

  SECTION("empty queue") {
    thread_pool<int> pool{4, [&](int v) { sum += v; }, {}};
    pool.wait();
    CHECK(sum == 0);
  }
}

TEST_CASE("analyzer", "[app]") {
  auto rising = make_candles(geometric(300, 100, 0.01));

  Config config;
  config.n_concurrency = 4;

  SECTION("missing timeframes are failures") {
    FakeProvider provider{{{H_1, rising}, {D_1, rising}}};
    Analyzer analyzer{provider, config};

    auto trend = analyzer.trend("BTCUSDT");
    CHECK(provider.n_calls == 4);
    CHECK(trend.symbol == "BTCUSDT");
    CHECK(trend.timeframes.size() == 2);
    CHECK(trend.overall_trend == TrendState::StrongUptrend);
    CHECK(has_failure(trend.failures, "fetch.15m"));
    CHECK(has_failure(trend.failures, "fetch.4h"));
    CHECK_FALSE(has_failure(trend.failures, "fetch.1h"));
  }

  SECTION("fetch failures come out coarsest timeframe first") {
    FakeProvider provider{{{H_1, rising}}};
    Analyzer analyzer{provider, config};

    for (int run = 0; run < 10; run++) {
      Failures failures;
      auto candles = analyzer.fetch("BTCUSDT", 200, failures);
      CHECK(candles.size() == 1);
      REQUIRE(failures.size() == 3);
      CHECK(failures[0].part == "fetch.1d");
      CHECK(failures[1].part == "fetch.4h");
      CHECK(failures[2].part == "fetch.15m");
    }
  }

  SECTION("technical analysis carries fetch failures") {
    FakeProvider provider{{{H_1, rising}}};
    Analyzer analyzer{provider, config};

    auto res = analyzer.technical("BTC/USDT");
    CHECK(has_failure(res.trend.failures, "fetch.1d"));
    CHECK(has_failure(res.levels.failures, "fetch.1d"));
    CHECK(res.assessment.market_condition == MarketCondition::Bullish);
  }

  SECTION("comprehensive without candles") {
    FakeProvider provider{{{H_1, rising}}};
    Analyzer analyzer{provider, config};

    auto res = analyzer.comprehensive("BTCUSDT", M_15);
    CHECK_FALSE(res.score.has_value());
    CHECK(has_failure(res.failures, "score"));
    CHECK(has_failure(res.failures, "fetch.15m"));
  }

  SECTION("watchlist keeps order and skips invalid symbols") {
    FakeProvider provider{{{H_1, rising}}};
    Analyzer analyzer{provider, config};

    auto res = analyzer.watchlist({"BTCUSDT", "bad symbol", "ETH-USD"}, H_1);
    REQUIRE(res.size() == 2);
    CHECK(res[0].symbol == "BTCUSDT");
    CHECK(res[1].symbol == "ETH-USD");

    for (auto& analysis : res) {
      CHECK(analysis.candle_count == config.score_config.n_candles);
      REQUIRE(analysis.score.has_value());
      CHECK(analysis.score->signal == Signal::Buy);
    }
  }

  SECTION("invalid symbol") {
    FakeProvider provider{{{H_1, rising}}};
    Analyzer analyzer{provider, config};

    CHECK_THROWS_AS(analyzer.trend("btc"), std::invalid_argument);
    CHECK(provider.n_calls == 0);
  }
}

TEST_CASE("binance reconnects", "[app]") {
  APIConfig cfg;
  cfg.binance_url = "http://127.0.0.1:1";  // nothing listens here
  cfg.timeout_ms = 500;
  cfg.max_reconnects = 2;

  Binance binance{cfg};
  CHECK_FALSE(binance.connect());
  CHECK(binance.reconnects() == 0);

  SECTION("each request retries the connection once") {
    CHECK(binance.candles("BTCUSDT", H_1, 10).empty());
    CHECK(binance.reconnects() == 1);
    CHECK(binance.candles("BTCUSDT", H_1, 10).empty());
    CHECK(binance.reconnects() == 2);
    CHECK_FALSE(binance.is_connected());
  }

  SECTION("gives up after max_reconnects failures in a row") {
    for (int i = 0; i < 5; i++)
      CHECK(binance.candles("BTCUSDT", H_1, 10).empty());
    CHECK(binance.reconnects() == 2);
  }

  SECTION("an explicit reconnect is always attempted") {
    for (int i = 0; i < 3; i++)
      CHECK(binance.candles("BTCUSDT", H_1, 10).empty());
    CHECK_FALSE(binance.reconnect());
    CHECK(binance.reconnects() == 3);
  }
}

TEST_CASE("candle files", "[app]") {
  auto dir = fs::temp_directory_path() / "sigscope_candle_files";
  fs::create_directories(dir);

  CandleFiles files{dir.string()};
  CHECK(files.path("BTC/USDT", H_4) == (dir / "BTCUSDT_4h.json").string());

  {
    std::ofstream out{dir / "BTCUSDT_1h.json"};
    out << R"([
      {"open_time": 7200000, "close_time": 10799999, "open": 3, "high": 4,
       "low": 2, "close": 3.5, "volume": 10, "quote_volume": 35,
       "trade_count": 4},
      {"open_time": 0, "close_time": 3599999, "open": 1, "high": 2,
       "low": 0.5, "close": 1.5, "volume": 10, "quote_volume": 15,
       "trade_count": 2, "source": "export"},
      {"open_time": 3600000, "close_time": 7199999, "open": 2, "high": 3,
       "low": 1.5, "close": 2.5, "volume": 10, "quote_volume": 25,
       "trade_count": 3},
      {"open_time": 3600000, "close_time": 7199999, "open": 2, "high": 3,
       "low": 1.5, "close": 2.5, "volume": 10, "quote_volume": 25,
       "trade_count": 3}
    ])";
  }

  SECTION("sorted by open time without duplicates") {
    auto candles = files.candles("BTCUSDT", H_1, 10);
    REQUIRE(candles.size() == 3);
    CHECK(candles[0].open_time == 0);
    CHECK(candles[1].open_time == 3600000);
    CHECK(candles[2].open_time == 7200000);
    CHECK(candles[2].close == Approx(3.5));
    CHECK(candles[2].trade_count == 4);
  }

  SECTION("latest candles within the limit") {
    auto candles = files.candles("BTC-USDT", H_1, 2);
    REQUIRE(candles.size() == 2);
    CHECK(candles[0].open_time == 3600000);
    CHECK(candles[1].open_time == 7200000);
  }

  SECTION("within a time range") {
    auto candles =
        files.candles("BTCUSDT", H_1, 10, TimeRange{0, 3600000});
    REQUIRE(candles.size() == 2);
    CHECK(candles[0].open_time == 0);
    CHECK(candles[1].open_time == 3600000);
  }

  SECTION("missing file") {
    CHECK(files.candles("ETHUSDT", H_1, 10).empty());
  }

  fs::remove_all(dir);
}

TEST_CASE("alerts", "[app]") {
  auto rising = make_candles(geometric(300, 100, 0.01));

  SECTION("comprehensive analysis") {
    std::vector<Candle> last{rising.end() - 100, rising.end()};
    auto analysis = perform_comprehensive_analysis("BTCUSDT", H_1, last);
    auto alert = make_alert(analysis);

    CHECK(alert.title == "BTCUSDT 1h");
    CHECK(alert.severity == Severity::High);
    CHECK(alert.body == analysis.summary);
    CHECK(alert.metadata.at("signal") == "BUY");
    CHECK(alert.metadata.at("confidence") == "84");
    CHECK(alert.metadata.at("candles") == "100");
    CHECK(alert.metadata.at("patterns").find("uptrend") != std::string::npos);
    CHECK_FALSE(alert.metadata.contains("failures"));
  }

  SECTION("without a score") {
    auto analysis = perform_comprehensive_analysis(
        "BTCUSDT", H_1, {rising.begin(), rising.begin() + 10});
    auto alert = make_alert(analysis);

    CHECK(alert.severity == Severity::Low);
    CHECK_FALSE(alert.metadata.contains("signal"));
    CHECK(alert.metadata.at("failures") == "1");
  }

  SECTION("technical analysis") {
    auto analysis =
        perform_technical_analysis("BTC/USDT", every_timeframe(rising));
    auto alert = make_alert(analysis);

    CHECK(alert.title == "BTC/USDT bullish");
    CHECK(alert.severity == Severity::Low);
    CHECK(alert.body == analysis.assessment.recommendation);
    CHECK(alert.metadata.at("trend") == "strong uptrend");
    CHECK_FALSE(alert.metadata.contains("support"));
  }
}

TEST_CASE("telegram rendering", "[app]") {
  AlertPayload alert{
      .title = "BTC_USDT 1h",
      .body = "breakout detected",
      .severity = Severity::High,
      .metadata = {{"signal", "BUY"}, {"confidence", "84"}},
  };

  CHECK(to_str<FormatTarget::Telegram>(alert) ==
        "*BTC\\_USDT 1h* (high)\nbreakout detected\n"
        "\n`confidence`: 84"
        "\n`signal`: BUY");
}

TEST_CASE("json output", "[app]") {
  auto candles = every_timeframe(make_candles(geometric(300, 100, 0.01)));
  auto first = to_json(perform_technical_analysis("BTCUSDT", candles));
  auto second = to_json(perform_technical_analysis("BTCUSDT", candles));

  CHECK_FALSE(first.empty());
  CHECK(first == second);
  CHECK(first.find("\"BTCUSDT\"") != std::string::npos);
  CHECK(first.find("\"1h\"") != std::string::npos);
}
