#include "helpers.h"
#include "ind/indicators.h"

#include <catch2/catch.hpp>

TEST_CASE("indicators return empty series on short input", "[indicators]") {
  auto candles = make_candles(geometric(10, 100, 0.01));

  REQUIRE(sma(candles, 20).empty());
  REQUIRE(ema(candles, 20).empty());
  REQUIRE(macd(candles).empty());
  REQUIRE(rsi(candles, 14).empty());
  REQUIRE(bollinger(candles, 20).empty());
  REQUIRE(stochastic(candles, 14).empty());
  REQUIRE(williams_r(candles, 14).empty());
  REQUIRE(momentum(candles, 10).empty());
  REQUIRE(sma(std::vector<Candle>{}, 1).empty());
}

TEST_CASE("sma averages a sliding window", "[indicators]") {
  auto res = sma(make_candles({1, 2, 3, 4, 5}), 3);

  REQUIRE(res.size() == 3);
  CHECK(res[0].value == Approx(2));
  CHECK(res[1].value == Approx(3));
  CHECK(res[2].value == Approx(4));
  CHECK(res.back().ts == 4 * HOUR_MS);
}

TEST_CASE("ema of a constant series is the constant", "[indicators]") {
  auto res = ema(make_candles(constant(40, 50)), 12);

  REQUIRE(res.size() == 29);
  for (auto& [_, v] : res)
    CHECK(v == Approx(50));
}

TEST_CASE("macd is aligned on the slow ema", "[indicators]") {
  auto candles = make_candles(geometric(100, 100, 0.01));
  auto res = macd(candles, 12, 26, 9);

  REQUIRE(res.size() == 100 - 26 - 9 + 2);
  CHECK(res.back().ts == candles.back().time());

  for (auto& [_, v] : res)
    CHECK(v.histogram == Approx(v.macd - v.signal));

  // rising prices keep the fast ema above the slow one
  CHECK(res.back().value.macd > 0);
}

TEST_CASE("rsi stays within its range", "[indicators]") {
  SECTION("mixed moves") {
    std::vector<double> closes;
    for (int i = 0; i < 80; i++)
      closes.push_back(100 + (i % 7) * 1.5 - (i % 3) * 2.0);

    auto res = rsi(make_candles(closes), 14);
    REQUIRE(res.size() == 80 - 14);
    for (auto& [_, v] : res) {
      CHECK(v >= 0);
      CHECK(v <= 100);
    }
  }

  SECTION("only gains") {
    auto res = rsi(make_candles(geometric(30, 100, 0.01)), 14);
    REQUIRE_FALSE(res.empty());
    CHECK(res.back().value > 99);
  }

  SECTION("only losses") {
    auto res = rsi(make_candles(geometric(30, 100, -0.01)), 14);
    REQUIRE_FALSE(res.empty());
    CHECK(res.back().value == Approx(0).margin(1e-9));
  }
}

TEST_CASE("bollinger bands are ordered", "[indicators]") {
  std::vector<double> closes;
  for (int i = 0; i < 60; i++)
    closes.push_back(100 + (i % 5) - (i % 4));

  auto res = bollinger(make_candles(closes), 20, 2.0);
  REQUIRE(res.size() == 60 - 20 + 1);
  for (auto& [_, b] : res) {
    CHECK(b.upper >= b.middle);
    CHECK(b.middle >= b.lower);
  }

  auto flat = bollinger(make_candles(constant(25, 10)), 20, 2.0);
  REQUIRE_FALSE(flat.empty());
  CHECK(flat.back().value.upper == Approx(flat.back().value.lower));
}

TEST_CASE("oscillators handle flat windows", "[indicators]") {
  std::vector<Candle> candles;
  for (int i = 0; i < 20; i++)
    candles.push_back(next_candle(candles, 10, 10, 10, 10, 1));

  auto stoch = stochastic(candles, 14, 3);
  REQUIRE_FALSE(stoch.empty());
  CHECK(stoch.back().value.k == Approx(50));
  CHECK(stoch.back().value.d == Approx(50));

  auto wr = williams_r(candles, 14);
  REQUIRE_FALSE(wr.empty());
  CHECK(wr.back().value == Approx(-50));
}

TEST_CASE("stochastic and williams %R at the top of the range",
          "[indicators]") {
  auto candles = make_candles(geometric(30, 100, 0.01));
  auto last = candles.back();

  auto stoch = stochastic(candles, 14, 3);
  REQUIRE_FALSE(stoch.empty());
  auto hh = last.high;
  auto ll = candles[candles.size() - 14].low;
  CHECK(stoch.back().value.k ==
        Approx((last.close - ll) / (hh - ll) * 100));

  auto wr = williams_r(candles, 14);
  CHECK(wr.back().value <= 0);
  CHECK(wr.back().value >= -100);
}

TEST_CASE("momentum is the percent change over the period", "[indicators]") {
  auto res = momentum(make_candles({100, 105, 110}), 2);
  REQUIRE(res.size() == 1);
  CHECK(res[0].value == Approx(10));
}

TEST_CASE("Indicators computes the requested kinds", "[indicators]") {
  auto candles = make_candles(geometric(30, 100, 0.01));

  SECTION("all kinds") {
    Indicators ind{candles};
    auto snap = ind.snapshot();

    CHECK(snap.sma20.has_value());
    CHECK_FALSE(snap.sma50.has_value());  // 30 candles
    CHECK(snap.ema12.has_value());
    CHECK(snap.ema26.has_value());
    CHECK_FALSE(snap.macd.has_value());  // needs 35
    CHECK(snap.rsi.has_value());
    CHECK(snap.bollinger.has_value());
    CHECK(snap.stochastic.has_value());
    CHECK(snap.williams_r.has_value());
    CHECK(snap.momentum.has_value());

    CHECK(ind.size() == 30);
    CHECK(ind.price(-1) == candles.back().close);
    CHECK(ind.time(0) == candles.front().open_time);
  }

  SECTION("subset") {
    Indicators ind{candles, {}, {IndicatorKind::Rsi}};
    CHECK_FALSE(ind.rsi().empty());
    CHECK(ind.sma20().empty());
    CHECK(ind.bollinger().empty());

    ind.compute(IndicatorKind::Sma20);
    CHECK(ind.sma20().size() == 11);
  }

  SECTION("periods come from the config") {
    IndicatorsConfig cfg;
    cfg.sma_short = 5;
    Indicators ind{candles, cfg, {IndicatorKind::Sma20}};
    CHECK(ind.sma20().size() == 26);
  }
}
