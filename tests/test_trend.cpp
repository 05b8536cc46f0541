#include "helpers.h"
#include "sig/trend.h"

#include <catch2/catch.hpp>

inline TimeframeTrend make_trend(minutes timeframe,
                                 TrendState trend,
                                 double confidence = 60) {
  TimeframeTrend t;
  t.timeframe = timeframe;
  t.trend = trend;
  t.confidence = confidence;
  return t;
}

TEST_CASE("trend state ordering", "[trend]") {
  CHECK(trend_score(TrendState::StrongUptrend) == 3);
  CHECK(trend_score(TrendState::Ranging) == 0);
  CHECK(trend_score(TrendState::StrongDowntrend) == -3);
  CHECK(trend_direction(TrendState::WeakUptrend) == 1);
  CHECK(trend_direction(TrendState::WeakDowntrend) == -1);
  CHECK(trend_direction(TrendState::Ranging) == 0);
  CHECK(is_strong(TrendState::StrongDowntrend));
  CHECK_FALSE(is_strong(TrendState::Uptrend));
}

TEST_CASE("single timeframe classification", "[trend]") {
  SECTION("steady rise is a strong uptrend") {
    auto candles = make_candles(geometric(300, 100, 0.01));
    auto t = timeframe_trend(candles, H_1);

    REQUIRE(t.has_value());
    CHECK(t->trend == TrendState::StrongUptrend);
    CHECK(t->timeframe == H_1);
    CHECK(t->current_price == Approx(candles.back().close));
    CHECK(t->ema20 > t->ema60);
    CHECK(t->ema60 > t->ema120);
    CHECK(t->trend_strength == Approx(100));
    CHECK(t->confidence == Approx(95));
    CHECK(t->confidence >= 0);
    CHECK(t->confidence <= 100);
    CHECK_FALSE(t->analysis.empty());
  }

  SECTION("linear rise is an uptrend") {
    std::vector<double> closes;
    for (int i = 0; i < 300; i++)
      closes.push_back(100 + i);

    auto t = timeframe_trend(make_candles(closes), H_4);
    REQUIRE(t.has_value());
    CHECK(t->trend == TrendState::Uptrend);
  }

  SECTION("steady fall is a strong downtrend") {
    auto t = timeframe_trend(make_candles(geometric(300, 100, -0.01)), D_1);
    REQUIRE(t.has_value());
    CHECK(t->trend == TrendState::StrongDowntrend);
  }

  SECTION("too few candles for the slow ema") {
    auto t = timeframe_trend(make_candles(geometric(100, 100, 0.01)), H_1);
    CHECK_FALSE(t.has_value());
  }
}

TEST_CASE("aggregation of timeframe trends", "[trend]") {
  SECTION("no timeframes") {
    auto res = aggregate_trends({});
    CHECK(res.timeframes.empty());
    CHECK(res.suggestion.action == Action::Wait);
    CHECK(res.suggestion.risk == Risk::High);
  }

  SECTION("all timeframes rising") {
    std::vector<TimeframeTrend> trends;
    for (auto timeframe : timeframes)
      trends.push_back(make_trend(timeframe, TrendState::StrongUptrend, 90));

    auto res = aggregate_trends(trends);
    CHECK(res.overall_trend == TrendState::StrongUptrend);
    CHECK(res.alignment.is_aligned);
    CHECK(res.alignment.alignment_score == Approx(100));
    CHECK(res.alignment.conflicting_timeframes.empty());
    CHECK(res.overall_confidence == Approx(100));
    CHECK(res.suggestion.action == Action::StrongBuy);
    CHECK(res.suggestion.risk == Risk::Low);

    REQUIRE(res.timeframes.size() == 4);
    CHECK(res.timeframes.front().timeframe == M_15);
    CHECK(res.timeframes.back().timeframe == D_1);
    CHECK(res.find(H_4) != nullptr);
  }

  SECTION("weighted toward the higher timeframes") {
    auto res = aggregate_trends({
        make_trend(D_1, TrendState::Uptrend),
        make_trend(H_4, TrendState::Uptrend),
        make_trend(H_1, TrendState::Ranging),
        make_trend(M_15, TrendState::Downtrend),
    });

    // (2 * 4 + 2 * 3 + 0 - 2 * 1) / 10
    CHECK(res.overall_trend == TrendState::WeakUptrend);
    CHECK_FALSE(res.alignment.is_aligned);
    CHECK(res.alignment.alignment_score == Approx(50));
    REQUIRE(res.alignment.conflicting_timeframes.size() == 1);
    CHECK(res.alignment.conflicting_timeframes[0] == M_15);
    CHECK(res.overall_confidence == Approx(60 + 50 * 0.2));
    CHECK(res.suggestion.action == Action::Hold);
    CHECK(res.suggestion.risk == Risk::Medium);
  }

  SECTION("conflicting timeframes wait") {
    auto res = aggregate_trends({
        make_trend(D_1, TrendState::Uptrend),
        make_trend(H_4, TrendState::Ranging),
        make_trend(H_1, TrendState::Downtrend),
    });

    CHECK(res.alignment.alignment_score == Approx(100.0 / 3));
    CHECK(res.suggestion.action == Action::Wait);
    CHECK(res.suggestion.risk == Risk::High);
  }

  SECTION("aligned range holds") {
    auto res = aggregate_trends({
        make_trend(H_4, TrendState::Ranging),
        make_trend(H_1, TrendState::Ranging),
    });
    CHECK(res.overall_trend == TrendState::Ranging);
    CHECK_FALSE(res.alignment.is_aligned);
    CHECK(res.alignment.alignment_score == Approx(100));
    CHECK(res.suggestion.action == Action::Hold);
  }

  SECTION("thresholds") {
    // 3 * 4 + 1 * 1 over 5
    auto strong = aggregate_trends({
        make_trend(D_1, TrendState::StrongUptrend),
        make_trend(M_15, TrendState::WeakUptrend),
    });
    CHECK(strong.overall_trend == TrendState::StrongUptrend);

    // -(2 * 2 + 1 * 1) / 3
    auto down = aggregate_trends({
        make_trend(H_1, TrendState::Downtrend),
        make_trend(M_15, TrendState::WeakDowntrend),
    });
    CHECK(down.overall_trend == TrendState::Downtrend);
    CHECK(down.suggestion.action == Action::Sell);
  }
}

TEST_CASE("multi timeframe trend over candles", "[trend]") {
  SECTION("rising everywhere") {
    auto candles = make_candles(geometric(300, 100, 0.01));
    auto res = find_multi_timeframe_trend(every_timeframe(candles));

    CHECK(res.timeframes.size() == 4);
    CHECK(res.failures.empty());
    CHECK(res.overall_trend == TrendState::StrongUptrend);
    CHECK(res.alignment.is_aligned);
    CHECK(res.suggestion.action == Action::StrongBuy);
    CHECK(res.timestamp == candles.back().close_time);
  }

  SECTION("a short timeframe is reported and skipped") {
    auto candles = make_candles(geometric(300, 100, 0.01));
    TimeframeCandles input = {
        {M_15, make_candles(geometric(50, 100, 0.01))},
        {H_1, candles},
    };

    auto res = find_multi_timeframe_trend(input);
    REQUIRE(res.timeframes.size() == 1);
    CHECK(res.timeframes[0].timeframe == H_1);
    REQUIRE(res.failures.size() == 1);
    CHECK(res.failures[0].part == "trend.15m");
    CHECK(res.timestamp == candles.back().close_time);
  }
}
