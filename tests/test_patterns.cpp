#include "helpers.h"
#include "sig/patterns.h"

#include <catch2/catch.hpp>

#include <stdexcept>

TEST_CASE("box between a floor and a ceiling", "[patterns]") {
  auto candles = box_candles();
  auto levels = find_pattern_levels(candles);

  auto boxes = box_patterns(candles, levels, {});
  REQUIRE(boxes.size() == 1);

  auto& box = boxes[0];
  CHECK(box.kind == PatternKind::Box);
  CHECK(box.signal == Signal::Neutral);
  CHECK(box.confidence == Approx(95));
  CHECK(box.start == 5 * HOUR_MS);
  CHECK(box.end == 50 * HOUR_MS);
  REQUIRE(box.key_levels.support.has_value());
  CHECK(*box.key_levels.support == Approx(100));
  CHECK(*box.key_levels.resistance == Approx(110));
  CHECK(box.severity() == Severity::Low);

  SECTION("height outside the configured bounds") {
    PatternConfig cfg;
    cfg.box_max_height = 0.05;
    CHECK(box_patterns(candles, levels, cfg).empty());
  }

  SECTION("too short") {
    auto few = box_candles(30);
    CHECK(box_patterns(few, levels, {}).empty());
  }
}

TEST_CASE("breakouts through pattern levels", "[patterns]") {
  auto candles = box_candles();

  SECTION("above resistance on volume") {
    candles.push_back(next_candle(candles, 109.5, 111, 109.5, 110.5, 400));
    auto levels = find_pattern_levels(candles);

    auto res = breakout_patterns(candles, levels, {});
    REQUIRE(res.size() == 1);
    CHECK(res[0].kind == PatternKind::Breakout);
    CHECK(res[0].signal == Signal::Buy);
    CHECK(res[0].confidence == Approx(95));
    CHECK(*res[0].key_levels.breakout == Approx(110));
    CHECK(res[0].end == candles.back().time());
  }

  SECTION("below support without volume") {
    candles.push_back(next_candle(candles, 100.5, 100.5, 99, 99.5, 100));
    auto levels = find_pattern_levels(candles);

    auto res = breakout_patterns(candles, levels, {});
    REQUIRE(res.size() == 1);
    CHECK(res[0].signal == Signal::Sell);
    // 50 + 6 * 5 + 0.5% * 1000
    CHECK(res[0].confidence == Approx(85));
  }

  SECTION("inside the range") {
    auto levels = find_pattern_levels(candles);
    CHECK(breakout_patterns(candles, levels, {}).empty());
  }
}

TEST_CASE("trend runs", "[patterns]") {
  SECTION("rising") {
    auto res = trend_patterns(make_candles(geometric(30, 100, 0.01)), {}, {});
    REQUIRE(res.size() == 1);
    CHECK(res[0].kind == PatternKind::Uptrend);
    CHECK(res[0].signal == Signal::Buy);
    CHECK(res[0].confidence == Approx(100));
  }

  SECTION("falling") {
    auto res = trend_patterns(make_candles(geometric(30, 100, -0.01)), {}, {});
    REQUIRE(res.size() == 1);
    CHECK(res[0].kind == PatternKind::Downtrend);
    CHECK(res[0].signal == Signal::Sell);
  }

  SECTION("choppy") {
    CHECK(trend_patterns(box_candles(), {}, {}).empty());
  }

  SECTION("flat") {
    CHECK(trend_patterns(make_candles(constant(30, 10)), {}, {}).empty());
  }

  SECTION("short") {
    CHECK(trend_patterns(make_candles(geometric(10, 100, 0.01)), {}, {})
              .empty());
  }
}

std::vector<Pattern> throwing_detector(const std::vector<Candle>&,
                                       const std::vector<PatternLevel>&,
                                       const PatternConfig&) {
  throw std::runtime_error("bad input");
}

TEST_CASE("recognize_all_patterns", "[patterns]") {
  auto candles = box_candles();
  auto levels = find_pattern_levels(candles);

  SECTION("default detectors") {
    Failures failures;
    auto res = recognize_all_patterns(candles, levels, {}, failures);
    REQUIRE(res.size() == 1);
    CHECK(res[0].kind == PatternKind::Box);
    CHECK(failures.empty());
  }

  SECTION("a failing detector is isolated") {
    const PatternDetector detectors[] = {
        {"broken", throwing_detector},
        {"box", box_patterns},
    };

    Failures failures;
    auto res =
        recognize_all_patterns(candles, levels, {}, failures, detectors);

    CHECK(res.size() == 1);
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].part == "pattern.broken");
    CHECK(failures[0].what == "bad input");
  }

  SECTION("reversal detectors are disabled by default") {
    const PatternDetector detectors[] = {
        {"broken", throwing_detector, true},
    };

    Failures failures;
    auto res =
        recognize_all_patterns(candles, levels, {}, failures, detectors);
    CHECK(res.empty());
    CHECK(failures.empty());

    PatternConfig cfg;
    cfg.reversal_en = true;
    recognize_all_patterns(candles, levels, cfg, failures, detectors);
    CHECK(failures.size() == 1);
  }

  SECTION("sorted by confidence") {
    // a weak breakout below the box floor, detected before the box
    candles.push_back(next_candle(candles, 100.5, 100.5, 99, 99.5, 100));
    levels = find_pattern_levels(candles);
    const PatternDetector detectors[] = {
        {"breakout", breakout_patterns},
        {"box", box_patterns},
    };

    Failures failures;
    auto res =
        recognize_all_patterns(candles, levels, {}, failures, detectors);
    REQUIRE(res.size() >= 2);
    for (size_t i = 1; i < res.size(); i++)
      CHECK(res[i - 1].confidence >= res[i].confidence);
    CHECK(res[0].kind == PatternKind::Box);
    CHECK(res.back().kind == PatternKind::Breakout);
  }
}
