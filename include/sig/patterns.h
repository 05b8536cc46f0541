#pragma once

#include "ind/candle.h"
#include "ind/support_resistance.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <optional>
#include <span>
#include <string>
#include <vector>

enum class PatternKind {
  Box,
  Breakout,
  Uptrend,
  Downtrend,
  DoubleTop,
  DoubleBottom,
  HeadAndShoulders,
};

struct PatternKeyLevels {
  std::optional<double> support;
  std::optional<double> resistance;
  std::optional<double> breakout;
};

struct Pattern {
  PatternKind kind = PatternKind::Box;
  Signal signal = Signal::Neutral;
  double confidence = 0.0;
  Timestamp start = 0;
  Timestamp end = 0;
  std::string description = "";
  PatternKeyLevels key_levels;

  Severity severity() const;
  std::string str() const;
};

using pattern_f = std::vector<Pattern> (*)(const std::vector<Candle>&,
                                           const std::vector<PatternLevel>&,
                                           const PatternConfig&);

std::vector<Pattern> box_patterns(const std::vector<Candle>& candles,
                                  const std::vector<PatternLevel>& levels,
                                  const PatternConfig& cfg);
std::vector<Pattern> breakout_patterns(const std::vector<Candle>& candles,
                                       const std::vector<PatternLevel>& levels,
                                       const PatternConfig& cfg);
std::vector<Pattern> trend_patterns(const std::vector<Candle>& candles,
                                    const std::vector<PatternLevel>& levels,
                                    const PatternConfig& cfg);
std::vector<Pattern> double_top_bottom_patterns(
    const std::vector<Candle>& candles,
    const std::vector<PatternLevel>& levels,
    const PatternConfig& cfg);
std::vector<Pattern> head_and_shoulders_patterns(
    const std::vector<Candle>& candles,
    const std::vector<PatternLevel>& levels,
    const PatternConfig& cfg);

struct PatternDetector {
  const char* name;
  pattern_f detect;
  bool reversal = false;
};

inline constexpr PatternDetector pattern_detectors[] = {
    {"box", box_patterns},
    {"breakout", breakout_patterns},
    {"trend", trend_patterns},
    // reversal shapes, switched on by PatternConfig::reversal_en
    {"double_top_bottom", double_top_bottom_patterns, true},
    {"head_and_shoulders", head_and_shoulders_patterns, true},
};

// Runs every enabled detector. A throwing detector is logged, recorded in
// `failures` and skipped. Sorted by confidence, highest first.
std::vector<Pattern> recognize_all_patterns(
    const std::vector<Candle>& candles,
    const std::vector<PatternLevel>& levels,
    const PatternConfig& cfg,
    Failures& failures,
    std::span<const PatternDetector> detectors = pattern_detectors);
