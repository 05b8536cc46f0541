#include "sig/patterns.h"

#include <spdlog/spdlog.h>

// Reversal shapes have no detection rules yet. The detectors stay in the
// table so enabling them is a configuration change.

std::vector<Pattern> double_top_bottom_patterns(
    const std::vector<Candle>& candles,
    const std::vector<PatternLevel>&,
    const PatternConfig&) {
  spdlog::debug("[pattern] double top/bottom not detected over {} candles",
                candles.size());
  return {};
}

std::vector<Pattern> head_and_shoulders_patterns(
    const std::vector<Candle>& candles,
    const std::vector<PatternLevel>&,
    const PatternConfig&) {
  spdlog::debug("[pattern] head and shoulders not detected over {} candles",
                candles.size());
  return {};
}
