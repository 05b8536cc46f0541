#include "sig/patterns.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <format>

std::vector<Pattern> recognize_all_patterns(
    const std::vector<Candle>& candles,
    const std::vector<PatternLevel>& levels,
    const PatternConfig& cfg,
    Failures& failures,
    std::span<const PatternDetector> detectors) {
  std::vector<Pattern> patterns;

  for (auto& detector : detectors) {
    if (detector.reversal && !cfg.reversal_en)
      continue;

    try {
      auto found = detector.detect(candles, levels, cfg);
      spdlog::debug("[pattern] {}: {} found", detector.name, found.size());
      patterns.insert(patterns.end(), found.begin(), found.end());
    } catch (const std::exception& ex) {
      spdlog::error("[pattern] {} failed: {}", detector.name, ex.what());
      failures.push_back({std::format("pattern.{}", detector.name), ex.what()});
    }
  }

  std::stable_sort(patterns.begin(), patterns.end(), [](auto& l, auto& r) {
    return l.confidence > r.confidence;
  });
  return patterns;
}
