#pragma once

#include "ind/indicators.h"
#include "sig/patterns.h"

#include <string>
#include <vector>

struct ComprehensiveScore {
  double trend = 0.0;       // -100..100
  double momentum = 0.0;    // -100..100
  double volatility = 0.0;  // 0..100
  Signal signal = Signal::Neutral;
  double confidence = 0.0;  // 0..100
};

struct SignalDecision {
  Signal signal = Signal::Neutral;
  double confidence = 0.0;
};

// Signal from the mean of the trend and momentum scores, before the
// pattern confidence adjustment.
SignalDecision derive_signal(double trend,
                             double momentum,
                             const ScoreConfig& cfg = {});

ComprehensiveScore comprehensive_score(const Indicators& ind,
                                       const std::vector<Pattern>& patterns,
                                       const ScoreConfig& cfg = {});

std::string summarize(const ComprehensiveScore& score,
                      const std::vector<Pattern>& patterns,
                      const std::vector<PatternLevel>& levels,
                      const ScoreConfig& cfg = {});
