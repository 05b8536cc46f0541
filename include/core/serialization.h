#pragma once

#include "core/analysis.h"

#include <string>
#include <vector>

// Pretty json, enums and timeframes written by label.
std::string to_json(const ComprehensiveAnalysis& analysis);
std::string to_json(const std::vector<ComprehensiveAnalysis>& analyses);
std::string to_json(const MultiTimeframeTrend& trend);
std::string to_json(const SupportResistance& levels);
std::string to_json(const TechnicalAnalysis& analysis);
